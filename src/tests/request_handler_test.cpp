#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include "store/id_allocator.hpp"
#include "store/video_store.hpp"
#include "web/request_handler.hpp"
#include "web/url.hpp"
#include "test_utils.hpp"

using namespace lutube::web;
using namespace lutube::store;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

const std::string BOUNDARY = "xYzZy";

std::string upload_body(const std::string& title, const std::string& payload) {
  return "--" + BOUNDARY + "\r\n"
         "Content-Disposition: form-data; name=\"title\"\r\n\r\n" +
         title + "\r\n"
         "--" + BOUNDARY + "\r\n"
         "Content-Disposition: form-data; name=\"video-file\"; filename=\"v.mp4\"\r\n"
         "Content-Type: video/mp4\r\n\r\n" +
         payload + "\r\n"
         "--" + BOUNDARY + "--\r\n";
}

std::string location(const StringResponse& response) {
  return std::string(response[http::field::location]);
}

} // namespace

class RequestHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    boost::log::core::get()->set_filter(
      boost::log::trivial::severity >= boost::log::trivial::fatal
    );
    test_dir = make_test_dir("request_handler_test");
    store = std::make_unique<VideoStore>(test_dir);
    allocator = std::make_unique<IdAllocator>(test_dir);
    handler = std::make_unique<RequestHandler>(*store, *allocator);
  }

  void TearDown() override {
    handler.reset();
    std::filesystem::remove_all(test_dir);
  }

  StringResponse get_page(const std::string& target) {
    http::request<http::string_body> request{http::verb::get, target, 11};
    Response response = handler->handle(request);
    EXPECT_TRUE(std::holds_alternative<StringResponse>(response));
    return std::get<StringResponse>(std::move(response));
  }

  StringResponse post_upload(RequestHandler& target_handler, const std::string& body,
                             const std::string& content_type = "multipart/form-data; boundary=" + BOUNDARY) {
    std::filesystem::path body_file = test_dir / "upload.body";
    write_file(body_file, body);

    http::request<http::empty_body> request{http::verb::post, "/upload/", 11};
    request.set(http::field::content_type, content_type);
    StringResponse response = target_handler.handle_upload(request, body_file);
    std::filesystem::remove(body_file);
    return response;
  }

  std::string publish(const std::string& title, const std::string& payload) {
    std::string id = allocator->allocate();
    std::istringstream stream(payload);
    store->save(id, title, stream);
    return id;
  }

  std::filesystem::path test_dir;
  std::unique_ptr<VideoStore> store;
  std::unique_ptr<IdAllocator> allocator;
  std::unique_ptr<RequestHandler> handler;
};

TEST_F(RequestHandlerTest, HomeWithoutVideos) {
  StringResponse response = get_page("/");
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_THAT(std::string(response[http::field::content_type]), StartsWith("text/html"));
  EXPECT_THAT(response.body(), HasSubstr("No videos yet."));
  EXPECT_THAT(response.body(), HasSubstr("action=\"/upload/\""));
}

TEST_F(RequestHandlerTest, HomeListsPublishedVideos) {
  std::string first = publish("First", "1");
  std::string second = publish("Second & more", "2");
  allocator->allocate();  // reserved slot stays hidden

  StringResponse response = get_page("/");
  EXPECT_THAT(response.body(), HasSubstr("/watch/" + first));
  EXPECT_THAT(response.body(), HasSubstr("/watch/" + second));
  EXPECT_THAT(response.body(), HasSubstr("Second &amp; more"));
}

TEST_F(RequestHandlerTest, HomeShowsErrorBanner) {
  EXPECT_THAT(get_page("/?error=notfound&id=abc").body(), HasSubstr("ID abc not found."));
  EXPECT_THAT(get_page("/?error=misc&msg=disk%20full").body(), HasSubstr("Error: disk full"));
  EXPECT_THAT(get_page("/?error=fu").body(), HasSubstr("Upload failed."));
  EXPECT_THAT(get_page("/?error=unknown").body(), ::testing::Not(HasSubstr("class=\"error\"")));
}

TEST_F(RequestHandlerTest, WatchPublishedVideo) {
  std::string id = publish("My Trip", "payload");

  StringResponse response = get_page("/watch/" + id);
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_THAT(response.body(), HasSubstr("My Trip"));
  EXPECT_THAT(response.body(), HasSubstr("/videos/" + id + "/video.mp4"));
}

TEST_F(RequestHandlerTest, WatchUnknownRedirectsHome) {
  StringResponse response = get_page("/watch/nope");
  EXPECT_EQ(response.result(), http::status::see_other);
  EXPECT_EQ(location(response), "/?error=notfound&id=nope");

  std::string reserved = allocator->allocate();
  response = get_page("/watch/" + reserved);
  EXPECT_EQ(response.result(), http::status::see_other);
  EXPECT_EQ(location(response), "/?error=notfound&id=" + reserved);
}

TEST_F(RequestHandlerTest, PayloadIsServedAsMp4) {
  std::string payload = make_binary_payload(4096);
  std::string id = publish("clip", payload);

  http::request<http::string_body> request{http::verb::get, "/videos/" + id + "/video.mp4", 11};
  Response response = handler->handle(request);
  ASSERT_TRUE(std::holds_alternative<FileResponse>(response));

  FileResponse& file_response = std::get<FileResponse>(response);
  EXPECT_EQ(file_response.result(), http::status::ok);
  EXPECT_EQ(std::string(file_response[http::field::content_type]), "video/mp4");
  EXPECT_EQ(file_response.body().size(), payload.size());
  EXPECT_EQ(std::string(file_response[http::field::content_length]), std::to_string(payload.size()));
}

TEST_F(RequestHandlerTest, PayloadOfUnknownOrReservedIsNotFound) {
  EXPECT_EQ(get_page("/videos/nope/video.mp4").result(), http::status::not_found);

  std::string reserved = allocator->allocate();
  EXPECT_EQ(get_page("/videos/" + reserved + "/video.mp4").result(), http::status::not_found);
  EXPECT_EQ(get_page("/videos/../video.mp4").result(), http::status::not_found);
}

TEST_F(RequestHandlerTest, UnknownRoutesAndMethods) {
  EXPECT_EQ(get_page("/nothing-here").result(), http::status::not_found);

  http::request<http::string_body> request{http::verb::delete_, "/", 11};
  Response response = handler->handle(request);
  ASSERT_TRUE(std::holds_alternative<StringResponse>(response));
  EXPECT_EQ(std::get<StringResponse>(response).result(), http::status::method_not_allowed);
}

TEST_F(RequestHandlerTest, IsUpload) {
  http::request_header<> header;
  header.method(http::verb::post);
  header.target("/upload/");
  EXPECT_TRUE(RequestHandler::is_upload(header));
  header.target("/upload");
  EXPECT_TRUE(RequestHandler::is_upload(header));
  header.target("/");
  EXPECT_FALSE(RequestHandler::is_upload(header));
  header.method(http::verb::get);
  header.target("/upload/");
  EXPECT_FALSE(RequestHandler::is_upload(header));
}

TEST_F(RequestHandlerTest, UploadPublishesVideo) {
  std::string payload = make_binary_payload(10000);
  StringResponse response = post_upload(*handler, upload_body("My Trip", payload));

  ASSERT_EQ(response.result(), http::status::see_other);
  std::string target = location(response);
  ASSERT_THAT(target, StartsWith("/watch/"));

  std::string id = url_decode(target.substr(7));
  EXPECT_EQ(store->load(id), "My Trip");

  std::ostringstream stored;
  store->read_payload(id, stored);
  EXPECT_EQ(stored.str(), payload);

  EXPECT_EQ(get_page(target).result(), http::status::ok);
}

TEST_F(RequestHandlerTest, UploadWithoutTitleUsesEmptyTitle) {
  std::string body = "--" + BOUNDARY + "\r\n"
                     "Content-Disposition: form-data; name=\"video-file\"; filename=\"v.mp4\"\r\n\r\n"
                     "data\r\n"
                     "--" + BOUNDARY + "--\r\n";
  StringResponse response = post_upload(*handler, body);

  ASSERT_THAT(location(response), StartsWith("/watch/"));
  EXPECT_EQ(store->load(location(response).substr(7)), "");
}

TEST_F(RequestHandlerTest, MalformedUploadRedirectsWithMessage) {
  std::string body = "--" + BOUNDARY + "\r\n"
                     "Content-Disposition: form-data; name=\"title\"\r\n\r\n"
                     "only a title\r\n"
                     "--" + BOUNDARY + "--\r\n";
  StringResponse response = post_upload(*handler, body);
  EXPECT_EQ(response.result(), http::status::see_other);
  EXPECT_EQ(location(response), "/?error=misc&msg=" + url_encode("No video-file in upload"));

  response = post_upload(*handler, "irrelevant", "text/plain");
  EXPECT_THAT(location(response), StartsWith("/?error=misc&msg="));

  // Nothing was allocated for rejected forms
  EXPECT_TRUE(store->slots().empty());
}

TEST_F(RequestHandlerTest, AllocationFailureRedirectsWithMessage) {
  std::filesystem::path blocked = test_dir / "blocked";
  write_file(blocked, "not a directory");
  IdAllocator broken_allocator(blocked);
  RequestHandler broken_handler(*store, broken_allocator);

  StringResponse response = post_upload(broken_handler, upload_body("t", "p"));
  EXPECT_EQ(response.result(), http::status::see_other);
  EXPECT_THAT(location(response), StartsWith("/?error=misc&msg="));
}

TEST_F(RequestHandlerTest, SaveFailureRedirectsWithUploadFailed) {
  // Slots are reserved under a root the store does not write to
  std::filesystem::path other_root = test_dir / "other";
  IdAllocator other_allocator(other_root);
  RequestHandler mismatched_handler(*store, other_allocator);

  StringResponse response = post_upload(mismatched_handler, upload_body("t", "p"));
  EXPECT_EQ(response.result(), http::status::see_other);
  EXPECT_EQ(location(response), "/?error=fu");
}

TEST_F(RequestHandlerTest, ResponsesFollowRequestVersionAndKeepAlive) {
  http::request<http::string_body> request{http::verb::get, "/", 10};
  Response response = handler->handle(request);
  const StringResponse& page = std::get<StringResponse>(response);
  EXPECT_EQ(page.version(), 10u);
  EXPECT_FALSE(page.keep_alive());

  StringResponse redirect = RequestHandler::make_redirect(11, true, "/x");
  EXPECT_EQ(location(redirect), "/x");
  EXPECT_TRUE(redirect.keep_alive());
}
