#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "store/id_allocator.hpp"
#include "store/video_store.hpp"
#include "web/http_server.hpp"
#include "test_utils.hpp"

using namespace lutube::web;
using namespace lutube::store;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

const std::string BOUNDARY = "ServerTestBoundary";

http::request<http::string_body> make_upload(const std::string& title, const std::string& payload) {
  http::request<http::string_body> request{http::verb::post, "/upload/", 11};
  request.set(http::field::host, "127.0.0.1");
  request.set(http::field::content_type, "multipart/form-data; boundary=" + BOUNDARY);
  request.body() = "--" + BOUNDARY + "\r\n"
                   "Content-Disposition: form-data; name=\"title\"\r\n\r\n" +
                   title + "\r\n"
                   "--" + BOUNDARY + "\r\n"
                   "Content-Disposition: form-data; name=\"video-file\"; filename=\"v.mp4\"\r\n"
                   "Content-Type: video/mp4\r\n\r\n" +
                   payload + "\r\n"
                   "--" + BOUNDARY + "--\r\n";
  request.prepare_payload();
  return request;
}

http::request<http::string_body> make_get(const std::string& target) {
  http::request<http::string_body> request{http::verb::get, target, 11};
  request.set(http::field::host, "127.0.0.1");
  return request;
}

// Holds every upload until the test releases it
class GatedHandler : public RequestHandler {
public:
  GatedHandler(VideoStore& store, IdAllocator& allocator, std::shared_future<void> release)
    : RequestHandler(store, allocator)
    , release_(std::move(release)) {}

  std::future<void> entered() { return entered_.get_future(); }

protected:
  StringResponse upload(const std::string& content_type, const std::filesystem::path& body_file,
                        unsigned version, bool keep_alive) override {
    entered_.set_value();
    release_.wait();
    return RequestHandler::upload(content_type, body_file, version, keep_alive);
  }

private:
  std::promise<void> entered_;
  std::shared_future<void> release_;
};

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    boost::log::core::get()->set_filter(
      boost::log::trivial::severity >= boost::log::trivial::fatal
    );
    test_dir = make_test_dir("http_server_test");
    store = std::make_unique<VideoStore>(test_dir / "videos");
    allocator = std::make_unique<IdAllocator>(test_dir / "videos");
    handler = std::make_unique<RequestHandler>(*store, *allocator);

    settings.address = "127.0.0.1";
    settings.port = 0;
    settings.threads = 2;
    settings.spool_dir = test_dir / "spool";
  }

  void TearDown() override {
    if (server) {
      server->shutdown();
    }
    server.reset();
    std::filesystem::remove_all(test_dir);
  }

  void start_server() {
    server = std::make_unique<HttpServer>(settings, *handler);
    ASSERT_TRUE(server->start_listener());
    ASSERT_NE(server->port(), 0);
  }

  void connect(tcp::socket& socket) {
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server->port()));
  }

  // One request on a fresh connection
  http::response<http::string_body> exchange(http::request<http::string_body> request) {
    net::io_context client_context;
    tcp::socket socket(client_context);
    connect(socket);

    http::write(socket, request);
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return response;
  }

  std::filesystem::path test_dir;
  ServerSettings settings;
  std::unique_ptr<VideoStore> store;
  std::unique_ptr<IdAllocator> allocator;
  std::unique_ptr<RequestHandler> handler;
  std::unique_ptr<HttpServer> server;
};

TEST_F(HttpServerTest, StartListenerTest) {
  start_server();
  EXPECT_TRUE(server->is_running());

  server->shutdown();
  EXPECT_FALSE(server->is_running());
}

TEST_F(HttpServerTest, MultipleStartTest) {
  start_server();
  EXPECT_FALSE(server->start_listener()); // Second start should fail
}

TEST_F(HttpServerTest, RestartAfterShutdown) {
  start_server();
  server->shutdown();

  ASSERT_TRUE(server->start_listener());
  EXPECT_EQ(exchange(make_get("/")).result(), http::status::ok);
}

TEST_F(HttpServerTest, InvalidSettings) {
  ServerSettings no_threads = settings;
  no_threads.threads = 0;
  EXPECT_THROW({ HttpServer idle_server(no_threads, *handler); }, std::invalid_argument);

  ServerSettings bad_address = settings;
  bad_address.address = "not-an-address";
  HttpServer bad_server(bad_address, *handler);
  EXPECT_FALSE(bad_server.start_listener());
  EXPECT_FALSE(bad_server.is_running());
}

TEST_F(HttpServerTest, ServesHomePage) {
  start_server();

  auto response = exchange(make_get("/"));
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_THAT(response.body(), HasSubstr("No videos yet."));

  EXPECT_EQ(exchange(make_get("/missing")).result(), http::status::not_found);
}

TEST_F(HttpServerTest, KeepAliveConnectionServesSeveralRequests) {
  start_server();

  net::io_context client_context;
  tcp::socket socket(client_context);
  connect(socket);
  beast::flat_buffer buffer;

  for (int i = 0; i < 3; ++i) {
    http::write(socket, make_get("/"));
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_TRUE(response.keep_alive());
  }
}

TEST_F(HttpServerTest, UploadWatchAndDownload) {
  start_server();
  std::string payload = make_binary_payload(300 * 1024);

  auto response = exchange(make_upload("Server Trip", payload));
  ASSERT_EQ(response.result(), http::status::see_other);
  std::string location(response[http::field::location]);
  ASSERT_THAT(location, StartsWith("/watch/"));
  std::string id = location.substr(7);

  auto watch = exchange(make_get(location));
  EXPECT_EQ(watch.result(), http::status::ok);
  EXPECT_THAT(watch.body(), HasSubstr("Server Trip"));

  auto video = exchange(make_get("/videos/" + id + "/video.mp4"));
  EXPECT_EQ(video.result(), http::status::ok);
  EXPECT_EQ(std::string(video[http::field::content_type]), "video/mp4");
  EXPECT_EQ(video.body(), payload);

  // Spooled request bodies are removed once handled
  EXPECT_TRUE(std::filesystem::is_empty(settings.spool_dir));
}

TEST_F(HttpServerTest, UploadWithExpectContinue) {
  start_server();

  net::io_context client_context;
  tcp::socket socket(client_context);
  connect(socket);
  beast::flat_buffer buffer;

  auto request = make_upload("Patient client", "abc");
  request.set(http::field::expect, "100-continue");
  http::request_serializer<http::string_body> serializer(request);
  http::write_header(socket, serializer);

  http::response<http::empty_body> interim;
  http::read(socket, buffer, interim);
  EXPECT_EQ(interim.result(), http::status::continue_);

  http::write(socket, serializer);
  http::response<http::string_body> response;
  http::read(socket, buffer, response);
  ASSERT_EQ(response.result(), http::status::see_other);

  std::string id = std::string(response[http::field::location]).substr(7);
  EXPECT_EQ(store->load(id), "Patient client");
}

TEST_F(HttpServerTest, ConcurrentUploads) {
  start_server();

  std::vector<std::thread> clients;
  std::vector<std::string> locations(4);
  for (std::size_t i = 0; i < locations.size(); ++i) {
    clients.emplace_back([this, i, &locations]() {
      auto response = exchange(make_upload("video " + std::to_string(i), make_binary_payload(1000 + i)));
      locations[i] = std::string(response[http::field::location]);
    });
  }
  for (auto& client : clients) {
    client.join();
  }

  for (const auto& location : locations) {
    EXPECT_THAT(location, StartsWith("/watch/"));
  }
  EXPECT_EQ(store->enumerate().size(), locations.size());
}

TEST_F(HttpServerTest, SlowUploadDoesNotBlockOtherRequests) {
  settings.threads = 1;
  std::promise<void> release;
  GatedHandler gated(*store, *allocator, release.get_future().share());
  std::future<void> upload_started = gated.entered();

  server = std::make_unique<HttpServer>(settings, gated);
  ASSERT_TRUE(server->start_listener());

  auto upload = std::async(std::launch::async, [this]() { return exchange(make_upload("slow", "payload")); });
  bool started = upload_started.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

  // The single connection thread is free while the upload is held
  auto page = std::async(std::launch::async, [this]() { return exchange(make_get("/")); });
  bool served = page.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

  release.set_value();
  EXPECT_TRUE(started);
  EXPECT_TRUE(served);
  EXPECT_EQ(page.get().result(), http::status::ok);
  EXPECT_EQ(upload.get().result(), http::status::see_other);

  server->shutdown();
  server.reset();
}
