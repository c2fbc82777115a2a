#include "web/request_handler.hpp"
#include "web/html.hpp"
#include "web/multipart.hpp"
#include "web/url.hpp"
#include <boost/log/trivial.hpp>

namespace lutube {
namespace web {

namespace {

const std::string WATCH_PREFIX = "/watch/";
const std::string VIDEOS_PREFIX = "/videos/";
const std::string PAYLOAD_SUFFIX = std::string("/") + store::VideoStore::PAYLOAD_FILE;

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::VideoStore& store, store::IdAllocator& allocator)
  : store_(store)
  , allocator_(allocator) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: Serving videos from " << store_.root().string();
}


//==============================================
// REQUEST DISPATCH
//==============================================

bool RequestHandler::is_upload(const http::request_header<>& header) {
  std::string path, query;
  split_target(std::string(header.target()), path, query);
  return header.method() == http::verb::post && (path == "/upload/" || path == "/upload");
}

Response RequestHandler::handle(const http::request<http::string_body>& request) {
  std::string path, query;
  split_target(std::string(request.target()), path, query);
  BOOST_LOG_TRIVIAL(debug) << "Request handler: " << request.method_string() << " " << path;

  try {
    if (request.method() != http::verb::get) {
      return make_error(request.version(), request.keep_alive(), http::status::method_not_allowed, "Method not allowed");
    }

    if (path == "/") {
      return handle_home(request, query);
    }
    if (starts_with(path, WATCH_PREFIX)) {
      return handle_watch(request, url_decode(path.substr(WATCH_PREFIX.size())));
    }
    if (starts_with(path, VIDEOS_PREFIX) && ends_with(path, PAYLOAD_SUFFIX) &&
        path.size() > VIDEOS_PREFIX.size() + PAYLOAD_SUFFIX.size()) {
      std::string id = path.substr(VIDEOS_PREFIX.size(),
                                   path.size() - VIDEOS_PREFIX.size() - PAYLOAD_SUFFIX.size());
      return handle_payload(request, url_decode(id));
    }

    return make_error(request.version(), request.keep_alive(), http::status::not_found, "Not found");
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Failed to handle " << path << ": " << e.what();
    return make_error(request.version(), request.keep_alive(), http::status::internal_server_error, e.what());
  }
}

StringResponse RequestHandler::upload(const std::string& content_type, const std::filesystem::path& body_file,
                                      unsigned version, bool keep_alive) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: Processing upload from " << body_file.string();

  // Decode the form: a title field and a video-file part
  MultipartPart video_part;
  std::string title;
  try {
    std::string boundary = boundary_from_content_type(content_type);
    std::vector<MultipartPart> parts = scan_multipart(body_file, boundary);

    const MultipartPart* file_part = find_part(parts, "video-file");
    if (!file_part) {
      throw MultipartError("No video-file in upload");
    }
    video_part = *file_part;

    if (const MultipartPart* title_part = find_part(parts, "title")) {
      title = read_part(body_file, *title_part, MAX_TITLE_BYTES);
    }
  }
  catch (const MultipartError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Rejected upload: " << e.what();
    return make_redirect(version, keep_alive, "/?error=misc&msg=" + url_encode(e.what()));
  }

  std::string id;
  try {
    id = allocator_.allocate();
  }
  catch (const store::AllocationFailed& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: " << e.what();
    return make_redirect(version, keep_alive, "/?error=misc&msg=" + url_encode(e.what()));
  }

  try {
    PartStream payload(body_file, video_part.offset, video_part.length);
    store_.save(id, title, payload);
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Upload of " << id << " failed: " << e.what();
    return make_redirect(version, keep_alive, "/?error=fu");
  }

  BOOST_LOG_TRIVIAL(info) << "Request handler: Uploaded video " << id << " (" << video_part.length << " bytes)";
  return make_redirect(version, keep_alive, WATCH_PREFIX + url_encode(id));
}


//==============================================
// ROUTES
//==============================================

Response RequestHandler::handle_home(const http::request<http::string_body>& request, const std::string& query) {
  std::vector<store::Video> videos;
  try {
    videos = store_.enumerate();
  }
  catch (const store::EnumerationFailed& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: " << e.what();
    return make_error(request.version(), request.keep_alive(), http::status::internal_server_error, e.what());
  }

  return make_html(request, render_home(videos, error_message(parse_query(query))));
}

Response RequestHandler::handle_watch(const http::request<http::string_body>& request, const std::string& id) {
  try {
    store::Video video{id, store_.load(id)};
    return make_html(request, render_watch(video));
  }
  catch (const store::NotFound& e) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: " << e.what();
    return make_redirect(request.version(), request.keep_alive(), "/?error=notfound&id=" + url_encode(id));
  }
}

Response RequestHandler::handle_payload(const http::request<http::string_body>& request, const std::string& id) {
  std::filesystem::path path;
  try {
    path = store_.payload_path(id);
  }
  catch (const store::NotFound& e) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: " << e.what();
    return make_error(request.version(), request.keep_alive(), http::status::not_found, "Not found");
  }

  http::file_body::value_type body;
  boost::beast::error_code ec;
  body.open(path.c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Failed to open " << path.string() << ": " << ec.message();
    return make_error(request.version(), request.keep_alive(), http::status::not_found, "Not found");
  }

  FileResponse response{std::piecewise_construct, std::make_tuple(std::move(body)),
                        std::make_tuple(http::status::ok, request.version())};
  response.set(http::field::content_type, "video/mp4");
  response.keep_alive(request.keep_alive());
  response.prepare_payload();
  return response;
}


//==============================================
// RESPONSE HELPERS
//==============================================

StringResponse RequestHandler::make_html(const http::request<http::string_body>& request, std::string body) {
  StringResponse response{http::status::ok, request.version()};
  response.set(http::field::content_type, "text/html; charset=utf-8");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

StringResponse RequestHandler::make_redirect(unsigned version, bool keep_alive, const std::string& location) {
  StringResponse response{http::status::see_other, version};
  response.set(http::field::location, location);
  response.keep_alive(keep_alive);
  response.prepare_payload();
  return response;
}

StringResponse RequestHandler::make_error(unsigned version, bool keep_alive, http::status status,
                                          const std::string& message) {
  StringResponse response{status, version};
  response.set(http::field::content_type, "text/plain; charset=utf-8");
  response.keep_alive(keep_alive);
  response.body() = message + "\n";
  response.prepare_payload();
  return response;
}

} // namespace web
} // namespace lutube
