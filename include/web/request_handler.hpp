#ifndef LUTUBE_WEB_REQUEST_HANDLER_HPP
#define LUTUBE_WEB_REQUEST_HANDLER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <boost/beast/http.hpp>
#include "store/id_allocator.hpp"
#include "store/video_store.hpp"

namespace lutube {
namespace web {

namespace http = boost::beast::http;

using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using Response = std::variant<StringResponse, FileResponse>;

// Maps HTTP requests onto the video store:
//   GET  /                         catalog and upload form
//   GET  /watch/{id}               player page
//   GET  /videos/{id}/video.mp4    payload
//   POST /upload/                  multipart upload (title, video-file)
class RequestHandler {
public:
  // Largest title accepted from an upload form
  static constexpr std::size_t MAX_TITLE_BYTES = 64 * 1024;

  // ---- CONSTRUCTOR ----
  RequestHandler(store::VideoStore& store, store::IdAllocator& allocator);
  virtual ~RequestHandler() = default;


  // ---- REQUEST DISPATCH ----
  // True when the request body must be spooled to disk and passed to handle_upload
  static bool is_upload(const http::request_header<>& header);

  // Handles every request except uploads
  Response handle(const http::request<http::string_body>& request);

  // Handles an upload whose body has been spooled to body_file
  template <class Body>
  StringResponse handle_upload(const http::request<Body>& request, const std::filesystem::path& body_file) {
    return upload(std::string(request[http::field::content_type]), body_file,
                  request.version(), request.keep_alive());
  }


  // ---- RESPONSE HELPERS ----
  static StringResponse make_redirect(unsigned version, bool keep_alive, const std::string& location);
  static StringResponse make_error(unsigned version, bool keep_alive, http::status status,
                                   const std::string& message);

protected:
  // Decodes the spooled form, allocates a slot and saves the video
  virtual StringResponse upload(const std::string& content_type, const std::filesystem::path& body_file,
                                unsigned version, bool keep_alive);

private:
  // ---- PARAMETERS ----
  store::VideoStore& store_;
  store::IdAllocator& allocator_;


  // ---- ROUTES ----
  Response handle_home(const http::request<http::string_body>& request, const std::string& query);
  Response handle_watch(const http::request<http::string_body>& request, const std::string& id);
  Response handle_payload(const http::request<http::string_body>& request, const std::string& id);

  static StringResponse make_html(const http::request<http::string_body>& request, std::string body);
};

} // namespace web
} // namespace lutube

#endif // LUTUBE_WEB_REQUEST_HANDLER_HPP
