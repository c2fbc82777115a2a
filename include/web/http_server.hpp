#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "web/request_handler.hpp"

namespace lutube {
namespace web {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct ServerSettings {
  std::string address{"0.0.0.0"};
  // 0 picks an ephemeral port, see HttpServer::port()
  uint16_t port{8080};
  std::size_t threads{2};
  std::filesystem::path spool_dir;
  std::uint64_t max_upload_bytes{1ull << 30};
};

// One connection. Reads the header first, then either spools an upload body to
// a file or reads a small body into memory, and writes the handler's response.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpSession(tcp::socket&& socket, RequestHandler& handler, const ServerSettings& settings,
              net::thread_pool& upload_pool);
  ~HttpSession();

  void run();

private:
  // ---- PARAMETERS ----
  static constexpr std::chrono::seconds READ_TIMEOUT{30};
  static constexpr std::chrono::minutes UPLOAD_TIMEOUT{15};
  static constexpr std::uint64_t MAX_REQUEST_BODY = 64 * 1024;

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  RequestHandler& handler_;
  const ServerSettings& settings_;
  // Uploads are decoded and saved here, off the connection threads
  net::thread_pool& upload_pool_;

  std::optional<http::request_parser<http::empty_body>> header_parser_;
  std::optional<http::request_parser<http::string_body>> request_parser_;
  std::optional<http::request_parser<http::file_body>> upload_parser_;
  std::filesystem::path spool_file_;
  // Keeps the response alive until the write completes
  std::shared_ptr<void> response_;


  // ---- READING ----
  void do_read_header();
  void on_read_header(beast::error_code ec, std::size_t bytes_transferred);
  void on_read_request(beast::error_code ec, std::size_t bytes_transferred);
  void do_read_upload();
  void on_read_upload(beast::error_code ec, std::size_t bytes_transferred);
  void on_upload_done(StringResponse response);


  // ---- WRITING ----
  template <class Body>
  void send(http::response<Body>&& response);
  void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void do_close();


  // ---- SPOOL FILES ----
  bool open_spool_file();
  void discard_spool_file();
};

class HttpServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const ServerSettings& settings, RequestHandler& handler);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // The bound port, valid after start_listener()
  uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  ServerSettings settings_;
  RequestHandler& handler_;

  // Server state
  std::atomic<bool> is_running_{false};
  uint16_t bound_port_{0};
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  std::unique_ptr<net::io_context> io_context_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  // Runs allocate and save for uploads, sized like the connection pool
  std::unique_ptr<net::thread_pool> upload_pool_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace web
} // namespace lutube
