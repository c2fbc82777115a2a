#include "web/http_server.hpp"
#include <stdexcept>
#include <boost/beast/core/string.hpp>
#include <boost/log/trivial.hpp>
#include <unistd.h>

namespace lutube {
namespace web {

namespace {

std::atomic<std::uint64_t> spool_counter{0};

} // namespace

//==============================================
// SESSION: CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpSession::HttpSession(tcp::socket&& socket, RequestHandler& handler, const ServerSettings& settings,
                         net::thread_pool& upload_pool)
  : stream_(std::move(socket))
  , handler_(handler)
  , settings_(settings)
  , upload_pool_(upload_pool) {
}

HttpSession::~HttpSession() {
  // Aborted uploads end here too
  discard_spool_file();
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read_header, shared_from_this()));
}


//==============================================
// SESSION: READING
//==============================================

void HttpSession::do_read_header() {
  header_parser_.emplace();
  request_parser_.reset();
  upload_parser_.reset();

  stream_.expires_after(READ_TIMEOUT);
  http::async_read_header(stream_, buffer_, *header_parser_,
                          beast::bind_front_handler(&HttpSession::on_read_header, shared_from_this()));
}

void HttpSession::on_read_header(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return do_close();
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Header read failed: " << ec.message();
    return;
  }

  if (RequestHandler::is_upload(header_parser_->get())) {
    upload_parser_.emplace(std::move(*header_parser_));
    upload_parser_->body_limit(settings_.max_upload_bytes);

    if (!open_spool_file()) {
      const auto& request = upload_parser_->get();
      return send(RequestHandler::make_error(request.version(), false,
                                             http::status::internal_server_error,
                                             "Failed to accept upload"));
    }

    // Clients that wait for an interim response get it before the body is read
    if (beast::iequals(upload_parser_->get()[http::field::expect], "100-continue")) {
      auto interim = std::make_shared<http::response<http::empty_body>>(
          http::status::continue_, upload_parser_->get().version());
      response_ = interim;
      http::async_write(stream_, *interim,
        [self = shared_from_this()](beast::error_code write_ec, std::size_t) {
          if (write_ec) {
            BOOST_LOG_TRIVIAL(debug) << "HTTP session: Interim response failed: " << write_ec.message();
            return;
          }
          self->response_ = nullptr;
          self->do_read_upload();
        });
      return;
    }

    return do_read_upload();
  }

  request_parser_.emplace(std::move(*header_parser_));
  request_parser_->body_limit(MAX_REQUEST_BODY);
  http::async_read(stream_, buffer_, *request_parser_,
                   beast::bind_front_handler(&HttpSession::on_read_request, shared_from_this()));
}

void HttpSession::do_read_upload() {
  stream_.expires_after(UPLOAD_TIMEOUT);
  http::async_read(stream_, buffer_, *upload_parser_,
                   beast::bind_front_handler(&HttpSession::on_read_upload, shared_from_this()));
}

void HttpSession::on_read_request(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::body_limit) {
    const auto& request = request_parser_->get();
    return send(RequestHandler::make_error(request.version(), false,
                                           http::status::payload_too_large, "Request body too large"));
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Request read failed: " << ec.message();
    return;
  }

  Response response = handler_.handle(request_parser_->get());
  std::visit([this](auto&& message) { send(std::move(message)); }, std::move(response));
}

void HttpSession::on_read_upload(beast::error_code ec, std::size_t bytes_transferred) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Upload body received, " << bytes_transferred << " bytes";

  const auto& request = upload_parser_->get();
  if (ec == http::error::body_limit) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Upload exceeds " << settings_.max_upload_bytes << " bytes";
    discard_spool_file();
    return send(RequestHandler::make_error(request.version(), false,
                                           http::status::payload_too_large, "Upload too large"));
  }
  if (ec) {
    // Client went away or timed out: nothing to answer
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Upload aborted: " << ec.message();
    discard_spool_file();
    return;
  }

  // Flush the spool before it is read back
  upload_parser_->get().body().close();

  // fsync-heavy saves must not hold up the connection threads
  net::post(upload_pool_, [self = shared_from_this()]() {
    const auto& upload_request = self->upload_parser_->get();
    StringResponse response;
    try {
      response = self->handler_.handle_upload(upload_request, self->spool_file_);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "HTTP session: Upload handling failed: " << e.what();
      response = RequestHandler::make_error(upload_request.version(), false,
                                            http::status::internal_server_error, e.what());
    }
    net::post(self->stream_.get_executor(), [self, response = std::move(response)]() mutable {
      self->on_upload_done(std::move(response));
    });
  });
}

void HttpSession::on_upload_done(StringResponse response) {
  discard_spool_file();
  send(std::move(response));
}


//==============================================
// SESSION: WRITING
//==============================================

template <class Body>
void HttpSession::send(http::response<Body>&& response) {
  auto message = std::make_shared<http::response<Body>>(std::move(response));
  response_ = message;

  stream_.expires_after(READ_TIMEOUT);
  http::async_write(stream_, *message,
                    beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                              message->need_eof()));
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Write failed: " << ec.message();
    return;
  }
  if (close) {
    return do_close();
  }

  response_ = nullptr;
  do_read_header();
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}


//==============================================
// SESSION: SPOOL FILES
//==============================================

bool HttpSession::open_spool_file() {
  std::error_code dir_ec;
  std::filesystem::create_directories(settings_.spool_dir, dir_ec);

  spool_file_ = settings_.spool_dir /
    ("upload-" + std::to_string(::getpid()) + "-" + std::to_string(spool_counter++) + ".part");

  // write_new refuses to reuse an existing file
  beast::error_code ec;
  upload_parser_->get().body().open(spool_file_.c_str(), beast::file_mode::write_new, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Failed to create spool file " << spool_file_.string()
                             << ": " << ec.message();
    spool_file_.clear();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Spooling upload to " << spool_file_.string();
  return true;
}

void HttpSession::discard_spool_file() {
  if (spool_file_.empty()) {
    return;
  }

  if (upload_parser_) {
    upload_parser_->get().body().close();
  }

  std::error_code ec;
  std::filesystem::remove(spool_file_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Could not remove spool file " << spool_file_.string()
                               << ": " << ec.message();
  }
  spool_file_.clear();
}


//==============================================
// SERVER: CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const ServerSettings& settings, RequestHandler& handler)
  : settings_(settings)
  , handler_(handler) {
  if (settings_.threads == 0) {
    throw std::invalid_argument("HTTP server: Thread count must be positive");
  }
  if (settings_.spool_dir.empty()) {
    settings_.spool_dir = std::filesystem::temp_directory_path() / "lutube-uploads";
  }
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing on " << settings_.address << ":" << settings_.port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// SERVER: INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    io_context_ = std::make_unique<net::io_context>(static_cast<int>(settings_.threads));
    upload_pool_ = std::make_unique<net::thread_pool>(settings_.threads);

    tcp::endpoint endpoint(net::ip::make_address(settings_.address), settings_.port);
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    start_accept();

    for (std::size_t i = 0; i < settings_.threads; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          net::io_context::work work(*io_context_);
          io_context_->run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << settings_.address << ":" << bound_port_
                            << " with " << settings_.threads << " threads";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    upload_pool_.reset();
    io_context_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(net::make_strand(*io_context_),
    [this](beast::error_code ec, tcp::socket socket) {
      if (ec == net::error::operation_aborted) {
        return;
      }
      if (!ec) {
        std::make_shared<HttpSession>(std::move(socket), handler_, settings_, *upload_pool_)->run();
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << ec.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    beast::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_->stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Uploads already running finish, queued ones are dropped
  upload_pool_->stop();
  upload_pool_->join();

  // Destroying the context releases the sessions still parked in it
  acceptor_.reset();
  upload_pool_.reset();
  io_context_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

} // namespace web
} // namespace lutube
