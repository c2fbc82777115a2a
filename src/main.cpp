#include "cli/cli.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include "store/id_allocator.hpp"
#include "store/video_store.hpp"
#include "web/http_server.hpp"
#include "web/request_handler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

namespace {

// Blocks until SIGINT or SIGTERM
void wait_for_signal() {
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
    }
  });
  signal_context.run();
}

bool run_server(const lutube::config::ProgramOptions& options) {
  try {
    lutube::store::VideoStore store(options.root);
    lutube::store::IdAllocator allocator(options.root);
    lutube::web::RequestHandler handler(store, allocator);

    lutube::web::ServerSettings settings;
    settings.address = options.host;
    settings.port = options.port;
    settings.threads = options.threads;
    settings.spool_dir = options.spool_dir;
    settings.max_upload_bytes = options.max_upload_bytes;

    lutube::web::HttpServer server(settings, handler);
    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start HTTP server on " << options.host << ":" << options.port << '\n';
      return false;
    }

    if (options.daemon) {
      wait_for_signal();
    } else {
      lutube::cli::CLI cli(store, allocator);
      cli.run();
    }

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    BOOST_LOG_TRIVIAL(fatal) << "Server failed: " << e.what();
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = lutube::config::parse_command_line(argc, argv, std::cerr);
  if (options.help) {
    lutube::config::print_usage(argv[0], std::cout);
    return 0;
  }
  if (!options.valid) {
    return 1;
  }

  try {
    lutube::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
