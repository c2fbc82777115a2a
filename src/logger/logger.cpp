#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <iostream>

namespace lutube::logging {

namespace {

// Shared by the console and file sinks
auto make_formatter() {
  namespace expr = boost::log::expressions;
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    boost::log::add_console_log(
        std::clog,
        keywords::format = make_formatter(),
        keywords::auto_flush = true);

    if (!log_file.empty()) {
      boost::log::add_file_log(
          keywords::file_name = log_file,
          keywords::open_mode = std::ios::out | std::ios::app,
          keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
          keywords::format = make_formatter(),
          keywords::auto_flush = true);
    }

    set_log_level(min_level);
    enable_logging();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Logging initialized"
                          << (log_file.empty() ? std::string() : " with file: " + log_file);
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

bool parse_severity(const std::string& name, severity_level& level) {
  // from_string accepts exactly the names operator<< prints
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace lutube::logging
