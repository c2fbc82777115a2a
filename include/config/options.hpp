#ifndef LUTUBE_CONFIG_OPTIONS_HPP
#define LUTUBE_CONFIG_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <boost/log/trivial.hpp>

namespace lutube {
namespace config {

struct ProgramOptions {
  std::string root{"videos"};
  std::string host{"0.0.0.0"};
  uint16_t port{8080};
  std::size_t threads{2};
  std::string spool_dir;
  std::uint64_t max_upload_bytes{1ull << 30};
  std::string log_file;
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool daemon{false};
  bool help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Parses flags into options. On a bad argument the usage text goes to err and
// the returned options have valid == false.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace lutube

#endif // LUTUBE_CONFIG_OPTIONS_HPP
