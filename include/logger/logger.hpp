#ifndef LUTUBE_LOGGER_HPP
#define LUTUBE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace lutube::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs the console sink and, when log_file is not empty, a rotating file sink.
// Replaces any sinks installed by a previous call.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

// Sets the minimum severity that reaches the sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses trace|debug|info|warning|error|fatal, returns false for anything else
bool parse_severity(const std::string& name, severity_level& level);

} // namespace lutube::logging

#endif // LUTUBE_LOGGER_HPP
