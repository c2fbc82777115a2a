#include "config/options.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <limits>
#include <ostream>
#include <unordered_map>

namespace lutube {
namespace config {

namespace {

enum class Flag { ROOT, HOST, PORT, THREADS, SPOOL, MAX_UPLOAD, LOG, LOG_LEVEL, DAEMON, HELP };

const std::unordered_map<std::string, Flag> flag_map = {
  {"-r", Flag::ROOT},        {"--root", Flag::ROOT},
  {"-h", Flag::HOST},        {"--host", Flag::HOST},
  {"-p", Flag::PORT},        {"--port", Flag::PORT},
  {"-t", Flag::THREADS},     {"--threads", Flag::THREADS},
  {"-s", Flag::SPOOL},       {"--spool", Flag::SPOOL},
  {"-m", Flag::MAX_UPLOAD},  {"--max-upload", Flag::MAX_UPLOAD},
  {"-l", Flag::LOG},         {"--log", Flag::LOG},
  {"-v", Flag::LOG_LEVEL},   {"--log-level", Flag::LOG_LEVEL},
  {"-d", Flag::DAEMON},      {"--daemon", Flag::DAEMON},
  {"--help", Flag::HELP}
};

// Accepts only plain decimal numbers within [min, max]
bool parse_number(const std::string& text, unsigned long long min, unsigned long long max,
                  unsigned long long& value) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return value >= min && value <= max;
}

} // namespace

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -r, --root <dir>         Video storage root (default: videos)\n"
      << "  -h, --host <address>     Listen address (default: 0.0.0.0)\n"
      << "  -p, --port <port>        Listen port (default: 8080)\n"
      << "  -t, --threads <n>        HTTP worker threads (default: 2)\n"
      << "  -s, --spool <dir>        Upload spool directory (default: <tmp>/lutube-uploads)\n"
      << "  -m, --max-upload <bytes> Largest accepted upload body (default: 1073741824)\n"
      << "  -l, --log <file>         Also write the log to <file>\n"
      << "  -v, --log-level <level>  trace|debug|info|warning|error|fatal (default: info)\n"
      << "  -d, --daemon             Serve without the interactive shell\n"
      << "      --help               Show this help\n"
      << "Example: " << program_name << " -r ./videos -p 8080\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "lutube";

  auto fail = [&](const std::string& message) {
    err << "Error: " << message << '\n';
    print_usage(program_name, err);
    options.valid = false;
    return options;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    auto it = flag_map.find(arg);
    if (it == flag_map.end()) {
      return fail("Unknown argument: " + arg);
    }

    const Flag flag = it->second;
    if (flag == Flag::DAEMON) {
      options.daemon = true;
      continue;
    }
    if (flag == Flag::HELP) {
      options.help = true;
      continue;
    }

    if (i + 1 >= argc) {
      return fail("Missing value for " + arg);
    }
    const std::string value(argv[++i]);
    unsigned long long number = 0;

    switch (flag) {
      case Flag::ROOT:
        options.root = value;
        break;
      case Flag::HOST:
        options.host = value;
        break;
      case Flag::PORT:
        if (!parse_number(value, 1, std::numeric_limits<uint16_t>::max(), number)) {
          return fail("Invalid port number: " + value);
        }
        options.port = static_cast<uint16_t>(number);
        break;
      case Flag::THREADS:
        if (!parse_number(value, 1, 256, number)) {
          return fail("Invalid thread count: " + value);
        }
        options.threads = static_cast<std::size_t>(number);
        break;
      case Flag::SPOOL:
        options.spool_dir = value;
        break;
      case Flag::MAX_UPLOAD:
        if (!parse_number(value, 1, std::numeric_limits<std::uint64_t>::max(), number)) {
          return fail("Invalid upload limit: " + value);
        }
        options.max_upload_bytes = number;
        break;
      case Flag::LOG:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        if (!logging::parse_severity(value, options.log_level)) {
          return fail("Invalid log level: " + value);
        }
        break;
      default:
        break;
    }
  }

  if (options.root.empty()) {
    return fail("Video root must not be empty");
  }
  if (options.spool_dir.empty()) {
    options.spool_dir = (std::filesystem::temp_directory_path() / "lutube-uploads").string();
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace lutube
