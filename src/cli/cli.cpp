#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace lutube {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::VideoStore& store, store::IdAllocator& allocator, std::istream& in, std::ostream& out)
  : running_(false)
  , store_(store)
  , allocator_(allocator)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "LuTube> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command, argument;
    iss >> command;
    std::getline(iss >> std::ws, argument);

    if (!command.empty()) {
      process_command(command, argument);
    }

    if (running_) {
      out_ << "LuTube> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command == "ls" && argument.empty()) {
    handle_list_command();
  }
  else if (command == "help" && argument.empty()) {
    handle_help_command();
  }
  else if (command == "fsck" && argument.empty()) {
    handle_fsck_command();
  }
  else if (command == "show" && !argument.empty()) {
    handle_show_command(argument);
  }
  else if (command == "upload" && !argument.empty()) {
    handle_upload_command(argument);
  }
  else if (command == "check" && !argument.empty()) {
    handle_check_command(argument);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_list_command() {
  try {
    auto videos = store_.enumerate();
    for (const auto& video : videos) {
      out_ << video.id << "  " << video.title << std::endl;
    }
    out_ << videos.size() << " video(s)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error listing videos", e.what());
  }
}

void CLI::handle_show_command(const std::string& id) {
  try {
    std::string title = store_.load(id);
    out_ << "Title: " << title << std::endl;
    out_ << "Payload: " << store_.payload_size(id) << " bytes" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error showing video", e.what());
  }
}

void CLI::handle_upload_command(const std::string& arguments) {
  std::istringstream iss(arguments);
  std::string filename, title;
  iss >> filename;
  std::getline(iss >> std::ws, title);

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }

  try {
    std::string id = allocator_.allocate();
    store_.save(id, title, file);
    out_ << "Uploaded as " << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_check_command(const std::string& id) {
  store::SlotState state = store_.inspect(id);
  out_ << id << ": " << store::slot_state_to_string(state) << std::endl;
}

void CLI::handle_fsck_command() {
  try {
    std::size_t problems = 0;
    auto slots = store_.slots();
    for (const auto& id : slots) {
      store::SlotState state = store_.inspect(id);
      if (state != store::SlotState::COMPLETE) {
        out_ << id << ": " << store::slot_state_to_string(state) << std::endl;
        ++problems;
      }
    }
    out_ << slots.size() << " slot(s) checked, " << problems << " incomplete" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error checking store", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                  Display this help message" << std::endl;
  out_ << "  ls                    List all videos" << std::endl;
  out_ << "  show <id>             Show the title and size of a video" << std::endl;
  out_ << "  upload <file> <title> Store local <file> as a new video" << std::endl;
  out_ << "  check <id>            Report the state of a slot" << std::endl;
  out_ << "  fsck                  Report every incomplete slot" << std::endl;
  out_ << "  quit                  Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace lutube
