#pragma once

#include <iostream>
#include <string>
#include "store/id_allocator.hpp"
#include "store/video_store.hpp"

namespace lutube {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::VideoStore& store, store::IdAllocator& allocator,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until quit or end of input
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::VideoStore& store_;
    store::IdAllocator& allocator_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_list_command();
    void handle_show_command(const std::string& id);
    void handle_upload_command(const std::string& arguments);
    void handle_check_command(const std::string& id);
    void handle_fsck_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace lutube
