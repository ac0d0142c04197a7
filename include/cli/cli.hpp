#pragma once

#include <iostream>
#include <string>
#include "provider/async_provider.hpp"

namespace hold {
namespace cli {

// Interactive shell issuing provider operations, one command per line
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(provider::AsyncProvider& provider, std::istream& input = std::cin,
        std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    provider::AsyncProvider& provider_;
    std::istream& input_;
    std::ostream& output_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& first,
                         const std::string& second);
    void handle_store_command(const std::string& filename, const std::string& key);
    void handle_get_command(const std::string& key, const std::string& filename);
    void handle_has_command(const std::string& key);
    void handle_delete_command(const std::string& key);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace hold
