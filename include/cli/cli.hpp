#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "storage/storage.hpp"

namespace tutor {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(Storage& storage, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line; returns false once "quit" has been seen
    bool execute(const std::string& line);

    // Splits a command line on whitespace; double quotes group words
    static std::vector<std::string> tokenize(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    Storage& storage_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::vector<std::string>& args);
    void handle_read_command(const std::vector<std::string>& args);
    void handle_write_command(const std::vector<std::string>& args);
    void handle_hash_command(const std::vector<std::string>& args);
    void handle_mtime_command(const std::vector<std::string>& args);
    void handle_submit_command(const std::vector<std::string>& args);
    void handle_submissions_command(const std::vector<std::string>& args);
    void handle_status_command(const std::vector<std::string>& args);
    void handle_allow_late_command(const std::vector<std::string>& args);
    void handle_late_command(const std::vector<std::string>& args);
    void handle_user_command(const std::vector<std::string>& args);
    void handle_users_command(const std::vector<std::string>& args);
    void handle_add_user_command(const std::vector<std::string>& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);

    bool expect_args(const std::vector<std::string>& args, std::size_t count, const char* usage);
    static store::DraftKey draft_key(const std::vector<std::string>& args);
};

} // namespace cli
} // namespace tutor
