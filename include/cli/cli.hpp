#pragma once

#include <iostream>
#include <string>
#include "oracle/query_resolver.hpp"

namespace oracle {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(QueryResolver& resolver, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one command line; returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    QueryResolver& resolver_;
    std::istream& input_;
    std::ostream& output_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument);
    void handle_store_command(const std::string& text);
    void handle_query_command(const std::string& text);
    void handle_lookup_command(const std::string& address_hex);
    void handle_address_command(const std::string& text);
    void handle_find_command(const std::string& fingerprint_hex);
    void handle_status_command();
    void handle_help_command();
    void print_record(const record::Record& record, const ledger::Address& address);
    void log_and_display_error(const std::string& message, ErrorKind error);
};

} // namespace cli
} // namespace oracle
