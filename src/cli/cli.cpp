#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace oracle {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(QueryResolver& resolver, std::istream& input, std::ostream& output)
  : resolver_(resolver)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "Oracle> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "Oracle> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  if (line == "quit") {
    return false;
  }

  // The argument is the rest of the line so stored text may contain spaces
  std::string command = line.substr(0, line.find(' '));
  std::string argument;
  if (command.size() < line.size()) {
    argument = line.substr(command.size() + 1);
  }

  if (command.empty()) {
    return true;
  }
  process_command(command, argument);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command;

  if (command == "help" && argument.empty()) {
    handle_help_command();
  }
  else if (command == "status" && argument.empty()) {
    handle_status_command();
  }
  else if (command == "store") {
    handle_store_command(argument);
  }
  else if (command == "query") {
    handle_query_command(argument);
  }
  else if (command == "lookup") {
    handle_lookup_command(argument);
  }
  else if (command == "address") {
    handle_address_command(argument);
  }
  else if (command == "find") {
    handle_find_command(argument);
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_store_command(const std::string& text) {
  StoreResult result = resolver_.store(text);
  if (!result.ok()) {
    log_and_display_error("Store failed", result.error);
    return;
  }

  output_ << (result.recovered ? "Stored (confirmed after timeout)" : "Stored") << std::endl;
  print_record(result.record, result.address);
  if (!result.tx_id.empty()) {
    output_ << "  tx:          " << result.tx_id << std::endl;
  }
  output_ << "  fee:         " << result.fee << std::endl;
}

void CLI::handle_query_command(const std::string& text) {
  QueryResult result = resolver_.query_by_string(text);
  if (!result.ok()) {
    log_and_display_error("Query failed", result.error);
    return;
  }
  if (!result.exists) {
    output_ << "Not anchored" << std::endl;
    return;
  }
  output_ << (result.via_scan ? "Anchored (found by scan)" : "Anchored") << std::endl;
  print_record(*result.record, result.address);
}

void CLI::handle_lookup_command(const std::string& address_hex) {
  auto address = ledger::address_from_hex(address_hex);
  if (!address) {
    output_ << "Invalid address. Expected 64 hex characters" << std::endl;
    return;
  }

  QueryResult result = resolver_.query_by_address(*address);
  if (!result.ok()) {
    log_and_display_error("Lookup failed", result.error);
    return;
  }
  if (!result.exists) {
    output_ << "No record at " << address_hex << std::endl;
    return;
  }
  print_record(*result.record, result.address);
}

void CLI::handle_address_command(const std::string& text) {
  AddressPreview preview = resolver_.preview_address(text);
  if (preview.error != ErrorKind::SUCCESS) {
    log_and_display_error("Cannot derive address", preview.error);
    return;
  }
  output_ << "  address:     " << ledger::address_to_hex(preview.address) << std::endl;
  output_ << "  fingerprint: " << fingerprint::to_hex(preview.fingerprint) << std::endl;
}

void CLI::handle_find_command(const std::string& fingerprint_hex) {
  fingerprint::Fingerprint fingerprint;
  if (!fingerprint::from_hex(fingerprint_hex, fingerprint)) {
    output_ << "Invalid fingerprint. Expected 32 hex characters" << std::endl;
    return;
  }

  ScanReport report = resolver_.find_by_fingerprint(fingerprint);
  for (const auto& corrupt : report.corrupt) {
    output_ << "  skipped corrupt entry " << ledger::address_to_hex(corrupt) << std::endl;
  }
  if (report.match) {
    print_record(report.match->record, report.match->address);
  } else if (report.error != ErrorKind::SUCCESS) {
    log_and_display_error("Scan failed", report.error);
  } else {
    output_ << "No record with that fingerprint (" << report.visited << " entries scanned)" << std::endl;
  }
}

void CLI::handle_status_command() {
  ResolverStatus status = resolver_.status();
  output_ << "  namespace:   " << status.namespace_tag << std::endl;
  output_ << "  owner:       " << status.owner << std::endl;
  output_ << "  cache size:  " << status.cache_size << std::endl;
  output_ << "  fee quote:   " << status.fee_quote << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                Display this help message" << std::endl;
  output_ << "  status              Show namespace, owner, cache size and fee" << std::endl;
  output_ << "  store <text>        Anchor <text>" << std::endl;
  output_ << "  query <text>        Check whether <text> is anchored" << std::endl;
  output_ << "  lookup <address>    Show the record at a 64-hex-char address" << std::endl;
  output_ << "  address <text>      Derive the address of <text> without storing" << std::endl;
  output_ << "  find <fingerprint>  Scan for a 32-hex-char fingerprint" << std::endl;
  output_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::print_record(const record::Record& record, const ledger::Address& address) {
  output_ << "  string:      " << record.original_string << std::endl;
  output_ << "  fingerprint: " << fingerprint::to_hex(record.fingerprint) << std::endl;
  output_ << "  address:     " << ledger::address_to_hex(address) << std::endl;
  output_ << "  created at:  " << record.created_at << std::endl;
  output_ << "  owner:       " << to_hex(record.owner.data(), record.owner.size()) << std::endl;
  output_ << "  cost:        " << record.cost << std::endl;
}

void CLI::log_and_display_error(const std::string& message, ErrorKind error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error_kind_to_string(error) << std::endl;
}

} // namespace cli
} // namespace oracle
