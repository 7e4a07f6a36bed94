#include "cli/cli.hpp"
#include "ledger/file_ledger.hpp"
#include "logger/logger.hpp"
#include "oracle/lookup_cache.hpp"
#include "oracle/query_resolver.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <iostream>
#include <string>
#include <unordered_set>

struct NodeOptions {
  std::string data_dir;
  std::string namespace_tag{"string-oracle"};
  std::string owner_hex;
  std::string log_file{"oracle.log"};
  oracle::logging::severity_level verbosity{boost::log::trivial::info};
  long timeout_ms{5000};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <data-dir> [options]\n"
        << "Required arguments:\n"
        << "  -d, --data-dir   Ledger directory\n"
        << "Optional arguments:\n"
        << "  -n, --namespace  Namespace tag (default: string-oracle)\n"
        << "  -o, --owner      Owner identity, 64 hex characters (default: random)\n"
        << "  -l, --log-file   Log file (default: oracle.log)\n"
        << "  -v, --verbosity  trace|debug|info|warning|error|fatal (default: info)\n"
        << "  -t, --timeout-ms Ledger call timeout in milliseconds (default: 5000)\n"
        << "Example: " << program_name << " -d ./ledger -n my-app -v debug\n";
}

NodeOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-d", "--data-dir", "-n", "--namespace", "-o", "--owner",
    "-l", "--log-file", "-v", "--verbosity", "-t", "--timeout-ms"
  };

  NodeOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-d" || flag == "--data-dir") {
      options.data_dir = value;
    } else if (flag == "-n" || flag == "--namespace") {
      options.namespace_tag = value;
    } else if (flag == "-o" || flag == "--owner") {
      options.owner_hex = value;
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--verbosity") {
      if (!oracle::logging::parse_severity(value, options.verbosity)) {
        std::cerr << "Error: Invalid verbosity: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-t" || flag == "--timeout-ms") {
      try {
        options.timeout_ms = std::stol(value);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid timeout\n";
        print_usage(argv[0]);
        return options;
      }
      if (options.timeout_ms <= 0) {
        std::cerr << "Error: Timeout must be positive\n";
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.data_dir.empty() || options.namespace_tag.empty()) {
    std::cerr << "Error: A data directory and a non-empty namespace are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool resolve_owner(const std::string& owner_hex, oracle::record::Owner& owner) {
  if (owner_hex.empty()) {
    if (RAND_bytes(owner.data(), static_cast<int>(owner.size())) != 1) {
      std::cerr << "Error: Failed to generate owner identity\n";
      return false;
    }
    BOOST_LOG_TRIVIAL(warning) << "No owner given; using random identity "
                               << oracle::to_hex(owner.data(), owner.size());
    return true;
  }

  oracle::Bytes raw;
  if (!oracle::from_hex(owner_hex, raw) || raw.size() != owner.size()) {
    std::cerr << "Error: Owner must be " << owner.size() * 2 << " hex characters\n";
    return false;
  }
  std::copy(raw.begin(), raw.end(), owner.begin());
  return true;
}

bool run_node(const NodeOptions& options) {
  try {
    oracle::logging::init_logging(options.log_file, options.verbosity);

    oracle::OracleConfig config;
    config.namespace_tag = options.namespace_tag;
    config.ledger_timeout = std::chrono::milliseconds(options.timeout_ms);
    if (!resolve_owner(options.owner_hex, config.owner)) {
      return false;
    }

    oracle::ledger::FileLedger ledger(options.data_dir);
    oracle::LookupCache cache;
    oracle::QueryResolver resolver(ledger, cache, config);
    oracle::cli::CLI cli(resolver);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start oracle node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
