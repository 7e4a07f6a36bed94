#ifndef ORACLE_CONFIG_HPP
#define ORACLE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include "core/types.hpp"
#include "record/record.hpp"

namespace oracle {

// Limits applied to one full scan of the namespace
struct ScanBudget {
  std::size_t max_entries = 100000;
  std::chrono::milliseconds max_duration{30000};
};

struct OracleConfig {
  // Key space of this application on the ledger
  Namespace namespace_tag = "string-oracle";
  // Identity written into every record this process anchors
  record::Owner owner{};
  // Bound on each ledger call
  std::chrono::milliseconds ledger_timeout{5000};
  // Extra attempts for get/scan after LEDGER_UNAVAILABLE; writes never retry
  unsigned read_retries = 2;
  // When true, a point miss only falls back to a scan if this process has
  // anchored the fingerprint itself
  bool cache_gates_scan = true;
  ScanBudget default_scan_budget;
};

} // namespace oracle

#endif // ORACLE_CONFIG_HPP
