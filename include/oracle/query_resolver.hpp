#ifndef ORACLE_QUERY_RESOLVER_HPP
#define ORACLE_QUERY_RESOLVER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/error_kind.hpp"
#include "fingerprint/fingerprint.hpp"
#include "ledger/ledger_store.hpp"
#include "oracle/lookup_cache.hpp"
#include "oracle/oracle_config.hpp"
#include "record/record_codec.hpp"

namespace oracle {

struct StoreResult {
  ErrorKind error = ErrorKind::SUCCESS;
  record::Record record;
  ledger::Address address{};
  std::string tx_id;        // empty when the write was confirmed by re-reading
  uint64_t fee = 0;
  bool recovered = false;   // a timed-out write turned out to have landed

  bool ok() const { return error == ErrorKind::SUCCESS; }
};

struct QueryResult {
  ErrorKind error = ErrorKind::SUCCESS;   // ADDRESS_NOT_FOUND when absent
  bool exists = false;
  std::optional<record::Record> record;
  ledger::Address address{};
  bool via_scan = false;

  // The query was answered, whether or not the record exists
  bool ok() const { return error == ErrorKind::SUCCESS || error == ErrorKind::ADDRESS_NOT_FOUND; }
};

struct AddressPreview {
  ErrorKind error = ErrorKind::SUCCESS;
  ledger::Address address{};
  fingerprint::Fingerprint fingerprint{};
};

struct ScanMatch {
  ledger::Address address;
  record::Record record;
};

struct ScanReport {
  ErrorKind error = ErrorKind::SUCCESS;   // SUCCESS, LEDGER_UNAVAILABLE or SCAN_BUDGET_EXHAUSTED
  std::optional<ScanMatch> match;
  std::vector<ledger::Address> corrupt;   // entries skipped because they failed to decode
  std::size_t visited = 0;
};

struct ResolverStatus {
  Namespace namespace_tag;
  std::string owner;        // hex
  std::size_t cache_size = 0;
  uint64_t fee_quote = 0;
};

// Answers store and lookup requests against one ledger namespace.
// The ledger and the cache are borrowed and must outlive the resolver.
class QueryResolver {
public:
  // Seconds since epoch for created_at
  using Clock = std::function<int64_t()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  QueryResolver(ledger::LedgerStore& ledger, LookupCache& cache, OracleConfig config,
                Clock clock = system_clock_seconds);


  // ---- STORE ----
  // Anchors raw_string at its derived address; a second store of the same
  // string reports ALREADY_EXISTS
  StoreResult store(const std::string& raw_string);


  // ---- QUERIES ----
  QueryResult query_by_string(const std::string& raw_string);
  QueryResult query_by_address(const ledger::Address& address);
  // Full O(N) scan of the namespace; first entry with this fingerprint wins
  ScanReport find_by_fingerprint(const fingerprint::Fingerprint& fingerprint);
  ScanReport find_by_fingerprint(const fingerprint::Fingerprint& fingerprint, const ScanBudget& budget);
  // Validates and derives without touching the ledger
  AddressPreview preview_address(const std::string& raw_string) const;
  ResolverStatus status() const;


  // ---- VALIDATION ----
  // EMPTY_STRING, STRING_TOO_LONG, INVALID_UTF8 or SUCCESS
  static ErrorKind validate_input(const std::string& raw_string);

  static int64_t system_clock_seconds();

private:
  // ---- PARAMETERS ----
  ledger::LedgerStore& ledger_;
  LookupCache& cache_;
  OracleConfig config_;
  Clock clock_;
  record::RecordCodec codec_;


  // ---- LEDGER ACCESS ----
  // Point lookup, retried on LEDGER_UNAVAILABLE
  ledger::GetOutcome get_with_retry(const ledger::Address& address) const;
  // Scan, retried from scratch on LEDGER_UNAVAILABLE. With expected_string
  // set, a match must also carry that exact string.
  ScanReport scan_for(const fingerprint::Fingerprint& fingerprint,
                      const std::optional<std::string>& expected_string,
                      const ScanBudget& budget) const;
  ScanReport scan_once(const fingerprint::Fingerprint& fingerprint,
                       const std::optional<std::string>& expected_string,
                       const ScanBudget& budget) const;


  // ---- STORE SUPPORT ----
  // Decides the outcome of a write that timed out by re-reading its address
  StoreResult resolve_ambiguous_write(const record::Record& record, const ledger::Address& address);
};

} // namespace oracle

#endif // ORACLE_QUERY_RESOLVER_HPP
