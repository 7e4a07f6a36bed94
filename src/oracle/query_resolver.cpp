#include "oracle/query_resolver.hpp"
#include <chrono>
#include <utility>
#include <boost/log/trivial.hpp>

namespace oracle {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

QueryResolver::QueryResolver(ledger::LedgerStore& ledger, LookupCache& cache, OracleConfig config,
                             Clock clock)
  : ledger_(ledger)
  , cache_(cache)
  , config_(std::move(config))
  , clock_(std::move(clock)) {
  BOOST_LOG_TRIVIAL(info) << "Resolver: Initialized for namespace '" << config_.namespace_tag
                          << "' with ledger timeout " << config_.ledger_timeout.count() << " ms";
}


//==============================================
// STORE
//==============================================

StoreResult QueryResolver::store(const std::string& raw_string) {
  StoreResult result;
  result.error = validate_input(raw_string);
  if (result.error != ErrorKind::SUCCESS) {
    BOOST_LOG_TRIVIAL(info) << "Resolver: Rejected store of " << raw_string.size()
                            << " bytes: " << result.error;
    return result;
  }

  result.address = ledger_.derive_address(config_.namespace_tag, raw_string);

  record::Record record;
  record.original_string = raw_string;
  record.fingerprint = fingerprint::compute(raw_string);
  record.created_at = clock_();
  record.owner = config_.owner;
  record.cost = ledger_.quote_fee(record::RecordCodec::ACCOUNT_SPACE);

  // The account is allocated at its full reserved size, zero filled
  Bytes data = codec_.encode(record);
  data.resize(record::RecordCodec::ACCOUNT_SPACE, 0);

  const std::string key = ledger::address_to_hex(result.address);
  BOOST_LOG_TRIVIAL(info) << "Resolver: Storing fingerprint " << fingerprint::to_hex(record.fingerprint)
                          << " at " << key;

  ledger::CreateOutcome outcome = ledger_.create_if_absent(
      config_.namespace_tag, result.address, data, deadline_after(config_.ledger_timeout));

  switch (outcome.error) {
    case ErrorKind::SUCCESS:
      cache_.insert(record.fingerprint);
      result.record = std::move(record);
      result.tx_id = std::move(outcome.tx_id);
      result.fee = outcome.fee_paid;
      BOOST_LOG_TRIVIAL(info) << "Resolver: Stored " << key << " in tx " << result.tx_id
                              << ", fee " << result.fee;
      return result;

    case ErrorKind::ALREADY_EXISTS:
      BOOST_LOG_TRIVIAL(info) << "Resolver: Duplicate submission at " << key;
      result.error = ErrorKind::ALREADY_EXISTS;
      return result;

    case ErrorKind::LEDGER_UNAVAILABLE:
      BOOST_LOG_TRIVIAL(warning) << "Resolver: Create at " << key
                                 << " timed out or failed; re-checking before deciding";
      return resolve_ambiguous_write(record, result.address);

    default:
      BOOST_LOG_TRIVIAL(error) << "Resolver: Unexpected ledger outcome on create: " << outcome.error;
      result.error = outcome.error;
      return result;
  }
}

StoreResult QueryResolver::resolve_ambiguous_write(const record::Record& record,
                                                   const ledger::Address& address) {
  StoreResult result;
  result.address = address;

  const std::string key = ledger::address_to_hex(address);
  ledger::GetOutcome existing = get_with_retry(address);

  if (existing.error == ErrorKind::ADDRESS_NOT_FOUND) {
    BOOST_LOG_TRIVIAL(warning) << "Resolver: Write at " << key << " did not land; safe to retry";
    result.error = ErrorKind::LEDGER_UNAVAILABLE;
    return result;
  }
  if (existing.error != ErrorKind::SUCCESS || !existing.data) {
    BOOST_LOG_TRIVIAL(error) << "Resolver: Outcome of write at " << key << " is unknown: " << existing.error;
    result.error = ErrorKind::LEDGER_UNAVAILABLE;
    return result;
  }

  record::Record landed;
  try {
    landed = codec_.decode(*existing.data);
  } catch (const record::CorruptRecordError& e) {
    BOOST_LOG_TRIVIAL(error) << "Resolver: Entry at " << key << " is corrupt: " << e.what();
    result.error = ErrorKind::CORRUPT_RECORD;
    return result;
  }

  // Our write matches field for field, created_at included; an earlier
  // store of the same string does not
  if (landed != record) {
    BOOST_LOG_TRIVIAL(info) << "Resolver: Address " << key << " was taken by another submission";
    result.error = ErrorKind::ALREADY_EXISTS;
    return result;
  }

  cache_.insert(landed.fingerprint);
  result.fee = landed.cost;
  result.record = std::move(landed);
  result.recovered = true;
  BOOST_LOG_TRIVIAL(info) << "Resolver: Write at " << key << " landed despite the timeout";
  return result;
}


//==============================================
// QUERIES
//==============================================

QueryResult QueryResolver::query_by_string(const std::string& raw_string) {
  QueryResult result;
  result.error = validate_input(raw_string);
  if (result.error != ErrorKind::SUCCESS) {
    return result;
  }

  const fingerprint::Fingerprint expected = fingerprint::compute(raw_string);
  result.address = ledger_.derive_address(config_.namespace_tag, raw_string);
  const std::string key = ledger::address_to_hex(result.address);
  BOOST_LOG_TRIVIAL(debug) << "Resolver: Query by string, fingerprint "
                           << fingerprint::to_hex(expected) << " at " << key;

  ledger::GetOutcome got = get_with_retry(result.address);

  if (got.error == ErrorKind::SUCCESS && got.data) {
    record::Record decoded;
    try {
      decoded = codec_.decode(*got.data);
    } catch (const record::CorruptRecordError& e) {
      BOOST_LOG_TRIVIAL(error) << "Resolver: Entry at " << key << " is corrupt: " << e.what();
      result.error = ErrorKind::CORRUPT_RECORD;
      return result;
    }

    // A mismatch means collision or tampering, not absence
    if (decoded.fingerprint != expected || decoded.original_string != raw_string) {
      BOOST_LOG_TRIVIAL(error) << "Resolver: Entry at " << key << " does not match the queried string";
      result.error = ErrorKind::CORRUPT_RECORD;
      return result;
    }

    result.exists = true;
    result.record = std::move(decoded);
    return result;
  }

  if (got.error != ErrorKind::ADDRESS_NOT_FOUND) {
    result.error = got.error;
    return result;
  }

  if (config_.cache_gates_scan && !cache_.contains(expected)) {
    BOOST_LOG_TRIVIAL(debug) << "Resolver: Point miss and cache miss, not found";
    result.error = ErrorKind::ADDRESS_NOT_FOUND;
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Resolver: Point miss at " << key << ", falling back to namespace scan";
  ScanReport report = scan_for(expected, raw_string, config_.default_scan_budget);
  if (report.match) {
    result.exists = true;
    result.via_scan = true;
    result.address = report.match->address;
    result.record = std::move(report.match->record);
    return result;
  }

  result.error = report.error == ErrorKind::SUCCESS ? ErrorKind::ADDRESS_NOT_FOUND : report.error;
  return result;
}

QueryResult QueryResolver::query_by_address(const ledger::Address& address) {
  QueryResult result;
  result.address = address;
  const std::string key = ledger::address_to_hex(address);
  BOOST_LOG_TRIVIAL(debug) << "Resolver: Query by address " << key;

  ledger::GetOutcome got = get_with_retry(address);
  if (got.error != ErrorKind::SUCCESS || !got.data) {
    result.error = got.error == ErrorKind::SUCCESS ? ErrorKind::ADDRESS_NOT_FOUND : got.error;
    return result;
  }

  try {
    result.record = codec_.decode(*got.data);
  } catch (const record::CorruptRecordError& e) {
    BOOST_LOG_TRIVIAL(error) << "Resolver: Entry at " << key << " is corrupt: " << e.what();
    result.error = ErrorKind::CORRUPT_RECORD;
    return result;
  }

  result.exists = true;
  return result;
}

ScanReport QueryResolver::find_by_fingerprint(const fingerprint::Fingerprint& fingerprint) {
  return find_by_fingerprint(fingerprint, config_.default_scan_budget);
}

ScanReport QueryResolver::find_by_fingerprint(const fingerprint::Fingerprint& fingerprint,
                                              const ScanBudget& budget) {
  BOOST_LOG_TRIVIAL(info) << "Resolver: Scanning namespace for fingerprint " << fingerprint::to_hex(fingerprint);
  return scan_for(fingerprint, std::nullopt, budget);
}

AddressPreview QueryResolver::preview_address(const std::string& raw_string) const {
  AddressPreview preview;
  preview.error = validate_input(raw_string);
  if (preview.error != ErrorKind::SUCCESS) {
    return preview;
  }
  preview.fingerprint = fingerprint::compute(raw_string);
  preview.address = ledger_.derive_address(config_.namespace_tag, raw_string);
  return preview;
}

ResolverStatus QueryResolver::status() const {
  ResolverStatus status;
  status.namespace_tag = config_.namespace_tag;
  status.owner = to_hex(config_.owner.data(), config_.owner.size());
  status.cache_size = cache_.size();
  status.fee_quote = ledger_.quote_fee(record::RecordCodec::ACCOUNT_SPACE);
  return status;
}


//==============================================
// VALIDATION
//==============================================

ErrorKind QueryResolver::validate_input(const std::string& raw_string) {
  if (raw_string.empty()) {
    return ErrorKind::EMPTY_STRING;
  }
  if (raw_string.size() > record::MAX_STRING_LENGTH) {
    return ErrorKind::STRING_TOO_LONG;
  }
  if (!is_valid_utf8(raw_string.data(), raw_string.size())) {
    return ErrorKind::INVALID_UTF8;
  }
  return ErrorKind::SUCCESS;
}

int64_t QueryResolver::system_clock_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}


//==============================================
// LEDGER ACCESS
//==============================================

ledger::GetOutcome QueryResolver::get_with_retry(const ledger::Address& address) const {
  ledger::GetOutcome outcome;
  for (unsigned attempt = 0; attempt <= config_.read_retries; ++attempt) {
    outcome = ledger_.get(address, deadline_after(config_.ledger_timeout));
    if (outcome.error != ErrorKind::LEDGER_UNAVAILABLE) {
      return outcome;
    }
    BOOST_LOG_TRIVIAL(warning) << "Resolver: Ledger unavailable on get, attempt " << attempt + 1
                               << " of " << config_.read_retries + 1;
  }
  return outcome;
}

ScanReport QueryResolver::scan_for(const fingerprint::Fingerprint& fingerprint,
                                   const std::optional<std::string>& expected_string,
                                   const ScanBudget& budget) const {
  ScanReport report;
  for (unsigned attempt = 0; attempt <= config_.read_retries; ++attempt) {
    // A scan cannot resume; every retry is a fresh point-in-time walk
    report = scan_once(fingerprint, expected_string, budget);
    if (report.error != ErrorKind::LEDGER_UNAVAILABLE) {
      return report;
    }
    BOOST_LOG_TRIVIAL(warning) << "Resolver: Ledger unavailable on scan, attempt " << attempt + 1
                               << " of " << config_.read_retries + 1;
  }
  return report;
}

ScanReport QueryResolver::scan_once(const fingerprint::Fingerprint& fingerprint,
                                    const std::optional<std::string>& expected_string,
                                    const ScanBudget& budget) const {
  ScanReport report;
  bool budget_exhausted = false;
  const auto started = std::chrono::steady_clock::now();

  auto visitor = [&](const ledger::Address& address, const Bytes& data) {
    if (report.visited >= budget.max_entries
        || std::chrono::steady_clock::now() - started >= budget.max_duration) {
      budget_exhausted = true;
      return false;
    }
    ++report.visited;

    // Other record kinds share the namespace
    if (!record::RecordCodec::has_record_discriminator(data)) {
      return true;
    }

    try {
      record::Record decoded = codec_.decode(data);
      if (decoded.fingerprint == fingerprint
          && (!expected_string || decoded.original_string == *expected_string)) {
        report.match = ScanMatch{address, std::move(decoded)};
        return false;
      }
    } catch (const record::CorruptRecordError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Resolver: Skipping corrupt entry " << ledger::address_to_hex(address)
                                 << ": " << e.what();
      report.corrupt.push_back(address);
    }
    return true;
  };

  ErrorKind scanned = ledger_.scan(config_.namespace_tag, visitor, deadline_after(config_.ledger_timeout));
  if (scanned != ErrorKind::SUCCESS) {
    report.error = scanned;
    report.match.reset();
    return report;
  }

  if (!report.match && budget_exhausted) {
    BOOST_LOG_TRIVIAL(warning) << "Resolver: Scan budget exhausted after " << report.visited << " entries";
    report.error = ErrorKind::SCAN_BUDGET_EXHAUSTED;
  }

  BOOST_LOG_TRIVIAL(debug) << "Resolver: Scan visited " << report.visited << " entries, "
                           << report.corrupt.size() << " corrupt, "
                           << (report.match ? "match found" : "no match");
  return report;
}

} // namespace oracle
