#ifndef ORACLE_LEDGER_STORE_HPP
#define ORACLE_LEDGER_STORE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "core/error_kind.hpp"
#include "core/types.hpp"
#include "ledger/address.hpp"

namespace oracle {
namespace ledger {

struct CreateOutcome {
  ErrorKind error = ErrorKind::SUCCESS;   // SUCCESS, ALREADY_EXISTS or LEDGER_UNAVAILABLE
  std::string tx_id;
  uint64_t fee_paid = 0;
};

struct GetOutcome {
  ErrorKind error = ErrorKind::SUCCESS;   // SUCCESS, ADDRESS_NOT_FOUND or LEDGER_UNAVAILABLE
  std::optional<Bytes> data;
};

// Receives one (address, bytes) entry per call; return false to stop the scan
using ScanVisitor = std::function<bool(const Address&, const Bytes&)>;

// Keyed store with atomic create-if-absent. The single source of truth and
// the single synchronization point for every writer.
class LedgerStore {
public:
  virtual ~LedgerStore() = default;

  // Pure and deterministic
  virtual Address derive_address(const Namespace& namespace_tag, const std::string& content) const;

  // Fee charged for creating an entry that reserves account_space bytes
  virtual uint64_t quote_fee(std::size_t account_space) const = 0;

  // Atomic across all writers. owner_ns is the key space the entry is listed
  // under for scans. A LEDGER_UNAVAILABLE result is ambiguous: the write may
  // have landed.
  virtual CreateOutcome create_if_absent(const Namespace& owner_ns, const Address& address,
                                         const Bytes& data, Deadline deadline) = 0;

  virtual GetOutcome get(const Address& address, Deadline deadline) const = 0;

  // Point-in-time, finite walk over the entries listed under namespace_tag.
  // Returns SUCCESS when the walk ended (or the visitor stopped it).
  virtual ErrorKind scan(const Namespace& namespace_tag, const ScanVisitor& visitor,
                         Deadline deadline) const = 0;
};

// Random 32-byte transaction identifier, hex encoded; throws crypto::CryptoError
std::string make_transaction_id();

// Source of transaction identifiers for the ledger adapters
using TransactionIdSource = std::function<std::string()>;

} // namespace ledger
} // namespace oracle

#endif // ORACLE_LEDGER_STORE_HPP
