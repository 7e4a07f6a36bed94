#include "ledger/memory_ledger.hpp"
#include "crypto/crypto_error.hpp"
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace oracle {
namespace ledger {

MemoryLedger::MemoryLedger(FeeSchedule fees, TransactionIdSource tx_ids)
  : fees_(fees)
  , tx_ids_(std::move(tx_ids)) {
  BOOST_LOG_TRIVIAL(info) << "MemoryLedger: Initialized";
}

uint64_t MemoryLedger::quote_fee(std::size_t account_space) const {
  return fees_.quote(account_space);
}

CreateOutcome MemoryLedger::create_if_absent(const Namespace& owner_ns, const Address& address,
                                             const Bytes& data, Deadline deadline) {
  CreateOutcome outcome;
  if (deadline_passed(deadline)) {
    BOOST_LOG_TRIVIAL(warning) << "MemoryLedger: Deadline passed before create at " << address_to_hex(address);
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  // Nothing is committed unless the transaction has an id
  try {
    outcome.tx_id = tx_ids_();
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "MemoryLedger: " << e.what();
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted = entries_.emplace(address, Entry{owner_ns, data});
  if (!inserted.second) {
    BOOST_LOG_TRIVIAL(info) << "MemoryLedger: Address already occupied: " << address_to_hex(address);
    outcome.tx_id.clear();
    outcome.error = ErrorKind::ALREADY_EXISTS;
    return outcome;
  }

  outcome.fee_paid = fees_.quote(data.size());  // data is padded to the reserved space
  BOOST_LOG_TRIVIAL(debug) << "MemoryLedger: Created entry at " << address_to_hex(address)
                           << ". Ledger size: " << entries_.size();
  return outcome;
}

GetOutcome MemoryLedger::get(const Address& address, Deadline deadline) const {
  GetOutcome outcome;
  if (deadline_passed(deadline)) {
    outcome.error = ErrorKind::LEDGER_UNAVAILABLE;
    return outcome;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(address);
  if (it == entries_.end()) {
    outcome.error = ErrorKind::ADDRESS_NOT_FOUND;
    return outcome;
  }
  outcome.data = it->second.data;
  return outcome;
}

ErrorKind MemoryLedger::scan(const Namespace& namespace_tag, const ScanVisitor& visitor,
                             Deadline deadline) const {
  if (deadline_passed(deadline)) {
    return ErrorKind::LEDGER_UNAVAILABLE;
  }

  // Snapshot under the lock, visit without it
  std::vector<std::pair<Address, Bytes>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [address, entry] : entries_) {
      if (entry.owner_ns == namespace_tag) {
        snapshot.emplace_back(address, entry.data);
      }
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "MemoryLedger: Scanning " << snapshot.size() << " entries";
  for (const auto& [address, data] : snapshot) {
    if (!visitor(address, data)) {
      break;
    }
  }
  return ErrorKind::SUCCESS;
}

std::size_t MemoryLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace ledger
} // namespace oracle
