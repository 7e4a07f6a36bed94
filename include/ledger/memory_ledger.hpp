#ifndef ORACLE_LEDGER_MEMORY_LEDGER_HPP
#define ORACLE_LEDGER_MEMORY_LEDGER_HPP

#include <map>
#include <mutex>
#include "ledger/fee_schedule.hpp"
#include "ledger/ledger_store.hpp"

namespace oracle {
namespace ledger {

// In-process ledger: a mutex-guarded ordered map. Lives as long as the object.
class MemoryLedger : public LedgerStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryLedger(FeeSchedule fees = FeeSchedule{},
                        TransactionIdSource tx_ids = make_transaction_id);
  ~MemoryLedger() override = default;

  MemoryLedger(const MemoryLedger&) = delete;
  MemoryLedger& operator=(const MemoryLedger&) = delete;


  // ---- LEDGER CONTRACT ----
  uint64_t quote_fee(std::size_t account_space) const override;
  CreateOutcome create_if_absent(const Namespace& owner_ns, const Address& address,
                                 const Bytes& data, Deadline deadline) override;
  GetOutcome get(const Address& address, Deadline deadline) const override;
  ErrorKind scan(const Namespace& namespace_tag, const ScanVisitor& visitor,
                 Deadline deadline) const override;


  // ---- QUERY METHODS ----
  std::size_t size() const;

private:
  struct Entry {
    Namespace owner_ns;
    Bytes data;
  };

  // ---- PARAMETERS ----
  FeeSchedule fees_;
  TransactionIdSource tx_ids_;
  std::map<Address, Entry> entries_;
  mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace oracle

#endif // ORACLE_LEDGER_MEMORY_LEDGER_HPP
