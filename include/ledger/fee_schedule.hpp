#ifndef ORACLE_LEDGER_FEE_SCHEDULE_HPP
#define ORACLE_LEDGER_FEE_SCHEDULE_HPP

#include <cstdint>
#include <cstddef>

namespace oracle {
namespace ledger {

// Rent-exempt deposit for the reserved account space plus the base fee of
// the creating transaction, in the smallest currency unit
struct FeeSchedule {
  uint64_t lamports_per_byte_year = 3480;
  uint64_t exemption_years = 2;
  uint64_t account_storage_overhead = 128;
  uint64_t base_transaction_fee = 5000;

  uint64_t rent_exempt_minimum(std::size_t account_space) const {
    return (account_storage_overhead + account_space) * lamports_per_byte_year * exemption_years;
  }

  uint64_t quote(std::size_t account_space) const {
    return rent_exempt_minimum(account_space) + base_transaction_fee;
  }
};

} // namespace ledger
} // namespace oracle

#endif // ORACLE_LEDGER_FEE_SCHEDULE_HPP
