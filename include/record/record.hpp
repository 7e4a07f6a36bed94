#ifndef ORACLE_RECORD_RECORD_HPP
#define ORACLE_RECORD_RECORD_HPP

#include <array>
#include <cstdint>
#include <string>
#include "fingerprint/fingerprint.hpp"

namespace oracle {
namespace record {

static constexpr std::size_t OWNER_SIZE = 32;
static constexpr std::size_t MAX_STRING_LENGTH = 200;

using Owner = std::array<uint8_t, OWNER_SIZE>;

// Persisted unit. Immutable once the ledger accepts it.
struct Record {
  std::string original_string;
  fingerprint::Fingerprint fingerprint{};
  int64_t created_at = 0;
  Owner owner{};
  uint64_t cost = 0;
};

inline bool operator==(const Record& lhs, const Record& rhs) {
  return lhs.original_string == rhs.original_string
      && lhs.fingerprint == rhs.fingerprint
      && lhs.created_at == rhs.created_at
      && lhs.owner == rhs.owner
      && lhs.cost == rhs.cost;
}

inline bool operator!=(const Record& lhs, const Record& rhs) {
  return !(lhs == rhs);
}

} // namespace record
} // namespace oracle

#endif // ORACLE_RECORD_RECORD_HPP
