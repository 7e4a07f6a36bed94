#ifndef ORACLE_LEDGER_ADDRESS_HPP
#define ORACLE_LEDGER_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace oracle {
namespace ledger {

static constexpr std::size_t ADDRESS_SIZE = 32;

using Address = std::array<uint8_t, ADDRESS_SIZE>;

// Domain label mixed into every derivation, ahead of the namespace tag
static constexpr const char* ADDRESS_DOMAIN = "StringOracleAddress";

// SHA-256(ADDRESS_DOMAIN || u32le(len(tag)) || tag || content).
// Idempotent: the same (tag, content) always yields the same address.
Address derive_address(const Namespace& namespace_tag, const std::string& content);

// 64 lowercase hex characters
std::string address_to_hex(const Address& address);
// Empty unless the input is exactly 64 hex characters
std::optional<Address> address_from_hex(const std::string& hex);

} // namespace ledger
} // namespace oracle

#endif // ORACLE_LEDGER_ADDRESS_HPP
