#ifndef ORACLE_FINGERPRINT_HPP
#define ORACLE_FINGERPRINT_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace oracle::fingerprint {

static constexpr std::size_t FINGERPRINT_SIZE = 16;

using Fingerprint = std::array<uint8_t, FINGERPRINT_SIZE>;

// FNV-1a seeded mixing digest. Not MD5 and not cryptographic: every issuer
// and verifier must produce the same 16 bytes for the same input.
Fingerprint compute(const uint8_t* data, std::size_t size);
Fingerprint compute(const std::string& data);

// 32 lowercase hex characters
std::string to_hex(const Fingerprint& fingerprint);
// Returns false unless the input is exactly 32 hex characters
bool from_hex(const std::string& hex, Fingerprint& out);

} // namespace oracle::fingerprint

#endif // ORACLE_FINGERPRINT_HPP
