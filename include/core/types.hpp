#ifndef ORACLE_CORE_TYPES_HPP
#define ORACLE_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace oracle {

using Bytes = std::vector<uint8_t>;

// Constant byte sequence that separates this application's keys from others
using Namespace = std::string;

// Point in time after which a ledger call must not start
using Deadline = std::chrono::steady_clock::time_point;

inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

inline bool deadline_passed(Deadline deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

// Lowercase hex rendering of a byte range
std::string to_hex(const uint8_t* data, std::size_t size);

// Parses lowercase or uppercase hex; returns false on odd length or non-hex input
bool from_hex(const std::string& hex, Bytes& out);

// Well-formed UTF-8: no overlong forms, surrogates or truncated sequences
bool is_valid_utf8(const char* data, std::size_t size);

} // namespace oracle

#endif // ORACLE_CORE_TYPES_HPP
