#include "fingerprint/fingerprint.hpp"
#include "core/types.hpp"
#include <algorithm>

namespace oracle::fingerprint {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

} // namespace

Fingerprint compute(const uint8_t* data, std::size_t size) {
  Fingerprint buf;
  for (std::size_t i = 0; i < FINGERPRINT_SIZE; ++i) {
    buf[i] = static_cast<uint8_t>(i);
  }

  uint64_t acc = FNV_OFFSET_BASIS;
  for (std::size_t n = 0; n < size; ++n) {
    const uint8_t b = data[n];
    acc ^= b;
    acc *= FNV_PRIME;  // wraps mod 2^64

    const std::size_t idx = static_cast<std::size_t>(acc % FINGERPRINT_SIZE);
    buf[idx] = static_cast<uint8_t>(buf[idx] + b);
    buf[(idx + 1) % FINGERPRINT_SIZE] ^= static_cast<uint8_t>(acc >> 8);
    buf[(idx + 3) % FINGERPRINT_SIZE] ^= static_cast<uint8_t>(acc >> 16);
    buf[(idx + 7) % FINGERPRINT_SIZE] ^= static_cast<uint8_t>(acc >> 24);
  }

  return buf;
}

Fingerprint compute(const std::string& data) {
  return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string to_hex(const Fingerprint& fingerprint) {
  return oracle::to_hex(fingerprint.data(), fingerprint.size());
}

bool from_hex(const std::string& hex, Fingerprint& out) {
  Bytes raw;
  if (!oracle::from_hex(hex, raw) || raw.size() != FINGERPRINT_SIZE) {
    return false;
  }
  std::copy(raw.begin(), raw.end(), out.begin());
  return true;
}

} // namespace oracle::fingerprint
