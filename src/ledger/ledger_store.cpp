#include "ledger/ledger_store.hpp"
#include "crypto/crypto_error.hpp"
#include <array>
#include <openssl/rand.h>

namespace oracle {
namespace ledger {

Address LedgerStore::derive_address(const Namespace& namespace_tag, const std::string& content) const {
  return ledger::derive_address(namespace_tag, content);
}

std::string make_transaction_id() {
  std::array<uint8_t, 32> raw;
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    throw crypto::CryptoError("Failed to generate transaction id");
  }
  return to_hex(raw.data(), raw.size());
}

} // namespace ledger
} // namespace oracle
