#ifndef ORACLE_CRYPTO_DIGEST_HPP
#define ORACLE_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace oracle::crypto {

// Forward declaration for OpenSSL message digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING ----
  Sha256& update(const void* data, size_t size);
  Sha256& update(const std::string& data);
  // Produces the digest; the object cannot be updated afterwards
  Digest finalize();

  // One-shot helper
  static Digest hash(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace oracle::crypto

#endif // ORACLE_CRYPTO_DIGEST_HPP
