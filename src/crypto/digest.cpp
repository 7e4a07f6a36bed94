#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace oracle::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize SHA-256 context";
    throw DigestError("Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;


//==============================================
// HASHING
//==============================================

Sha256& Sha256::update(const void* data, size_t size) {
  if (finalized_) {
    throw DigestError("Update after finalize");
  }
  if (size == 0) {
    return *this;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update hash with " << size << " bytes";
    throw DigestError("Failed to update hash");
  }
  return *this;
}

Sha256& Sha256::update(const std::string& data) {
  return update(data.data(), data.size());
}

Sha256::Digest Sha256::finalize() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len) || hash_len != DIGEST_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize hash";
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  Digest digest;
  std::copy(hash, hash + DIGEST_SIZE, digest.begin());
  return digest;
}

Sha256::Digest Sha256::hash(const std::string& data) {
  Sha256 sha;
  sha.update(data);
  return sha.finalize();
}

} // namespace oracle::crypto
