#include "oracle/lookup_cache.hpp"
#include <boost/log/trivial.hpp>

namespace oracle {

bool LookupCache::insert(const fingerprint::Fingerprint& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = fingerprints_.insert(fingerprint).second;
    BOOST_LOG_TRIVIAL(debug) << "LookupCache: Inserted " << fingerprint::to_hex(fingerprint)
                             << ". Cache size: " << fingerprints_.size();
    return inserted;
}

void LookupCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    fingerprints_.clear();
    BOOST_LOG_TRIVIAL(info) << "LookupCache: Cleared";
}

bool LookupCache::contains(const fingerprint::Fingerprint& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fingerprints_.count(fingerprint) > 0;
}

std::size_t LookupCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fingerprints_.size();
}

} // namespace oracle
