#ifndef ORACLE_LOOKUP_CACHE_HPP
#define ORACLE_LOOKUP_CACHE_HPP

#include <mutex>
#include <set>
#include "fingerprint/fingerprint.hpp"

namespace oracle {

// Fingerprints anchored by this process since it started (or since clear()).
// A negative filter only: absence says "not stored by us this session", never
// "not on the ledger". Owned by the caller and shared by reference.
class LookupCache {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    LookupCache() = default;
    ~LookupCache() = default;

    LookupCache(const LookupCache&) = delete;
    LookupCache& operator=(const LookupCache&) = delete;


    // ---- CACHE CONTROL METHODS ----
    // Returns false if the fingerprint was already present
    bool insert(const fingerprint::Fingerprint& fingerprint);
    // Forgets everything, as a restart would
    void clear();


    // ---- QUERY METHODS ----
    bool contains(const fingerprint::Fingerprint& fingerprint) const;
    std::size_t size() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::set<fingerprint::Fingerprint> fingerprints_;
};

} // namespace oracle

#endif // ORACLE_LOOKUP_CACHE_HPP
