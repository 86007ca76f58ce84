#pragma once

#include "ixcp/crypto/key_pair.hpp"
#include "ixcp/storage/kv_store.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace ixcp::crypto {

/// Receiver answer to GET /public-key.
struct PublicKeyRecord {
    std::string key_id;
    std::string pem;
};

using PublicKeyFetcher = std::function<Result<PublicKeyRecord>()>;

struct CachedPublicKey {
    std::string key_id;
    PublicKey public_key;
    std::chrono::system_clock::time_point fetched_at;
    std::chrono::system_clock::time_point expires_at;
};

/**
 * @brief Short-lived cache of the receiver's public key
 *
 * get() returns the cached key until it expires, then calls the fetcher
 * again. A miss or an expired entry is never an error by itself; only a
 * failing fetch is. When a store is given the entry is also kept in the
 * "key_cache" table so a restarted client can skip the fetch.
 *
 * The cache is an explicit dependency of whoever wraps session keys, not a
 * process-wide singleton.
 */
class PublicKeyCache {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit PublicKeyCache(std::chrono::seconds ttl,
                            storage::KeyValueStore* store = nullptr,
                            NowFn now = [] { return Clock::now(); });

    Result<CachedPublicKey> get(const PublicKeyFetcher& fetcher);

    /// Drop the entry, e.g. after the receiver refused its key id.
    void invalidate();

    /// Current entry if present and unexpired; never fetches.
    std::optional<CachedPublicKey> peek() const;

private:
    bool fresh(const CachedPublicKey& entry) const;
    std::optional<CachedPublicKey> load_persisted() const;
    void persist(const CachedPublicKey& entry, const std::string& pem);

    std::chrono::seconds ttl_;
    storage::KeyValueStore* store_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::optional<CachedPublicKey> entry_;
};

} // namespace ixcp::crypto
