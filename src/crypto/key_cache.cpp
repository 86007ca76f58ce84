#include "ixcp/crypto/key_cache.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ixcp::crypto {
namespace {

constexpr const char* kTable = "key_cache";
constexpr const char* kEntryKey = "receiver";

std::int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

PublicKeyCache::PublicKeyCache(std::chrono::seconds ttl, storage::KeyValueStore* store, NowFn now)
    : ttl_(ttl), store_(store), now_(std::move(now)) {}

bool PublicKeyCache::fresh(const CachedPublicKey& entry) const {
    return now_() < entry.expires_at;
}

std::optional<CachedPublicKey> PublicKeyCache::peek() const {
    std::lock_guard lock(mutex_);
    if (entry_ && fresh(*entry_)) {
        return entry_;
    }
    return std::nullopt;
}

Result<CachedPublicKey> PublicKeyCache::get(const PublicKeyFetcher& fetcher) {
    std::lock_guard lock(mutex_);

    if (entry_ && fresh(*entry_)) {
        return Ok(*entry_);
    }

    if (!entry_) {
        if (auto persisted = load_persisted(); persisted && fresh(*persisted)) {
            spdlog::debug("Using persisted receiver key {}", persisted->key_id);
            entry_ = persisted;
            return Ok(*entry_);
        }
    }

    auto fetched = fetcher();
    if (fetched.is_error()) {
        return Err<CachedPublicKey>(fetched.error());
    }

    auto key = PublicKey::from_pem(fetched.value().pem);
    if (key.is_error()) {
        return Err<CachedPublicKey>(ErrorCode::ProtocolError,
            "Receiver returned an unusable public key: " + key.error().message);
    }
    if (!fetched.value().key_id.empty() && fetched.value().key_id != key.value().key_id()) {
        spdlog::warn("Receiver announced key id {} but the key hashes to {}",
                     fetched.value().key_id, key.value().key_id());
    }

    const auto now = now_();
    CachedPublicKey entry{key.value().key_id(), key.value(), now, now + ttl_};
    persist(entry, fetched.value().pem);
    entry_ = entry;

    spdlog::debug("Fetched receiver key {}", entry.key_id);
    return Ok(std::move(entry));
}

void PublicKeyCache::invalidate() {
    std::lock_guard lock(mutex_);
    entry_.reset();
    if (store_) {
        if (auto removed = store_->remove(kTable, kEntryKey); removed.is_error()) {
            spdlog::warn("Could not drop persisted receiver key: {}", removed.error().message);
        }
    }
}

std::optional<CachedPublicKey> PublicKeyCache::load_persisted() const {
    if (!store_) {
        return std::nullopt;
    }

    auto stored = store_->get(kTable, kEntryKey);
    if (stored.is_error()) {
        spdlog::warn("Could not read persisted receiver key: {}", stored.error().message);
        return std::nullopt;
    }
    if (!stored.value()) {
        return std::nullopt;
    }

    try {
        const auto doc = nlohmann::json::parse(*stored.value());
        auto key = PublicKey::from_pem(doc.at("publicKey").get<std::string>());
        if (key.is_error()) {
            spdlog::warn("Ignoring persisted receiver key: {}", key.error().message);
            return std::nullopt;
        }
        return CachedPublicKey{key.value().key_id(), key.value(),
                               from_millis(doc.at("fetchedAt").get<std::int64_t>()),
                               from_millis(doc.at("expiresAt").get<std::int64_t>())};
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed persisted receiver key: {}", e.what());
        return std::nullopt;
    }
}

void PublicKeyCache::persist(const CachedPublicKey& entry, const std::string& pem) {
    if (!store_) {
        return;
    }
    nlohmann::json doc {
        {"keyId", entry.key_id},
        {"publicKey", pem},
        {"fetchedAt", to_millis(entry.fetched_at)},
        {"expiresAt", to_millis(entry.expires_at)},
    };
    if (auto saved = store_->put(kTable, kEntryKey, doc.dump()); saved.is_error()) {
        spdlog::warn("Could not persist receiver key: {}", saved.error().message);
    }
}

} // namespace ixcp::crypto
