#pragma once

#include "ixcp/crypto/key_pair.hpp"
#include "ixcp/transfer/session.hpp"

#include <string>
#include <vector>

namespace ixcp::server {

/**
 * @brief Receiver key pairs addressed by key id
 *
 * The current key is announced on GET /public-key. Retired keys stay
 * available for unwrapping so sessions opened before a rotation can finish.
 * Filled once at startup, read-only afterwards.
 */
class KeyRing {
public:
    explicit KeyRing(crypto::KeyPair current);

    void add_retired(crypto::KeyPair key);

    const crypto::KeyPair& current() const noexcept { return keys_.front(); }

    /// nullptr when @p key_id is not held.
    const crypto::KeyPair* find(const std::string& key_id) const;

    /// Adapter for TransferSessionManager; the ring must outlive it.
    transfer::KeyPairLookup lookup() const;

    std::size_t size() const noexcept { return keys_.size(); }

private:
    std::vector<crypto::KeyPair> keys_;  // front() is current
};

} // namespace ixcp::server
