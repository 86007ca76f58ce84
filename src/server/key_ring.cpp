#include "ixcp/server/key_ring.hpp"

#include <spdlog/spdlog.h>

namespace ixcp::server {

KeyRing::KeyRing(crypto::KeyPair current) {
    keys_.push_back(std::move(current));
}

void KeyRing::add_retired(crypto::KeyPair key) {
    if (find(key.key_id()) != nullptr) {
        spdlog::debug("Key {} already in ring", key.key_id());
        return;
    }
    keys_.push_back(std::move(key));
}

const crypto::KeyPair* KeyRing::find(const std::string& key_id) const {
    for (const auto& key : keys_) {
        if (key.key_id() == key_id) {
            return &key;
        }
    }
    return nullptr;
}

transfer::KeyPairLookup KeyRing::lookup() const {
    return [this](const std::string& key_id) { return find(key_id); };
}

} // namespace ixcp::server
