#include "ixcp/transfer/session.hpp"

#include "ixcp/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <unordered_map>
#include <vector>

namespace ixcp::transfer {
namespace {

using json = nlohmann::json;

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Open, {SessionState::Receiving, SessionState::Finalized}},
        {SessionState::Receiving, {SessionState::Finalized}},
    };

    if (target == SessionState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

std::int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Result<void> validate_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > TransferSessionManager::kMaxSessionIdLength
        || !storage::is_valid_key_component(session_id)) {
        return Err<void>(ErrorCode::InvalidArgument, "Invalid session id");
    }
    return Ok();
}

Result<TransferSessionInfo> decode_record(const std::string& text) {
    try {
        const auto doc = json::parse(text);
        auto wrapped = base64_decode(doc.at("wrappedKey").get<std::string>());
        if (wrapped.is_error()) {
            return Err<TransferSessionInfo>(ErrorCode::StorageFailure,
                                            "Corrupt session record: " + wrapped.error().message);
        }

        TransferSessionInfo info;
        info.session_id = doc.at("sessionId").get<std::string>();
        info.key_id = doc.at("keyId").get<std::string>();
        info.wrapped_key = std::move(wrapped.value());
        info.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(doc.at("createdAt").get<std::int64_t>()));
        if (doc.contains("fileKeys")) {
            info.file_keys = doc.at("fileKeys").get<std::set<std::string>>();
        }
        return Ok(std::move(info));
    } catch (const json::exception& e) {
        return Err<TransferSessionInfo>(ErrorCode::StorageFailure, std::string("Corrupt session record: ") + e.what());
    }
}

} // namespace

// ────────────────────────────────────────────────────────────
// TransferSession
// ────────────────────────────────────────────────────────────

TransferSession::TransferSession(TransferSessionInfo info, crypto::SessionKey key)
    : info_(std::move(info)), key_(std::move(key)) {
    last_transition_ = std::chrono::system_clock::now();
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::ProtocolError,
            std::string("Illegal session transition ") + to_string(info_.state) + " -> " + to_string(next_state));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != SessionState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    if (info_.state == SessionState::Finalized) {
        return Err<void>(ErrorCode::ProtocolError, "Session already finalized");
    }
    info_.last_error = std::move(error_message);
    return transition_to(SessionState::Failed);
}

bool TransferSession::add_file_key(const std::string& file_key) {
    return info_.file_keys.insert(file_key).second;
}

bool TransferSession::matches(const std::string& key_id, const Bytes& wrapped_key) const noexcept {
    return info_.key_id == key_id && info_.wrapped_key == wrapped_key;
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == SessionState::Failed || info_.state == SessionState::Finalized) {
        return false;
    }

    return is_progressive(info_.state, target);
}

// ────────────────────────────────────────────────────────────
// TransferSessionManager
// ────────────────────────────────────────────────────────────

TransferSessionManager::TransferSessionManager(storage::KeyValueStore& store,
                                               KeyPairLookup keys,
                                               events::EventBus* bus)
    : store_(store), keys_(std::move(keys)), bus_(bus) {}

Result<std::optional<TransferSessionInfo>> TransferSessionManager::load_record(const std::string& session_id) const {
    using MaybeInfo = std::optional<TransferSessionInfo>;

    auto stored = store_.get(kSessionsTable, session_id);
    if (stored.is_error()) {
        return Err<MaybeInfo>(stored.error());
    }
    if (!stored.value()) {
        return Ok(MaybeInfo{});
    }

    auto info = decode_record(*stored.value());
    if (info.is_error()) {
        return Err<MaybeInfo>(info.error());
    }
    return Ok(MaybeInfo(std::move(info.value())));
}

Result<void> TransferSessionManager::save_record(const TransferSessionInfo& info) {
    json doc {
        {"sessionId", info.session_id},
        {"keyId", info.key_id},
        {"wrappedKey", base64_encode(info.wrapped_key)},
        {"createdAt", to_millis(info.created_at)},
        {"fileKeys", info.file_keys},
    };
    return store_.put(kSessionsTable, info.session_id, doc.dump());
}

Result<std::shared_ptr<TransferSession>> TransferSessionManager::open_or_resume(const std::string& session_id,
                                                                                const std::string& key_id,
                                                                                const Bytes& wrapped_key,
                                                                                const std::string& file_key) {
    using SessionPtr = std::shared_ptr<TransferSession>;

    if (auto valid = validate_session_id(session_id); valid.is_error()) {
        return Err<SessionPtr>(valid.error());
    }

    std::lock_guard lock(mutex_);

    if (auto it = sessions_.find(session_id); it != sessions_.end()) {
        if (!it->second->matches(key_id, wrapped_key)) {
            return Err<SessionPtr>(ErrorCode::KeyUnwrapFailure,
                "Wrapped key differs from the one recorded for session " + session_id);
        }
        if (!file_key.empty() && it->second->add_file_key(file_key)) {
            if (auto saved = save_record(it->second->info()); saved.is_error()) {
                return Err<SessionPtr>(saved.error());
            }
        }
        return Ok(it->second);
    }

    auto record = load_record(session_id);
    if (record.is_error()) {
        return Err<SessionPtr>(record.error());
    }

    const bool restored = record.value().has_value();
    TransferSessionInfo info;
    if (restored) {
        info = std::move(*record.value());
        if (info.key_id != key_id || info.wrapped_key != wrapped_key) {
            return Err<SessionPtr>(ErrorCode::KeyUnwrapFailure,
                "Wrapped key differs from the one recorded for session " + session_id);
        }
    } else {
        info.session_id = session_id;
        info.key_id = key_id;
        info.wrapped_key = wrapped_key;
        info.created_at = std::chrono::system_clock::now();
    }

    const crypto::KeyPair* key_pair = keys_ ? keys_(info.key_id) : nullptr;
    if (key_pair == nullptr) {
        return Err<SessionPtr>(ErrorCode::KeyUnwrapFailure, "Unknown receiver key id: " + info.key_id);
    }

    auto key = crypto::unwrap_session_key(*key_pair, info.wrapped_key);
    if (key.is_error()) {
        return Err<SessionPtr>(key.error());
    }

    const bool new_file = !file_key.empty() && info.file_keys.insert(file_key).second;
    if (!restored || new_file) {
        if (auto saved = save_record(info); saved.is_error()) {
            return Err<SessionPtr>(saved.error());
        }
    }

    auto session = std::make_shared<TransferSession>(std::move(info), std::move(key.value()));
    sessions_[session_id] = session;

    if (bus_) {
        bus_->emit(events::SessionOpenedEvent{session_id, key_id, restored});
    }
    return Ok(std::move(session));
}

Result<void> TransferSessionManager::mark_receiving(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>(ErrorCode::NotFound, "Unknown session " + session_id);
    }
    return it->second->transition_to(SessionState::Receiving);
}

Result<void> TransferSessionManager::close(const std::string& session_id, SessionState final_state,
                                           std::string error_message) {
    if (final_state != SessionState::Finalized && final_state != SessionState::Failed) {
        return Err<void>(ErrorCode::InvalidArgument, "Sessions close as finalized or failed");
    }

    std::lock_guard lock(mutex_);
    return close_unlocked(session_id, final_state, std::move(error_message));
}

Result<void> TransferSessionManager::close_unlocked(const std::string& session_id, SessionState final_state,
                                                    std::string error_message) {
    if (auto it = sessions_.find(session_id); it != sessions_.end()) {
        auto& session = it->second;
        auto moved = final_state == SessionState::Failed ? session->mark_failed(std::move(error_message))
                                                         : session->transition_to(SessionState::Finalized);
        if (moved.is_error()) {
            spdlog::warn("Closing session {}: {}", session_id, moved.error().message);
        }
        sessions_.erase(it);
    }

    if (auto removed = store_.remove(kSessionsTable, session_id); removed.is_error()) {
        return removed;
    }

    if (bus_) {
        bus_->emit(events::SessionClosedEvent{session_id, to_string(final_state)});
    }
    return Ok();
}

Result<std::size_t> TransferSessionManager::close_for_file(const std::string& file_key, SessionState final_state) {
    if (final_state != SessionState::Finalized && final_state != SessionState::Failed) {
        return Err<std::size_t>(ErrorCode::InvalidArgument, "Sessions close as finalized or failed");
    }

    std::lock_guard lock(mutex_);

    std::set<std::string> doomed;
    for (const auto& [id, session] : sessions_) {
        if (session->carries(file_key)) {
            doomed.insert(id);
        }
    }

    // Sessions of earlier runs may only exist in the store.
    auto stored = store_.scan(kSessionsTable, "");
    if (stored.is_error()) {
        return Err<std::size_t>(stored.error());
    }
    for (const auto& [id, text] : stored.value()) {
        auto info = decode_record(text);
        if (info.is_error()) {
            spdlog::warn("Skipping session {}: {}", id, info.error().message);
            continue;
        }
        if (info.value().file_keys.count(file_key) != 0) {
            doomed.insert(id);
        }
    }

    for (const auto& id : doomed) {
        if (auto closed = close_unlocked(id, final_state, "file " + file_key + " closed"); closed.is_error()) {
            return Err<std::size_t>(closed.error());
        }
    }
    if (!doomed.empty()) {
        spdlog::debug("Closed {} session(s) that carried {}", doomed.size(), file_key);
    }
    return Ok(doomed.size());
}

std::shared_ptr<TransferSession> TransferSessionManager::find(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::size_t TransferSessionManager::active_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

} // namespace ixcp::transfer
