#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/crypto/envelope_crypto.hpp"
#include "ixcp/events/event_bus.hpp"
#include "ixcp/storage/kv_store.hpp"
#include "ixcp/transfer/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ixcp::transfer {

/**
 * @brief Receiver-side encryption context of one upload stream
 *
 * Lifecycle: Open → Receiving → Finalized, and any state → Failed.
 * Finalized and Failed are terminal. Not thread-safe on its own;
 * TransferSessionManager serializes transitions.
 */
class TransferSession {
public:
    TransferSession(TransferSessionInfo info, crypto::SessionKey key);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] const crypto::SessionKey& key() const noexcept { return key_; }

    Result<void> transition_to(SessionState next_state);

    /// False when @p file_key was already recorded.
    bool add_file_key(const std::string& file_key);
    [[nodiscard]] bool carries(const std::string& file_key) const noexcept {
        return info_.file_keys.count(file_key) != 0;
    }
    Result<void> mark_failed(std::string error_message);

    /// True when a packet carries the same wrapped key this session was opened with.
    [[nodiscard]] bool matches(const std::string& key_id, const Bytes& wrapped_key) const noexcept;

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    TransferSessionInfo info_;
    crypto::SessionKey key_;
    std::chrono::system_clock::time_point last_transition_{};
};

/// Resolves a receiver key id to its key pair; nullptr when unknown.
using KeyPairLookup = std::function<const crypto::KeyPair*(const std::string& key_id)>;

/**
 * @brief Creates, restores and closes receiver sessions
 *
 * The first packet of an unknown session id opens it: the wrapped key is
 * unwrapped with the private key named by the packet's key id, and
 * {sessionId, keyId, wrappedKey, createdAt} is stored in the "sessions"
 * table. The plaintext key only lives in memory. After a restart the
 * session is rebuilt from the stored wrapped key on its next packet.
 *
 * A packet whose wrapped key differs from the one recorded for its session
 * is refused with KeyUnwrapFailure.
 *
 * Each session remembers the files it delivered chunks for, so finalizing
 * or deleting a file closes every session that carried it, including
 * sessions of abandoned runs and sessions only present in the store.
 */
class TransferSessionManager {
public:
    static constexpr const char* kSessionsTable = "sessions";
    static constexpr std::size_t kMaxSessionIdLength = 128;

    TransferSessionManager(storage::KeyValueStore& store,
                           KeyPairLookup keys,
                           events::EventBus* bus = nullptr);

    /// A non-empty @p file_key is recorded on the session (and persisted) if new.
    Result<std::shared_ptr<TransferSession>> open_or_resume(const std::string& session_id,
                                                            const std::string& key_id,
                                                            const Bytes& wrapped_key,
                                                            const std::string& file_key = {});

    /// Open → Receiving after the first accepted chunk; no-op afterwards.
    Result<void> mark_receiving(const std::string& session_id);

    /**
     * @brief Move the session to Finalized (or Failed) and forget it
     *
     * Unknown session ids are ignored, a finalize may legitimately arrive
     * for a session that never sent a packet.
     */
    Result<void> close(const std::string& session_id, SessionState final_state = SessionState::Finalized,
                       std::string error_message = {});

    /// Close every session, live or stored, that carried @p file_key. Returns how many.
    Result<std::size_t> close_for_file(const std::string& file_key,
                                       SessionState final_state = SessionState::Finalized);

    std::shared_ptr<TransferSession> find(const std::string& session_id) const;
    std::size_t active_count() const;

private:
    Result<std::optional<TransferSessionInfo>> load_record(const std::string& session_id) const;
    Result<void> save_record(const TransferSessionInfo& info);
    Result<void> close_unlocked(const std::string& session_id, SessionState final_state,
                                std::string error_message);

    storage::KeyValueStore& store_;
    KeyPairLookup keys_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<TransferSession>> sessions_;
};

} // namespace ixcp::transfer
