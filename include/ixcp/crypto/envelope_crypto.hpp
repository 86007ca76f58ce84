#pragma once

/**
 * @file envelope_crypto.hpp
 * @brief Per-stream AES-256-GCM keys wrapped under the receiver's RSA key
 *
 * WHAT IT DOES:
 * - wrap_new_session_key(): fresh 256-bit key, RSA-OAEP(SHA-256) wrapped
 * - encrypt_chunk() / decrypt_chunk(): AES-256-GCM with a nonce derived
 *   from the chunk's sequence index and associated data binding the packet
 *   to one session and one file
 * - unwrap_session_key(): receiver side of the wrap
 *
 * NONCE LAYOUT (12 bytes):
 *   00 00 00 00 | sequence index, 8 bytes big-endian
 * A session key is used for exactly one file, and each index is encrypted
 * once per key, so (key, nonce) pairs never repeat. Re-encrypting the same
 * chunk for a retry yields the identical packet.
 *
 * ASSOCIATED DATA:
 *   "ixcp/v1" 0x1F <session id> 0x1F <file key>
 */

#include "ixcp/core/encoding.hpp"
#include "ixcp/core/result.hpp"
#include "ixcp/crypto/key_pair.hpp"

#include <cstdint>
#include <string>

namespace ixcp::crypto {

inline constexpr std::size_t kSessionKeySize = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kAuthTagSize = 16;
inline constexpr const char* kAssociatedDataLabel = "ixcp/v1";

/**
 * @brief Plaintext symmetric key, wiped on destruction
 *
 * Move-only so the bytes exist in exactly one place.
 */
class SessionKey {
public:
    static Result<SessionKey> generate();
    static Result<SessionKey> from_bytes(Bytes bytes);

    ~SessionKey();

    SessionKey(SessionKey&& other) noexcept;
    SessionKey& operator=(SessionKey&& other) noexcept;
    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;

    const std::uint8_t* data() const noexcept { return bytes_.data(); }
    std::size_t size() const noexcept { return bytes_.size(); }

private:
    explicit SessionKey(Bytes bytes) : bytes_(std::move(bytes)) {}
    void wipe() noexcept;

    Bytes bytes_;
};

struct WrappedSessionKey {
    std::string key_id;  // receiver key the session key was wrapped for
    Bytes wrapped;
};

struct NewSessionKey {
    SessionKey key;
    WrappedSessionKey wrapped;
};

struct SealedChunk {
    Bytes nonce;
    Bytes ciphertext;
    Bytes auth_tag;
};

Bytes derive_nonce(std::uint64_t sequence_index);

Bytes build_associated_data(const std::string& session_id, const std::string& file_key);

Result<NewSessionKey> wrap_new_session_key(const PublicKey& receiver_key);

/// KeyUnwrapFailure for malformed wrapped bytes or a key wrapped for someone else.
Result<SessionKey> unwrap_session_key(const KeyPair& receiver_key, const Bytes& wrapped);

Result<SealedChunk> encrypt_chunk(const SessionKey& key,
                                  std::uint64_t sequence_index,
                                  const Bytes& payload,
                                  const Bytes& associated_data);

/// AuthenticationFailure when the tag, nonce or associated data do not verify.
Result<Bytes> decrypt_chunk(const SessionKey& key,
                            const Bytes& nonce,
                            const Bytes& ciphertext,
                            const Bytes& auth_tag,
                            const Bytes& associated_data);

} // namespace ixcp::crypto
