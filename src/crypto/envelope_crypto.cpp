#include "ixcp/crypto/envelope_crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <memory>

namespace ixcp::crypto {
namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

bool configure_oaep(EVP_PKEY_CTX* ctx) {
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) == 1
        && EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) == 1
        && EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) == 1;
}

} // namespace

// ────────────────────────────────────────────────────────────
// SessionKey
// ────────────────────────────────────────────────────────────

Result<SessionKey> SessionKey::generate() {
    auto bytes = random_bytes(kSessionKeySize);
    if (bytes.is_error()) {
        return Err<SessionKey>(bytes.error());
    }
    return Ok(SessionKey(std::move(bytes.value())));
}

Result<SessionKey> SessionKey::from_bytes(Bytes bytes) {
    if (bytes.size() != kSessionKeySize) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        return Err<SessionKey>(ErrorCode::InvalidArgument, "Session key must be 32 bytes");
    }
    return Ok(SessionKey(std::move(bytes)));
}

SessionKey::~SessionKey() {
    wipe();
}

SessionKey::SessionKey(SessionKey&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SessionKey& SessionKey::operator=(SessionKey&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

void SessionKey::wipe() noexcept {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
        bytes_.clear();
    }
}

// ────────────────────────────────────────────────────────────
// Nonce / associated data
// ────────────────────────────────────────────────────────────

Bytes derive_nonce(std::uint64_t sequence_index) {
    Bytes nonce(kNonceSize, 0);
    for (std::size_t i = 0; i < 8; ++i) {
        nonce[kNonceSize - 1 - i] = static_cast<std::uint8_t>(sequence_index >> (8 * i));
    }
    return nonce;
}

Bytes build_associated_data(const std::string& session_id, const std::string& file_key) {
    std::string aad(kAssociatedDataLabel);
    aad.push_back('\x1f');
    aad += session_id;
    aad.push_back('\x1f');
    aad += file_key;
    return to_bytes(aad);
}

// ────────────────────────────────────────────────────────────
// Key wrapping (RSA-OAEP, SHA-256 / MGF1-SHA-256)
// ────────────────────────────────────────────────────────────

Result<NewSessionKey> wrap_new_session_key(const PublicKey& receiver_key) {
    auto key = SessionKey::generate();
    if (key.is_error()) {
        return Err<NewSessionKey>(key.error());
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(receiver_key.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != 1 || !configure_oaep(ctx.get())) {
        return Err<NewSessionKey>(ErrorCode::CryptoFailure, "RSA-OAEP setup failed: " + openssl_error());
    }

    std::size_t out_length = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_length, key.value().data(), key.value().size()) != 1) {
        return Err<NewSessionKey>(ErrorCode::CryptoFailure, "RSA-OAEP sizing failed: " + openssl_error());
    }
    Bytes wrapped(out_length);
    if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_length, key.value().data(), key.value().size()) != 1) {
        return Err<NewSessionKey>(ErrorCode::CryptoFailure, "RSA-OAEP wrap failed: " + openssl_error());
    }
    wrapped.resize(out_length);

    return Ok(NewSessionKey{std::move(key.value()),
                            WrappedSessionKey{receiver_key.key_id(), std::move(wrapped)}});
}

Result<SessionKey> unwrap_session_key(const KeyPair& receiver_key, const Bytes& wrapped) {
    if (wrapped.empty()) {
        return Err<SessionKey>(ErrorCode::KeyUnwrapFailure, "Wrapped key is empty");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(receiver_key.private_key(), nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) != 1 || !configure_oaep(ctx.get())) {
        return Err<SessionKey>(ErrorCode::CryptoFailure, "RSA-OAEP setup failed: " + openssl_error());
    }

    std::size_t out_length = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_length, wrapped.data(), wrapped.size()) != 1) {
        return Err<SessionKey>(ErrorCode::KeyUnwrapFailure, "Wrapped key rejected: " + openssl_error());
    }
    Bytes plain(out_length);
    if (EVP_PKEY_decrypt(ctx.get(), plain.data(), &out_length, wrapped.data(), wrapped.size()) != 1) {
        OPENSSL_cleanse(plain.data(), plain.size());
        return Err<SessionKey>(ErrorCode::KeyUnwrapFailure, "Wrapped key rejected: " + openssl_error());
    }
    plain.resize(out_length);

    auto key = SessionKey::from_bytes(std::move(plain));
    if (key.is_error()) {
        return Err<SessionKey>(ErrorCode::KeyUnwrapFailure, "Unwrapped key has the wrong length");
    }
    return key;
}

// ────────────────────────────────────────────────────────────
// AES-256-GCM
// ────────────────────────────────────────────────────────────

Result<SealedChunk> encrypt_chunk(const SessionKey& key,
                                  std::uint64_t sequence_index,
                                  const Bytes& payload,
                                  const Bytes& associated_data) {
    if (key.size() != kSessionKeySize) {
        return Err<SealedChunk>(ErrorCode::InvalidArgument, "Session key is not initialised");
    }

    SealedChunk sealed;
    sealed.nonce = derive_nonce(sequence_index);
    sealed.ciphertext.resize(payload.size());
    sealed.auth_tag.resize(kAuthTagSize);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx
        || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.nonce.data()) != 1) {
        return Err<SealedChunk>(ErrorCode::CryptoFailure, "AES-GCM init failed: " + openssl_error());
    }

    int length = 0;
    if (!associated_data.empty()
        && EVP_EncryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                             static_cast<int>(associated_data.size())) != 1) {
        return Err<SealedChunk>(ErrorCode::CryptoFailure, "AES-GCM AAD failed: " + openssl_error());
    }

    int written = 0;
    if (!payload.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &length, payload.data(),
                              static_cast<int>(payload.size())) != 1) {
            return Err<SealedChunk>(ErrorCode::CryptoFailure, "AES-GCM encrypt failed: " + openssl_error());
        }
        written = length;
    }

    // GCM emits nothing on final; the scratch block keeps empty payloads valid
    std::uint8_t tail[16];
    if (EVP_EncryptFinal_ex(ctx.get(), tail, &length) != 1) {
        return Err<SealedChunk>(ErrorCode::CryptoFailure, "AES-GCM final failed: " + openssl_error());
    }
    sealed.ciphertext.resize(static_cast<std::size_t>(written));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAuthTagSize),
                            sealed.auth_tag.data()) != 1) {
        return Err<SealedChunk>(ErrorCode::CryptoFailure, "AES-GCM tag failed: " + openssl_error());
    }
    return Ok(std::move(sealed));
}

Result<Bytes> decrypt_chunk(const SessionKey& key,
                            const Bytes& nonce,
                            const Bytes& ciphertext,
                            const Bytes& auth_tag,
                            const Bytes& associated_data) {
    if (key.size() != kSessionKeySize) {
        return Err<Bytes>(ErrorCode::InvalidArgument, "Session key is not initialised");
    }
    if (nonce.size() != kNonceSize || auth_tag.size() != kAuthTagSize) {
        return Err<Bytes>(ErrorCode::AuthenticationFailure, "Nonce or tag has the wrong length");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx
        || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return Err<Bytes>(ErrorCode::CryptoFailure, "AES-GCM init failed: " + openssl_error());
    }

    int length = 0;
    if (!associated_data.empty()
        && EVP_DecryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                             static_cast<int>(associated_data.size())) != 1) {
        return Err<Bytes>(ErrorCode::CryptoFailure, "AES-GCM AAD failed: " + openssl_error());
    }

    Bytes plain(ciphertext.size());
    int written = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &length, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            return Err<Bytes>(ErrorCode::CryptoFailure, "AES-GCM decrypt failed: " + openssl_error());
        }
        written = length;
    }

    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer
    Bytes expected_tag = auth_tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAuthTagSize),
                            expected_tag.data()) != 1) {
        return Err<Bytes>(ErrorCode::CryptoFailure, "AES-GCM set tag failed: " + openssl_error());
    }

    std::uint8_t tail[16];
    if (EVP_DecryptFinal_ex(ctx.get(), tail, &length) != 1) {
        OPENSSL_cleanse(plain.data(), plain.size());
        return Err<Bytes>(ErrorCode::AuthenticationFailure, "Chunk authentication failed");
    }
    plain.resize(static_cast<std::size_t>(written));
    return Ok(std::move(plain));
}

} // namespace ixcp::crypto
