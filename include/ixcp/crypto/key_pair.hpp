#pragma once

#include "ixcp/core/encoding.hpp"
#include "ixcp/core/result.hpp"

#include <openssl/evp.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ixcp::crypto {

/**
 * @brief Receiver public key as seen by a client
 *
 * Copies share the underlying EVP_PKEY. key_id() is the lowercase hex of
 * the first 16 bytes of SHA-256 over the DER SubjectPublicKeyInfo, so both
 * sides derive the same id from the same key.
 */
class PublicKey {
public:
    static Result<PublicKey> from_pem(std::string_view pem);

    Result<std::string> to_pem() const;

    const std::string& key_id() const noexcept { return key_id_; }
    EVP_PKEY* get() const noexcept { return key_.get(); }

private:
    friend class KeyPair;
    PublicKey(std::shared_ptr<EVP_PKEY> key, std::string key_id);

    std::shared_ptr<EVP_PKEY> key_;
    std::string key_id_;
};

/**
 * @brief RSA key pair held by the receiver
 *
 * The private half never leaves the process except through save(), which
 * writes an unencrypted PKCS#8 PEM readable only by the owner.
 */
class KeyPair {
public:
    static Result<KeyPair> generate(int bits = 2048);
    static Result<KeyPair> from_private_pem(std::string_view pem);
    static Result<KeyPair> load(const std::filesystem::path& path);

    /// Load @p path, or generate a key of @p bits and save it there.
    static Result<KeyPair> load_or_generate(const std::filesystem::path& path, int bits);

    Result<void> save(const std::filesystem::path& path) const;
    Result<std::string> private_pem() const;

    const PublicKey& public_key() const noexcept { return public_key_; }
    const std::string& key_id() const noexcept { return public_key_.key_id(); }
    EVP_PKEY* private_key() const noexcept { return key_.get(); }

private:
    KeyPair(std::shared_ptr<EVP_PKEY> key, PublicKey public_key);

    static Result<KeyPair> from_pkey(EVP_PKEY* raw);

    std::shared_ptr<EVP_PKEY> key_;
    PublicKey public_key_;
};

/// Key id of @p key (public part only).
Result<std::string> compute_key_id(EVP_PKEY* key);

/// Most recent OpenSSL error queue entry as text.
std::string openssl_error();

} // namespace ixcp::crypto
