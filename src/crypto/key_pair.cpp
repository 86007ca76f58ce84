#include "ixcp/crypto/key_pair.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <sstream>

namespace ixcp::crypto {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kKeyIdBytes = 16;

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::shared_ptr<EVP_PKEY> share(EVP_PKEY* raw) {
    return std::shared_ptr<EVP_PKEY>(raw, EVP_PKEY_free);
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    const long size = BIO_get_mem_data(bio, &data);
    if (size <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(size));
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<std::string>(ErrorCode::IoFailure, "Cannot open key file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return Ok(buffer.str());
}

} // namespace

std::string openssl_error() {
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

Result<std::string> compute_key_id(EVP_PKEY* key) {
    if (key == nullptr) {
        return Err<std::string>(ErrorCode::InvalidArgument, "No key");
    }
    unsigned char* der = nullptr;
    const int length = i2d_PUBKEY(key, &der);
    if (length <= 0 || der == nullptr) {
        return Err<std::string>(ErrorCode::CryptoFailure, "DER encoding failed: " + openssl_error());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    const int ok = EVP_Digest(der, static_cast<std::size_t>(length), digest.data(), &digest_length,
                              EVP_sha256(), nullptr);
    OPENSSL_free(der);
    if (ok != 1 || digest_length < kKeyIdBytes) {
        return Err<std::string>(ErrorCode::CryptoFailure, "SHA-256 failed: " + openssl_error());
    }
    return Ok(hex_encode(digest.data(), kKeyIdBytes));
}

// ────────────────────────────────────────────────────────────
// PublicKey
// ────────────────────────────────────────────────────────────

PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> key, std::string key_id)
    : key_(std::move(key)), key_id_(std::move(key_id)) {}

Result<PublicKey> PublicKey::from_pem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Err<PublicKey>(ErrorCode::CryptoFailure, "BIO allocation failed");
    }
    EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
        return Err<PublicKey>(ErrorCode::InvalidArgument, "Not a PEM public key: " + openssl_error());
    }
    auto key = share(raw);
    if (EVP_PKEY_base_id(raw) != EVP_PKEY_RSA) {
        return Err<PublicKey>(ErrorCode::InvalidArgument, "Public key is not RSA");
    }

    auto key_id = compute_key_id(raw);
    if (key_id.is_error()) {
        return Err<PublicKey>(key_id.error());
    }
    return Ok(PublicKey(std::move(key), std::move(key_id.value())));
}

Result<std::string> PublicKey::to_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        return Err<std::string>(ErrorCode::CryptoFailure, "PEM export failed: " + openssl_error());
    }
    return Ok(bio_to_string(bio.get()));
}

// ────────────────────────────────────────────────────────────
// KeyPair
// ────────────────────────────────────────────────────────────

KeyPair::KeyPair(std::shared_ptr<EVP_PKEY> key, PublicKey public_key)
    : key_(std::move(key)), public_key_(std::move(public_key)) {}

Result<KeyPair> KeyPair::from_pkey(EVP_PKEY* raw) {
    auto key = share(raw);
    if (EVP_PKEY_base_id(raw) != EVP_PKEY_RSA) {
        return Err<KeyPair>(ErrorCode::InvalidArgument, "Private key is not RSA");
    }
    auto key_id = compute_key_id(raw);
    if (key_id.is_error()) {
        return Err<KeyPair>(key_id.error());
    }
    PublicKey public_key(key, std::move(key_id.value()));
    return Ok(KeyPair(std::move(key), std::move(public_key)));
}

Result<KeyPair> KeyPair::generate(int bits) {
    if (bits < 2048) {
        return Err<KeyPair>(ErrorCode::InvalidArgument, "RSA keys shorter than 2048 bits are refused");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx
        || EVP_PKEY_keygen_init(ctx.get()) != 1
        || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) {
        return Err<KeyPair>(ErrorCode::CryptoFailure, "RSA keygen setup failed: " + openssl_error());
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr) {
        return Err<KeyPair>(ErrorCode::CryptoFailure, "RSA keygen failed: " + openssl_error());
    }
    return from_pkey(raw);
}

Result<KeyPair> KeyPair::from_private_pem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Err<KeyPair>(ErrorCode::CryptoFailure, "BIO allocation failed");
    }
    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
        return Err<KeyPair>(ErrorCode::InvalidArgument, "Not a PEM private key: " + openssl_error());
    }
    return from_pkey(raw);
}

Result<KeyPair> KeyPair::load(const fs::path& path) {
    auto pem = read_file(path);
    if (pem.is_error()) {
        return Err<KeyPair>(pem.error());
    }
    return from_private_pem(pem.value());
}

Result<KeyPair> KeyPair::load_or_generate(const fs::path& path, int bits) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto loaded = load(path);
        if (loaded.is_ok()) {
            spdlog::info("Loaded receiver key {} from {}", loaded.value().key_id(), path.string());
        }
        return loaded;
    }

    spdlog::info("Generating {}-bit receiver key at {}", bits, path.string());
    auto generated = generate(bits);
    if (generated.is_error()) {
        return generated;
    }
    if (auto saved = generated.value().save(path); saved.is_error()) {
        return Err<KeyPair>(saved.error());
    }
    return generated;
}

Result<std::string> KeyPair::private_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return Err<std::string>(ErrorCode::CryptoFailure, "PEM export failed: " + openssl_error());
    }
    return Ok(bio_to_string(bio.get()));
}

Result<void> KeyPair::save(const fs::path& path) const {
    auto pem = private_pem();
    if (pem.is_error()) {
        return Err<void>(pem.error());
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorCode::IoFailure, "Cannot write key file: " + tmp.string());
        }
        out << pem.value();
        if (!out) {
            return Err<void>(ErrorCode::IoFailure, "Short write to key file: " + tmp.string());
        }
    }
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    fs::rename(tmp, path, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoFailure, "Cannot move key file into place: " + ec.message());
    }
    return Ok();
}

} // namespace ixcp::crypto
