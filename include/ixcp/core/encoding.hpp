#pragma once

#include "ixcp/core/result.hpp"

#include <openssl/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ixcp {

using Bytes = std::vector<std::uint8_t>;

inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

inline std::string to_string(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

std::string hex_encode(const std::uint8_t* data, std::size_t size);
std::string hex_encode(const Bytes& data);
Result<Bytes> hex_decode(std::string_view hex);

std::string base64_encode(const Bytes& data);
Result<Bytes> base64_decode(std::string_view text);

/**
 * @brief Incremental SHA-256 over EVP_MD_CTX
 *
 * finish_hex() may be called once; later calls fail.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const std::uint8_t* data, std::size_t size);
    Result<std::string> finish_hex();

private:
    EVP_MD_CTX* ctx_;
    bool ok_ = false;
};

/// Lowercase hex SHA-256 of @p data.
Result<std::string> sha256_hex(const Bytes& data);

/// Cryptographically random bytes from the OpenSSL RNG.
Result<Bytes> random_bytes(std::size_t count);

} // namespace ixcp
