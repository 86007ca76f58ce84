#include "ixcp/core/encoding.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>

namespace ixcp {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string hex_encode(const std::uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

Result<Bytes> hex_decode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::InvalidArgument, "hex string has odd length");
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(ErrorCode::InvalidArgument, "invalid hex digit");
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return Ok(std::move(bytes));
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Result<Bytes> base64_decode(std::string_view text) {
    if (text.empty()) {
        return Ok(Bytes{});
    }
    if (text.size() % 4 != 0) {
        return Err<Bytes>(ErrorCode::InvalidArgument, "base64 length is not a multiple of 4");
    }
    Bytes out(3 * text.size() / 4);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return Err<Bytes>(ErrorCode::InvalidArgument, "invalid base64 input");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return Ok(std::move(out));
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ != nullptr && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (ok_ && size > 0) {
        ok_ = EVP_DigestUpdate(ctx_, data, size) == 1;
    }
}

Result<std::string> Sha256::finish_hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
        ok_ = false;
        return Err<std::string>(ErrorCode::CryptoFailure, "SHA-256 computation failed");
    }
    ok_ = false;
    return Ok(hex_encode(digest, length));
}

Result<std::string> sha256_hex(const Bytes& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish_hex();
}

Result<Bytes> random_bytes(std::size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return Err<Bytes>(ErrorCode::CryptoFailure, "RAND_bytes failed");
    }
    return Ok(std::move(out));
}

} // namespace ixcp
