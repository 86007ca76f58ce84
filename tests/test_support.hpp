#pragma once

#include "ixcp/core/encoding.hpp"
#include "ixcp/crypto/key_pair.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

namespace ixcp::test {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& label = "ixcp_test") {
        static std::atomic<std::uint64_t> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (label + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline Bytes read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Deterministic payload: byte i is (seed + i) mod 251.
inline Bytes pattern_bytes(std::size_t size, std::uint8_t seed = 0) {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>((seed + i) % 251);
    }
    return out;
}

/// RSA-2048 pair shared across a test binary; generation is slow.
inline const crypto::KeyPair& shared_key_pair() {
    static const crypto::KeyPair key = [] {
        auto generated = crypto::KeyPair::generate(2048);
        if (generated.is_error()) {
            ADD_FAILURE() << generated.error().describe();
            std::abort();
        }
        return std::move(generated.value());
    }();
    return key;
}

/// A second, unrelated pair for wrong-key cases.
inline const crypto::KeyPair& other_key_pair() {
    static const crypto::KeyPair key = [] {
        auto generated = crypto::KeyPair::generate(2048);
        if (generated.is_error()) {
            ADD_FAILURE() << generated.error().describe();
            std::abort();
        }
        return std::move(generated.value());
    }();
    return key;
}

} // namespace ixcp::test
