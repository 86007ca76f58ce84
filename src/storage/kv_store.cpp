#include "ixcp/storage/kv_store.hpp"

#include <cstdio>

namespace ixcp::storage {

bool is_valid_key_component(std::string_view component) noexcept {
    return !component.empty() && component.find(kKeySeparator) == std::string_view::npos;
}

std::string key_prefix(const std::string& owner) {
    std::string prefix = owner;
    prefix += kKeySeparator;
    return prefix;
}

std::string composite_key(const std::string& owner, std::uint32_t index) {
    char digits[11];
    std::snprintf(digits, sizeof(digits), "%010u", index);
    return key_prefix(owner) + digits;
}

Result<std::pair<std::string, std::uint32_t>> split_composite_key(const std::string& key) {
    using Parts = std::pair<std::string, std::uint32_t>;
    const auto pos = key.rfind(kKeySeparator);
    if (pos == std::string::npos || pos == 0 || key.size() - pos - 1 != 10) {
        return Err<Parts>(ErrorCode::InvalidArgument, "not a composite key");
    }
    std::uint64_t index = 0;
    for (std::size_t i = pos + 1; i < key.size(); ++i) {
        const char c = key[i];
        if (c < '0' || c > '9') {
            return Err<Parts>(ErrorCode::InvalidArgument, "composite key index is not numeric");
        }
        index = index * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (index > UINT32_MAX) {
        return Err<Parts>(ErrorCode::InvalidArgument, "composite key index out of range");
    }
    return Ok(Parts{key.substr(0, pos), static_cast<std::uint32_t>(index)});
}

} // namespace ixcp::storage
