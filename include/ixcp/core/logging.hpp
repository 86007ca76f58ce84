#pragma once

#include "ixcp/core/result.hpp"

#include <string_view>

namespace ixcp {

/// Pattern applied to the default spdlog logger.
inline constexpr const char* kLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Set the default logger's level and pattern
 *
 * Accepts trace, debug, info, warn, error, critical and off. Anything else
 * leaves the logger untouched and returns InvalidArgument.
 */
Result<void> configure_logging(std::string_view level);

} // namespace ixcp
