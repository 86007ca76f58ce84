#include "ixcp/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>

namespace ixcp {

Result<void> configure_logging(std::string_view level) {
    static const std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> levels {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

    for (const auto& [name, value] : levels) {
        if (name == level) {
            spdlog::set_level(value);
            spdlog::set_pattern(kLogPattern);
            return Ok();
        }
    }
    return Err<void>(ErrorCode::InvalidArgument, "Unknown log level: " + std::string(level));
}

} // namespace ixcp
