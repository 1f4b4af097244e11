// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace ferry {

struct Version {
    std::uint32_t major;
    std::uint32_t minor;
    std::uint32_t patch;

    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}.{}.{}", major, minor, patch);
    }
};

inline constexpr Version version{0, 1, 0};

// Sent with every request, e.g. "ferry/0.1.0"
constexpr std::string_view USER_AGENT_PREFIX = "ferry/";

[[nodiscard]] inline std::string user_agent() {
    return fmt::format("{}{}", USER_AGENT_PREFIX, version.to_string());
}

} // namespace ferry
