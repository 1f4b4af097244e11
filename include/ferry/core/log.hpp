// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace ferry::core::log {

// Shared "ferry" logger, colour stdout sink, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Set the level and optionally add a file sink. Safe to call more than once.
void init(spdlog::level::level_enum level, const std::string& file_path = {});

// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name) noexcept;

} // namespace ferry::core::log
