// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/job.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ferry::core {

// Sidecar stored next to a temp file (<final>.temp.meta). It records which
// remote content the partial bytes belong to, and per-segment progress.
struct ResumeMeta {
    std::string url;
    std::string validator;                       // empty: no validator known
    std::optional<std::uint64_t> total_size;
    bool segmented{false};
    std::vector<Segment> segments;               // segmented mode only

    // Partial bytes may be reused only for the same URL, validator and size
    [[nodiscard]] bool matches(std::string_view other_url,
                               std::string_view other_validator,
                               std::optional<std::uint64_t> other_total) const noexcept;

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] static std::expected<ResumeMeta, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] static bool exists(const std::filesystem::path& path) noexcept;

    // Delete the sidecar; a missing file is not an error
    [[nodiscard]] static std::error_code remove(const std::filesystem::path& path) noexcept;
};

} // namespace ferry::core
