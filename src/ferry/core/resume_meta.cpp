// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/resume_meta.hpp>
#include <ferry/disk/error.hpp>
#include <ferry/disk/file_writer.hpp>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace ferry::core {

namespace {

// Simple line-based format:
//   url
//   validator (may be empty)
//   total size, or "-" when unknown
//   "single" | "segmented"
//   segment count
// then per segment: id start end written

constexpr std::string_view UNKNOWN_SIZE = "-";

bool parse_u64(std::string_view text, std::uint64_t& out) noexcept {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

bool ResumeMeta::matches(std::string_view other_url,
                         std::string_view other_validator,
                         std::optional<std::uint64_t> other_total) const noexcept {
    // Without a validator there is nothing to prove the bytes are still current
    if (validator.empty() || other_validator.empty()) {
        return false;
    }
    return url == other_url && validator == other_validator && total_size == other_total;
}

std::error_code ResumeMeta::save(const std::filesystem::path& path) const noexcept {
    try {
        // Create parent directories if they don't exist
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        // Written beside the sidecar and renamed over it: readers see the old
        // or the new progress, never a torn file
        auto staging = path;
        staging += ".part";

        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }

        file << url << '\n';
        file << validator << '\n';
        if (total_size) {
            file << *total_size << '\n';
        } else {
            file << UNKNOWN_SIZE << '\n';
        }
        file << (segmented ? "segmented" : "single") << '\n';
        file << segments.size() << '\n';

        for (const auto& seg : segments) {
            file << seg.id << ' '
                 << seg.start << ' '
                 << seg.end << ' '
                 << seg.written << '\n';
        }

        file.close();
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return disk::publish_file(staging, path);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<ResumeMeta, std::error_code>
ResumeMeta::load(const std::filesystem::path& path) noexcept {
    const auto corrupt = std::unexpected(make_error_code(disk::DiskErrc::read_error));

    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        ResumeMeta meta;
        std::string line;

        if (!std::getline(file, meta.url) || meta.url.empty()) return corrupt;
        if (!std::getline(file, meta.validator)) return corrupt;

        if (!std::getline(file, line)) return corrupt;
        if (line != UNKNOWN_SIZE) {
            std::uint64_t size = 0;
            if (!parse_u64(line, size)) return corrupt;
            meta.total_size = size;
        }

        if (!std::getline(file, line)) return corrupt;
        if (line == "segmented") {
            meta.segmented = true;
        } else if (line != "single") {
            return corrupt;
        }

        std::uint64_t seg_count = 0;
        if (!std::getline(file, line) || !parse_u64(line, seg_count)) return corrupt;

        meta.segments.reserve(static_cast<std::size_t>(seg_count));
        for (std::uint64_t i = 0; i < seg_count; ++i) {
            if (!std::getline(file, line)) return corrupt;

            Segment seg;
            std::istringstream iss(line);
            if (!(iss >> seg.id >> seg.start >> seg.end >> seg.written) || seg.end < seg.start) {
                return corrupt;
            }
            seg.written = std::min(seg.written, seg.size());
            seg.complete = seg.written == seg.size();
            meta.segments.push_back(seg);
        }

        return meta;
    } catch (const std::exception&) {
        return corrupt;
    }
}

bool ResumeMeta::exists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::error_code ResumeMeta::remove(const std::filesystem::path& path) noexcept {
    return disk::remove_file(path);
}

} // namespace ferry::core
