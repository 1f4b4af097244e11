// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace ferry::disk {

// Local I/O failures. All of them classify as local-io and are never retried.
enum class DiskErrc : std::uint8_t {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,          // ENOSPC, EDQUOT, EFBIG
    invalid_path,
    file_exists,
    already_open,       // open() on a writer that holds a descriptor
    not_open,           // I/O on a closed writer
    write_error,
    read_error,
    publish_failed,     // temp -> final rename
    allocation_failed,  // pre-sizing the temp file
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:           return "ok";
            case DiskErrc::file_not_found:    return "no such file";
            case DiskErrc::access_denied:     return "permission denied on output path";
            case DiskErrc::disk_full:         return "no space left for download";
            case DiskErrc::invalid_path:      return "invalid output path";
            case DiskErrc::file_exists:       return "path already exists";
            case DiskErrc::already_open:      return "writer already open";
            case DiskErrc::not_open:          return "writer not open";
            case DiskErrc::write_error:       return "write to temp file failed";
            case DiskErrc::read_error:        return "cannot inspect temp file";
            case DiskErrc::publish_failed:    return "cannot publish temp file";
            case DiskErrc::allocation_failed: return "cannot pre-size temp file";
        }
        return "unknown disk error";
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static const detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an errno value from a failed POSIX call
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace ferry::disk

namespace std {

template<>
struct is_error_code_enum<ferry::disk::DiskErrc> : true_type {};

} // namespace std
