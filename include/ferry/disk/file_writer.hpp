// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace ferry::disk {

enum class OpenMode : std::uint8_t {
    keep,      // Create if missing, keep existing bytes
    truncate,  // Create if missing, discard existing bytes
};

// Positional file writer. Writes at explicit offsets (pwrite), so several
// segment workers may share one instance as long as their ranges are disjoint.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open for writing; `size` > 0 pre-sizes the file
    [[nodiscard]] std::error_code open(const std::filesystem::path& path,
                                       OpenMode mode,
                                       std::uint64_t size = 0) noexcept;

    // Write data at offset (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Current file length
    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    // fsync
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::filesystem::path path_;
};

// Length of a file on disk, 0 when it does not exist
[[nodiscard]] std::uint64_t file_length(const std::filesystem::path& path) noexcept;

// Atomically move a finished temp file to its final name
[[nodiscard]] std::error_code publish_file(const std::filesystem::path& temp,
                                           const std::filesystem::path& final_path) noexcept;

// Remove a file if present
[[nodiscard]] std::error_code remove_file(const std::filesystem::path& path) noexcept;

} // namespace ferry::disk
