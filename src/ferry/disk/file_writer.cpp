// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <new>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:
            return {};
        case ENOENT:
        case ENOTDIR:
            return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case EINVAL:
            return make_error_code(DiskErrc::invalid_path);
        case EEXIST:
            return make_error_code(DiskErrc::file_exists);
        case EBADF:
            return make_error_code(DiskErrc::not_open);
        default:
            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_.exchange(-1, std::memory_order_acq_rel))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_.store(other.fd_.exchange(-1, std::memory_order_acq_rel), std::memory_order_release);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path,
                                 OpenMode mode,
                                 std::uint64_t size) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::already_open);
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (mode == OpenMode::truncate) {
        flags |= O_TRUNC;
    }

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    // Pre-size so segment writes land inside the file
    if (size > 0) {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            int err = errno;
            ::close(fd);
            return errno_to_error_code(err);
        }
        if (static_cast<std::uint64_t>(st.st_size) < size &&
            ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
            int err = errno;
            ::close(fd);
            return err == ENOSPC ? make_error_code(DiskErrc::disk_full)
                                 : make_error_code(DiskErrc::allocation_failed);
        }
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        ::close(fd);
        return make_error_code(DiskErrc::allocation_failed);
    }
    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    // No mutex - pwrite carries its own offset, disjoint ranges never collide
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::not_open);
    }

    const auto* ptr = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd, ptr, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        ptr += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code> FileWriter::size() const noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return std::unexpected(make_error_code(DiskErrc::not_open));
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::not_open);
    }
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::not_open);
    }
    if (::fsync(fd) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Atomic guard against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

//=============================================================================
// Free functions
//=============================================================================

std::uint64_t file_length(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::error_code publish_file(const std::filesystem::path& temp,
                             const std::filesystem::path& final_path) noexcept {
    if (::rename(temp.c_str(), final_path.c_str()) != 0) {
        int err = errno;
        return err == ENOENT ? make_error_code(DiskErrc::file_not_found)
                             : make_error_code(DiskErrc::publish_failed);
    }
    return {};
}

std::error_code remove_file(const std::filesystem::path& path) noexcept {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return errno_to_error_code(errno);
    }
    return {};
}

} // namespace ferry::disk
