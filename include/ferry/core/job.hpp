// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::core {

// What the caller asks for
struct JobSpec {
    std::string url;
    std::filesystem::path destination;  // empty: <output_folder>/<md5(url)>_<basename>
    std::uint32_t workers{0};           // segment hint, 0: config default
};

// Job state machine
enum class JobState : std::uint8_t {
    pending,        // Enqueued, nothing done yet
    probing,        // Learning size / range support
    single_stream,  // One sequential stream
    segmented,      // Ranged segment workers running
    combining,      // Join barrier over the segments
    verifying,      // Size check before/after publish
    completed,      // Final file in place
    failed          // Terminal error
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

// Legal edges of the state machine
[[nodiscard]] bool can_transition(JobState from, JobState to) noexcept;

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::completed || state == JobState::failed;
}

// Byte range [start, end) of a job's content
struct Segment {
    std::uint32_t id{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t written{0};
    bool complete{false};

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return written >= size() ? 0 : size() - written;
    }
};

// One request to materialize a URL at a destination path
class DownloadJob {
public:
    DownloadJob(JobSpec spec, std::filesystem::path final_path,
                std::filesystem::path temp_path, std::filesystem::path meta_path);

    // Move to `next`; invalid_state when the edge does not exist
    [[nodiscard]] std::error_code transition(JobState next) noexcept;

    // Record a terminal failure from any non-terminal state
    void fail(TransferError error) noexcept;

    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& url() const noexcept { return spec_.url; }
    [[nodiscard]] std::uint32_t workers() const noexcept { return spec_.workers; }

    [[nodiscard]] const std::filesystem::path& final_path() const noexcept { return final_path_; }
    [[nodiscard]] const std::filesystem::path& temp_path() const noexcept { return temp_path_; }
    [[nodiscard]] const std::filesystem::path& meta_path() const noexcept { return meta_path_; }

    [[nodiscard]] std::optional<std::uint64_t> total_size() const noexcept { return total_size_; }
    void total_size(std::optional<std::uint64_t> size) noexcept { total_size_ = size; }

    // Bytes received over the network by this job (resumed bytes excluded)
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return bytes_transferred_; }
    void add_transferred(std::uint64_t bytes) noexcept { bytes_transferred_ += bytes; }

    [[nodiscard]] const std::optional<TransferError>& last_error() const noexcept { return last_error_; }
    void last_error(TransferError error) noexcept { last_error_ = error; }

    // Resume marker: validator captured at probe time and temp offset
    [[nodiscard]] const std::string& validator() const noexcept { return validator_; }
    void validator(std::string token) noexcept { validator_ = std::move(token); }
    [[nodiscard]] std::uint64_t resume_offset() const noexcept { return resume_offset_; }
    void resume_offset(std::uint64_t offset) noexcept { resume_offset_ = offset; }

private:
    JobSpec spec_;
    std::filesystem::path final_path_;
    std::filesystem::path temp_path_;
    std::filesystem::path meta_path_;

    JobState state_{JobState::pending};
    std::optional<std::uint64_t> total_size_;
    std::uint64_t bytes_transferred_{0};
    std::optional<TransferError> last_error_;
    std::string validator_;
    std::uint64_t resume_offset_{0};
};

struct JobSuccess {
    std::string filename;         // final path
    std::uint64_t bytes{0};       // bytes transferred in this run
    bool already_existed{false};
};

// Terminal result, exactly one per job
struct JobResult {
    std::size_t index{0};         // position in the input sequence
    std::string url;
    std::expected<JobSuccess, TransferError> outcome;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool ok() const noexcept { return outcome.has_value(); }
};

// Always producible, partial success included
struct BatchSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::uint64_t total_bytes{0};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] double average_speed_bps() const noexcept {
        if (elapsed.count() <= 0) return 0.0;
        return static_cast<double>(total_bytes) * 1000.0 / static_cast<double>(elapsed.count());
    }
};

} // namespace ferry::core
