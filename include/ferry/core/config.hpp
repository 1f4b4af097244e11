// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::core {

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT = 5;
constexpr std::uint32_t DEFAULT_RETRY_ATTEMPTS = 3;
constexpr std::uint32_t DEFAULT_TIMEOUT_SEC = 300;
constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;
constexpr std::size_t DEFAULT_BATCH_SIZE = 100;
constexpr std::uint32_t DEFAULT_SEGMENTS = 4;

constexpr std::uint32_t MAX_CONCURRENT_LIMIT = 1024;

constexpr std::uint32_t MIN_SEGMENTS = 1;
constexpr std::uint32_t MAX_SEGMENTS = 16;
constexpr std::uint64_t MIN_SEGMENT_SIZE = 1024 * 1024;            // below this, one stream

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};
constexpr std::size_t PROGRESS_HISTORY = 12;
constexpr std::chrono::milliseconds CHECKPOINT_INTERVAL{1000};   // segment progress -> sidecar

constexpr double DEFAULT_BACKOFF_BASE = 2.0;
constexpr std::chrono::milliseconds DEFAULT_BACKOFF_UNIT{1000};

constexpr std::string_view DEFAULT_OUTPUT_FOLDER = "downloaded_files";
constexpr std::string_view TEMP_SUFFIX = ".temp";
constexpr std::string_view META_SUFFIX = ".meta";
constexpr std::string_view UNNAMED_FILE = "unnamed_file";

// Runtime engine configuration
struct EngineConfig {
    std::uint32_t max_concurrent{DEFAULT_MAX_CONCURRENT};
    std::uint32_t retry_attempts{DEFAULT_RETRY_ATTEMPTS};
    std::uint32_t timeout_seconds{DEFAULT_TIMEOUT_SEC};
    std::size_t chunk_size_bytes{DEFAULT_CHUNK_SIZE};
    double max_bandwidth_mbps{0.0};                       // MB/s, 0 = unlimited
    std::size_t batch_size{DEFAULT_BATCH_SIZE};
    std::string output_folder{DEFAULT_OUTPUT_FOLDER};

    std::uint32_t segments{DEFAULT_SEGMENTS};             // worker hint per job
    std::uint64_t min_segment_size{MIN_SEGMENT_SIZE};
    double backoff_base{DEFAULT_BACKOFF_BASE};
    std::chrono::milliseconds backoff_unit{DEFAULT_BACKOFF_UNIT};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds checkpoint_interval{CHECKPOINT_INTERVAL};
    std::string webhook_url;
    std::string log_level{"info"};

    // Byte budget refill rate; 0 means unlimited
    [[nodiscard]] std::uint64_t bandwidth_bytes_per_sec() const noexcept;

    // Reject values the engine cannot run with
    [[nodiscard]] std::error_code validate() const noexcept;

    // Overlay values from a JSON document / file onto this config
    [[nodiscard]] std::error_code merge_json(std::string_view json) noexcept;
    [[nodiscard]] std::error_code merge_json_file(const std::string& path) noexcept;

    // Overlay MAX_CONCURRENT, RETRY_ATTEMPTS, ... from the environment
    [[nodiscard]] std::error_code merge_env() noexcept;

    // Defaults, then optional JSON file, then environment
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(const std::string& json_path = {}) noexcept;
};

} // namespace ferry::core
