// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/log.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <new>
#include <sstream>

namespace ferry::core {

namespace {

template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

// Unsigned fields take non-negative integers that fit the field
template<typename T>
bool read_unsigned(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;

    if (!it->is_number_unsigned() ||
        it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
        log::logger()->error("config: {} must be an unsigned integer in range, got {}",
                             key, it->dump());
        return false;
    }
    out = static_cast<T>(it->get<std::uint64_t>());
    return true;
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = std::chrono::milliseconds{it->get<std::int64_t>()};
    }
}

// Parse an unsigned integer env var; false when set but unparsable or out of
// range for T. Signs and whitespace are not accepted.
template<typename T>
bool env_unsigned(const char* name, T& out) noexcept {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') return true;

    std::string_view text(raw);
    std::uint64_t val = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        val > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(val);
    return true;
}

bool env_double(const char* name, double& out) noexcept {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') return true;

    char* end = nullptr;
    double val = std::strtod(raw, &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = val;
    return true;
}

void env_string(const char* name, std::string& out) {
    const char* raw = std::getenv(name);
    if (raw && *raw != '\0') {
        out = raw;
    }
}

} // namespace

std::uint64_t EngineConfig::bandwidth_bytes_per_sec() const noexcept {
    if (max_bandwidth_mbps <= 0.0) return 0;
    return static_cast<std::uint64_t>(max_bandwidth_mbps * 1024.0 * 1024.0);
}

std::error_code EngineConfig::validate() const noexcept {
    if (max_concurrent == 0 || max_concurrent > MAX_CONCURRENT_LIMIT ||
        chunk_size_bytes == 0 || batch_size == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (max_bandwidth_mbps < 0.0 || backoff_base <= 1.0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (output_folder.empty()) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (segments < MIN_SEGMENTS || progress_interval.count() <= 0 ||
        checkpoint_interval.count() <= 0 || backoff_unit.count() < 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::error_code EngineConfig::merge_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json.begin(), json.end());
        if (!j.is_object()) {
            return make_error_code(DownloadErrc::invalid_config);
        }

        bool in_range = read_unsigned(j, "max_concurrent", max_concurrent) &&
                        read_unsigned(j, "retry_attempts", retry_attempts) &&
                        read_unsigned(j, "timeout_seconds", timeout_seconds) &&
                        read_unsigned(j, "chunk_size_bytes", chunk_size_bytes) &&
                        read_unsigned(j, "batch_size", batch_size) &&
                        read_unsigned(j, "segments", segments) &&
                        read_unsigned(j, "min_segment_size", min_segment_size);
        if (!in_range) {
            return make_error_code(DownloadErrc::invalid_config);
        }

        read_field(j, "max_bandwidth_MBps", max_bandwidth_mbps);
        read_field(j, "output_folder", output_folder);
        read_field(j, "backoff_base", backoff_base);
        read_millis(j, "backoff_unit_ms", backoff_unit);
        read_millis(j, "progress_interval_ms", progress_interval);
        read_millis(j, "checkpoint_interval_ms", checkpoint_interval);
        read_field(j, "webhook_url", webhook_url);
        read_field(j, "log_level", log_level);
        return {};
    } catch (const nlohmann::json::exception& e) {
        log::logger()->error("config: {}", e.what());
        return make_error_code(DownloadErrc::invalid_config);
    }
}

std::error_code EngineConfig::merge_json_file(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            log::logger()->error("config: cannot open {}", path);
            return make_error_code(DownloadErrc::invalid_config);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return merge_json(ss.str());
    } catch (const std::exception& e) {
        log::logger()->error("config: {}: {}", path, e.what());
        return make_error_code(DownloadErrc::invalid_config);
    }
}

std::error_code EngineConfig::merge_env() noexcept {
    const auto invalid = [](const char* name) {
        log::logger()->error("config: {} must be an unsigned integer in range", name);
        return make_error_code(DownloadErrc::invalid_config);
    };

    if (!env_unsigned("MAX_CONCURRENT", max_concurrent)) return invalid("MAX_CONCURRENT");
    if (!env_unsigned("RETRY_ATTEMPTS", retry_attempts)) return invalid("RETRY_ATTEMPTS");
    if (!env_unsigned("TIMEOUT", timeout_seconds)) return invalid("TIMEOUT");
    if (!env_unsigned("CHUNK_SIZE", chunk_size_bytes)) return invalid("CHUNK_SIZE");
    if (!env_unsigned("BATCH_SIZE", batch_size)) return invalid("BATCH_SIZE");
    if (!env_unsigned("SEGMENTS", segments)) return invalid("SEGMENTS");

    if (!env_double("MAX_BANDWIDTH", max_bandwidth_mbps)) {
        return make_error_code(DownloadErrc::invalid_config);
    }

    try {
        env_string("OUTPUT_FOLDER", output_folder);
        env_string("WEBHOOK_URL", webhook_url);
        env_string("LOG_LEVEL", log_level);
    } catch (const std::bad_alloc&) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(const std::string& json_path) noexcept {
    EngineConfig cfg;

    if (!json_path.empty()) {
        if (auto ec = cfg.merge_json_file(json_path)) {
            return std::unexpected(ec);
        }
    }
    if (auto ec = cfg.merge_env()) {
        return std::unexpected(ec);
    }
    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

} // namespace ferry::core
