// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace ferry::core::log {

namespace {

constexpr const char* LOGGER_NAME = "ferry";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex init_mutex;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) return existing;

        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern(LOG_PATTERN);
        auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
        created->set_level(spdlog::level::info);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

void init(spdlog::level::level_enum level, const std::string& file_path) {
    auto lock = std::unique_lock(init_mutex);
    auto log = logger();

    if (!file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            file_sink->set_pattern(LOG_PATTERN);
            log->sinks().push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& e) {
            log->error("log: cannot open {}: {}", file_path, e.what());
        }
    }

    log->set_level(level);
    log->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace ferry::core::log
