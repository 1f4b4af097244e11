// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/log.hpp>
#include "temp_dir.hpp"
#include <cstdlib>
#include <optional>
#include <string>

using namespace ferry::core;
using ferry::test::TempDir;

namespace {

// Sets an environment variable for the scope of a test
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) previous_ = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_, previous_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig cfg;

    CHECK(cfg.max_concurrent == 5);
    CHECK(cfg.retry_attempts == 3);
    CHECK(cfg.timeout_seconds == 300);
    CHECK(cfg.chunk_size_bytes == 8192);
    CHECK(cfg.max_bandwidth_mbps == 0.0);
    CHECK(cfg.batch_size == 100);
    CHECK(cfg.output_folder == "downloaded_files");
    CHECK(cfg.bandwidth_bytes_per_sec() == 0);
    CHECK_FALSE(cfg.validate());
}

TEST_CASE("EngineConfig::validate", "[config]") {
    EngineConfig cfg;

    SECTION("Zero concurrency") {
        cfg.max_concurrent = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Zero chunk size") {
        cfg.chunk_size_bytes = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Negative bandwidth") {
        cfg.max_bandwidth_mbps = -1.0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Empty output folder") {
        cfg.output_folder.clear();
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Concurrency above the limit") {
        cfg.max_concurrent = MAX_CONCURRENT_LIMIT + 1;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Zero checkpoint interval") {
        cfg.checkpoint_interval = std::chrono::milliseconds{0};
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }

    SECTION("Backoff base must grow") {
        cfg.backoff_base = 1.0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::merge_json", "[config]") {
    EngineConfig cfg;

    SECTION("Recognized options override defaults") {
        auto ec = cfg.merge_json(R"({
            "max_concurrent": 8,
            "retry_attempts": 5,
            "timeout_seconds": 60,
            "chunk_size_bytes": 65536,
            "max_bandwidth_MBps": 1.5,
            "batch_size": 10,
            "output_folder": "out",
            "segments": 6,
            "backoff_unit_ms": 250,
            "webhook_url": "http://hooks.local/done"
        })");
        REQUIRE_FALSE(ec);

        CHECK(cfg.max_concurrent == 8);
        CHECK(cfg.retry_attempts == 5);
        CHECK(cfg.timeout_seconds == 60);
        CHECK(cfg.chunk_size_bytes == 65536);
        CHECK(cfg.bandwidth_bytes_per_sec() == 1572864);
        CHECK(cfg.batch_size == 10);
        CHECK(cfg.output_folder == "out");
        CHECK(cfg.segments == 6);
        CHECK(cfg.backoff_unit == std::chrono::milliseconds{250});
        CHECK(cfg.webhook_url == "http://hooks.local/done");
    }

    SECTION("Missing keys keep their values") {
        REQUIRE_FALSE(cfg.merge_json(R"({"batch_size": 7})"));
        CHECK(cfg.batch_size == 7);
        CHECK(cfg.max_concurrent == DEFAULT_MAX_CONCURRENT);
    }

    SECTION("Malformed JSON") {
        CHECK(cfg.merge_json("{not json") == DownloadErrc::invalid_config);
    }

    SECTION("Wrong type") {
        CHECK(cfg.merge_json(R"({"max_concurrent": "many"})") == DownloadErrc::invalid_config);
    }

    SECTION("Negative counts do not wrap") {
        CHECK(cfg.merge_json(R"({"max_concurrent": -3})") == DownloadErrc::invalid_config);
        CHECK(cfg.max_concurrent == DEFAULT_MAX_CONCURRENT);
    }

    SECTION("Counts wider than the field are rejected") {
        CHECK(cfg.merge_json(R"({"segments": 4294967298})") == DownloadErrc::invalid_config);
        CHECK(cfg.merge_json(R"({"retry_attempts": 2.5})") == DownloadErrc::invalid_config);
        CHECK(cfg.segments == DEFAULT_SEGMENTS);
    }

    SECTION("Not an object") {
        CHECK(cfg.merge_json("[1, 2, 3]") == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::merge_env", "[config]") {
    EngineConfig cfg;

    SECTION("Environment overrides") {
        ScopedEnv a("MAX_CONCURRENT", "3");
        ScopedEnv b("RETRY_ATTEMPTS", "1");
        ScopedEnv c("MAX_BANDWIDTH", "2");
        ScopedEnv d("OUTPUT_FOLDER", "/tmp/ferry-out");

        REQUIRE_FALSE(cfg.merge_env());
        CHECK(cfg.max_concurrent == 3);
        CHECK(cfg.retry_attempts == 1);
        CHECK(cfg.bandwidth_bytes_per_sec() == 2 * 1024 * 1024);
        CHECK(cfg.output_folder == "/tmp/ferry-out");
    }

    SECTION("Garbage is rejected") {
        ScopedEnv a("BATCH_SIZE", "12abc");
        CHECK(cfg.merge_env() == DownloadErrc::invalid_config);
    }

    SECTION("Negative values are rejected") {
        ScopedEnv a("MAX_CONCURRENT", "-1");
        CHECK(cfg.merge_env() == DownloadErrc::invalid_config);
        CHECK(cfg.max_concurrent == DEFAULT_MAX_CONCURRENT);
    }

    SECTION("Values wider than the field are rejected") {
        ScopedEnv a("MAX_CONCURRENT", "4294967298");
        CHECK(cfg.merge_env() == DownloadErrc::invalid_config);
        CHECK(cfg.max_concurrent == DEFAULT_MAX_CONCURRENT);
    }

    SECTION("Values wider than 64 bits are rejected") {
        ScopedEnv a("CHUNK_SIZE", "99999999999999999999999");
        CHECK(cfg.merge_env() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::load", "[config]") {
    TempDir dir;
    auto path = (dir / "ferry.json").string();
    ferry::test::write_file(path, R"({"max_concurrent": 9, "batch_size": 4})");

    SECTION("File, then environment") {
        ScopedEnv env("BATCH_SIZE", "6");
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_concurrent == 9);
        CHECK(cfg->batch_size == 6);
    }

    SECTION("Missing file") {
        auto cfg = EngineConfig::load((dir / "absent.json").string());
        CHECK_FALSE(cfg.has_value());
    }

    SECTION("Negative concurrency never loads") {
        ScopedEnv env("MAX_CONCURRENT", "-1");
        auto cfg = EngineConfig::load(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Invalid values are rejected after merging") {
        ferry::test::write_file(path, R"({"max_concurrent": 0})");
        auto cfg = EngineConfig::load(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("log::parse_level", "[config][log]") {
    CHECK(log::parse_level("debug") == spdlog::level::debug);
    CHECK(log::parse_level("warn") == spdlog::level::warn);
    CHECK(log::parse_level("off") == spdlog::level::off);
    CHECK(log::parse_level("bogus") == spdlog::level::info);
    CHECK(log::logger()->name() == "ferry");
}

TEST_CASE("log::init adds a file sink", "[config][log]") {
    TempDir dir;
    auto path = (dir / "ferry.log").string();

    log::init(spdlog::level::debug, path);
    log::logger()->debug("file sink check {}", 42);
    log::logger()->flush();
    CHECK(ferry::test::read_file(path).find("file sink check 42") != std::string::npos);

    log::logger()->sinks().pop_back();
    log::init(spdlog::level::info);
    CHECK(log::logger()->level() == spdlog::level::info);
}
