// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/transfer_planner.hpp>
#include "fake_http_client.hpp"
#include <algorithm>

using namespace ferry::core;
using ferry::test::FakeHttpClient;
using namespace std::chrono_literals;

namespace {

// Ranges must be contiguous, non-overlapping and cover [0, total)
void check_partition(const std::vector<Segment>& segments, std::uint64_t total) {
    REQUIRE_FALSE(segments.empty());
    std::uint64_t next = 0;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        CHECK(segments[i].id == i);
        CHECK(segments[i].start == next);
        CHECK(segments[i].end > segments[i].start);
        CHECK(segments[i].written == 0);
        next = segments[i].end;
    }
    CHECK(next == total);
}

} // namespace

TEST_CASE("TransferPlanner::make_segments partitions the file", "[planner]") {
    SECTION("Even split") {
        auto segments = TransferPlanner::make_segments(10'000'000, 4);
        REQUIRE(segments.size() == 4);
        check_partition(segments, 10'000'000);
        for (const auto& seg : segments) {
            CHECK(seg.size() == 2'500'000);
        }
    }

    SECTION("Remainder goes to the first segments") {
        auto segments = TransferPlanner::make_segments(10, 3);
        REQUIRE(segments.size() == 3);
        check_partition(segments, 10);
        CHECK(segments[0].size() == 4);
        CHECK(segments[1].size() == 3);
        CHECK(segments[2].size() == 3);
    }

    SECTION("Sizes differ by at most one byte") {
        for (std::uint64_t total : {1ULL, 7ULL, 999ULL, 1'048'577ULL, 123'456'789ULL}) {
            for (std::uint32_t count = 1; count <= 16; ++count) {
                auto segments = TransferPlanner::make_segments(total, count);
                check_partition(segments, total);
                auto [lo, hi] = std::minmax_element(segments.begin(), segments.end(),
                    [](const Segment& a, const Segment& b) { return a.size() < b.size(); });
                CHECK(hi->size() - lo->size() <= 1);
            }
        }
    }

    SECTION("Never more segments than bytes") {
        auto segments = TransferPlanner::make_segments(3, 8);
        CHECK(segments.size() == 3);
        check_partition(segments, 3);
    }

    SECTION("Empty file has no segments") {
        CHECK(TransferPlanner::make_segments(0, 4).empty());
    }
}

TEST_CASE("TransferPlanner::plan", "[planner]") {
    FakeHttpClient client;
    RateLimiter limiter(4, 0);
    EngineConfig cfg;
    TransferPlanner planner(client, limiter, RetryPolicy(0), cfg);

    ProbeResult info;
    info.total_size = 10'000'000;
    info.accepts_ranges = true;
    info.validator = "\"v1\"";

    SECTION("Large ranged file is segmented by the hint") {
        auto plan = planner.plan(info, 4);
        CHECK(plan.mode == TransferMode::segmented);
        CHECK(plan.segments.size() == 4);
    }

    SECTION("Hint 0 uses the configured default") {
        cfg.segments = 3;
        CHECK(planner.plan(info, 0).segments.size() == 3);
    }

    SECTION("Hint is clamped to 16") {
        CHECK(planner.plan(info, 64).segments.size() == MAX_SEGMENTS);
    }

    SECTION("Unknown size forces one stream") {
        info.total_size.reset();
        CHECK(planner.plan(info, 4).mode == TransferMode::single_stream);
    }

    SECTION("No range support forces one stream") {
        info.accepts_ranges = false;
        CHECK(planner.plan(info, 4).mode == TransferMode::single_stream);
    }

    SECTION("Small file stays one stream") {
        info.total_size = cfg.min_segment_size - 1;
        CHECK(planner.plan(info, 4).mode == TransferMode::single_stream);
    }

    SECTION("One worker means one stream") {
        CHECK(planner.plan(info, 1).mode == TransferMode::single_stream);
    }
}

TEST_CASE("TransferPlanner::probe", "[planner]") {
    FakeHttpClient client;
    RateLimiter limiter(2, 0);
    EngineConfig cfg;
    TransferPlanner planner(client, limiter, RetryPolicy(2, 2.0, 1ms), cfg);
    const std::string url = "https://example.com/file.bin";

    SECTION("HEAD answers size, ranges and validator") {
        client.add(url, {.body = std::string(5000, 'x')});
        auto info = planner.probe(url);
        REQUIRE(info.has_value());
        CHECK(info->total_size == 5000);
        CHECK(info->accepts_ranges);
        CHECK(info->validator == "\"v1\"");
        CHECK_FALSE(info->used_get_fallback);
        CHECK(client.calls(url, "GET").empty());
    }

    SECTION("Broken HEAD falls back to GET headers") {
        client.add(url, {.body = std::string(5000, 'x'), .head_supported = false});
        auto info = planner.probe(url);
        REQUIRE(info.has_value());
        CHECK(info->used_get_fallback);
        CHECK(info->total_size == 5000);
        CHECK(client.calls(url, "GET").size() == 1);
    }

    SECTION("Missing length and ranges") {
        client.add(url, {.body = "abc", .accept_ranges = false, .report_length = false, .etag = ""});
        auto info = planner.probe(url);
        REQUIRE(info.has_value());
        CHECK_FALSE(info->total_size.has_value());
        CHECK_FALSE(info->range_capable());
        CHECK(info->validator.empty());
    }

    SECTION("Not found is permanent, no retry") {
        auto info = planner.probe(url);
        REQUIRE_FALSE(info.has_value());
        CHECK(info.error().kind == FailureKind::permanent);
        CHECK(client.calls(url, "HEAD").size() == 1);
    }

    SECTION("Transient failures are retried then reported") {
        client.add(url, {.body = "abc", .head_supported = false});
        for (int i = 0; i < 3; ++i) {
            client.script(url, {.status = 503});
        }
        auto info = planner.probe(url);
        REQUIRE_FALSE(info.has_value());
        CHECK(info.error().kind == FailureKind::transient_server);
        CHECK(client.calls(url, "GET").size() == 3);
    }

    SECTION("Probe holds a permit only while probing") {
        client.add(url, {.body = "abc"});
        REQUIRE(planner.probe(url).has_value());
        CHECK(limiter.in_flight() == 0);
        CHECK(limiter.peak_in_flight() == 1);
    }
}
