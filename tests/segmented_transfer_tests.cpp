// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/naming.hpp>
#include <ferry/core/resume_meta.hpp>
#include <ferry/core/segmented_transfer.hpp>
#include <ferry/disk/file_writer.hpp>
#include "fake_http_client.hpp"
#include "temp_dir.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <thread>
#include <vector>

using namespace ferry::core;
using namespace ferry::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

const std::string URL = "https://example.com/big.iso";

struct SegmentedFixture {
    TempDir dir;
    FakeHttpClient client;
    RateLimiter limiter{4, 0};
    EngineConfig cfg;
    ProgressTracker tracker;
    std::shared_ptr<JobCounter> counter = tracker.register_job(URL);
    std::string body;
    TransferPaths paths = paths_for(URL, dir.path());
    DownloadJob job{JobSpec{URL, {}, 4}, paths.final_path, paths.temp_path, paths.meta_path};

    explicit SegmentedFixture(std::size_t size) : body(make_body(size)) {
        cfg.chunk_size_bytes = 64 * 1024;
        cfg.backoff_unit = 1ms;
        client.add(URL, {.body = body});
    }

    ProbeResult probe() const {
        ProbeResult info;
        info.total_size = body.size();
        info.accepts_ranges = true;
        info.validator = "\"v1\"";
        return info;
    }

    WorkerContext context() {
        return WorkerContext{client, limiter, RetryPolicy::from_config(cfg), cfg, counter, {}};
    }
};

} // namespace

TEST_CASE("SegmentedTransfer splits a large file into parallel ranges", "[segmented]") {
    SegmentedFixture f(10'000'000);
    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(10'000'000, 4), ctx);

    auto result = transfer.run();
    REQUIRE(result.has_value());
    CHECK(*result == 10'000'000);
    CHECK_FALSE(transfer.resumed());

    // Not visible before the combine step
    CHECK_FALSE(fs::exists(f.paths.final_path));
    REQUIRE_FALSE(transfer.combine());

    CHECK(fs::file_size(f.paths.final_path) == 10'000'000);
    CHECK(read_file(f.paths.final_path) == f.body);
    CHECK_FALSE(fs::exists(f.paths.temp_path));
    CHECK_FALSE(fs::exists(f.paths.meta_path));

    auto gets = f.client.calls(URL, "GET");
    REQUIRE(gets.size() == 4);
    std::set<std::uint64_t> starts;
    for (const auto& call : gets) {
        REQUIRE(call.range_from.has_value());
        REQUIRE(call.range_to.has_value());
        CHECK(*call.range_to - *call.range_from + 1 == 2'500'000);
        starts.insert(*call.range_from);
    }
    CHECK(starts == std::set<std::uint64_t>{0, 2'500'000, 5'000'000, 7'500'000});

    for (const auto& seg : transfer.segments()) {
        CHECK(seg.complete);
        CHECK(seg.written == seg.size());
    }
    CHECK(f.counter->bytes() == 10'000'000);
    CHECK(f.limiter.peak_in_flight() <= 4);
}

TEST_CASE("SegmentedTransfer retries only the failed segment's remainder", "[segmented]") {
    SegmentedFixture f(400'000);
    f.client.script(URL, {.cut_after = 1000});

    auto segments = TransferPlanner::make_segments(400'000, 4);
    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), segments, ctx);

    auto result = transfer.run();
    REQUIRE(result.has_value());
    CHECK(*result == 400'000);
    REQUIRE_FALSE(transfer.combine());
    CHECK(read_file(f.paths.final_path) == f.body);

    auto gets = f.client.calls(URL, "GET");
    REQUIRE(gets.size() == 5);

    std::set<std::uint64_t> segment_starts;
    for (const auto& seg : segments) segment_starts.insert(seg.start);

    std::vector<std::uint64_t> retried;
    for (const auto& call : gets) {
        if (!segment_starts.contains(*call.range_from)) retried.push_back(*call.range_from);
    }
    REQUIRE(retried.size() == 1);
    CHECK(segment_starts.contains(retried[0] - 1000));
}

TEST_CASE("SegmentedTransfer resumes segment progress from the sidecar", "[segmented]") {
    SegmentedFixture f(400'000);
    auto segments = TransferPlanner::make_segments(400'000, 4);

    // Segment 0 finished, segment 1 half done, the rest untouched
    std::string partial(400'000, '\0');
    partial.replace(0, 150'000, f.body.substr(0, 150'000));
    write_file(f.paths.temp_path, partial);

    segments[0].written = 100'000;
    segments[0].complete = true;
    segments[1].written = 50'000;

    ResumeMeta meta;
    meta.url = URL;
    meta.validator = "\"v1\"";
    meta.total_size = 400'000;
    meta.segmented = true;
    meta.segments = segments;
    REQUIRE_FALSE(meta.save(f.paths.meta_path));

    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);
    auto result = transfer.run();
    REQUIRE(result.has_value());
    CHECK(transfer.resumed());
    CHECK(*result == 250'000);
    CHECK(f.job.resume_offset() == 150'000);

    REQUIRE_FALSE(transfer.combine());
    CHECK(read_file(f.paths.final_path) == f.body);

    std::set<std::uint64_t> starts;
    for (const auto& call : f.client.calls(URL, "GET")) starts.insert(*call.range_from);
    CHECK(starts == std::set<std::uint64_t>{150'000, 200'000, 300'000});
}

TEST_CASE("SegmentedTransfer checkpoints segment progress while running", "[segmented]") {
    SegmentedFixture f(400'000);
    f.client.add(URL, {.body = f.body, .chunk_delay = 2ms});
    f.cfg.chunk_size_bytes = 1000;
    f.cfg.checkpoint_interval = 20ms;

    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);

    std::optional<std::expected<std::uint64_t, TransferError>> result;
    std::optional<ResumeMeta> midway;
    {
        std::jthread runner([&] { result = transfer.run(); });

        // Poll the sidecar as a crashed process would leave it
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!midway && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
            auto meta = ResumeMeta::load(f.paths.meta_path);
            if (!meta) continue;
            std::uint64_t recorded = 0;
            for (const auto& seg : meta->segments) recorded += seg.written;
            if (recorded > 0 && recorded < 400'000) {
                midway = *meta;
                // Every recorded byte is already in the temp file
                auto on_disk = read_file(f.paths.temp_path);
                for (const auto& seg : meta->segments) {
                    CHECK(on_disk.compare(seg.start, seg.written, f.body, seg.start, seg.written) == 0);
                }
            }
        }
    }

    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    REQUIRE(midway.has_value());
    CHECK(midway->segmented);
    CHECK(midway->validator == "\"v1\"");

    // Restart from the mid-run sidecar: only the unrecorded remainders are fetched
    REQUIRE_FALSE(midway->save(f.paths.meta_path));
    auto before = f.client.calls(URL, "GET").size();

    DownloadJob again{JobSpec{URL, {}, 4}, f.paths.final_path, f.paths.temp_path, f.paths.meta_path};
    SegmentedTransfer resumed(again, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);
    auto second = resumed.run();
    REQUIRE(second.has_value());
    CHECK(resumed.resumed());

    std::set<std::uint64_t> expected;
    std::uint64_t remaining = 0;
    for (const auto& seg : midway->segments) {
        if (seg.written < seg.size()) {
            expected.insert(seg.start + seg.written);
            remaining += seg.size() - seg.written;
        }
    }
    CHECK(*second == remaining);

    auto gets = f.client.calls(URL, "GET");
    std::set<std::uint64_t> starts;
    for (std::size_t i = before; i < gets.size(); ++i) starts.insert(*gets[i].range_from);
    CHECK(starts == expected);

    REQUIRE_FALSE(resumed.combine());
    CHECK(read_file(f.paths.final_path) == f.body);
}

TEST_CASE("SegmentedTransfer reports servers that ignore ranges", "[segmented]") {
    SegmentedFixture f(400'000);
    f.client.add(URL, {.body = f.body, .honour_ranges = false});

    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);
    auto result = transfer.run();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == DownloadErrc::probe_failed);
    CHECK_FALSE(fs::exists(f.paths.final_path));
    REQUIRE(f.job.last_error().has_value());
}

TEST_CASE("SegmentedTransfer stops siblings on a permanent failure", "[segmented]") {
    SegmentedFixture f(400'000);
    f.client.script(URL, {.status = 403});

    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);
    auto result = transfer.run();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == FailureKind::permanent);
    CHECK_FALSE(fs::exists(f.paths.final_path));
    // Progress kept for a later run
    CHECK(fs::exists(f.paths.temp_path));
    CHECK(fs::exists(f.paths.meta_path));
}

TEST_CASE("SegmentedTransfer rejects a range that starts elsewhere", "[segmented]") {
    SegmentedFixture f(400'000);
    f.client.script(URL, {.range_shift = 10});

    auto ctx = f.context();
    SegmentedTransfer transfer(f.job, f.probe(), TransferPlanner::make_segments(400'000, 4), ctx);
    auto result = transfer.run();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == DownloadErrc::malformed_response);
    CHECK_FALSE(fs::exists(f.paths.final_path));
}

TEST_CASE("Combiner", "[segmented][combiner]") {
    TempDir dir;
    auto temp = dir / "out.bin.temp";
    auto final_path = dir / "out.bin";

    SECTION("Waits for every segment and keeps the first failure") {
        Combiner combiner(3);
        combiner.report(0, {});
        combiner.report(2, make_error_code(DownloadErrc::not_found));
        combiner.report(1, make_error_code(DownloadErrc::server_error));
        CHECK(combiner.reported() == 3);

        auto failure = combiner.wait();
        CHECK(failure.code == DownloadErrc::not_found);
    }

    SECTION("All segments succeeded") {
        Combiner combiner(2);
        combiner.report(0, {});
        combiner.report(1, {});
        CHECK_FALSE(combiner.wait().code);
    }

    SECTION("Refuses a temp file of the wrong length") {
        write_file(temp, std::string(100, 'x'));
        ferry::disk::FileWriter writer;
        REQUIRE_FALSE(writer.open(temp, ferry::disk::OpenMode::keep));

        Combiner combiner(1);
        combiner.report(0, {});
        REQUIRE_FALSE(combiner.wait().code);

        CHECK(combiner.finalize(writer, temp, final_path, 200) == DownloadErrc::size_mismatch);
        CHECK_FALSE(combiner.published());
        CHECK_FALSE(fs::exists(final_path));
    }

    SECTION("Publishes once") {
        write_file(temp, std::string(100, 'x'));
        ferry::disk::FileWriter writer;
        REQUIRE_FALSE(writer.open(temp, ferry::disk::OpenMode::keep));

        Combiner combiner(1);
        combiner.report(0, {});
        REQUIRE_FALSE(combiner.wait().code);

        REQUIRE_FALSE(combiner.finalize(writer, temp, final_path, 100));
        CHECK(combiner.published());
        CHECK(fs::file_size(final_path) == 100);
        CHECK_FALSE(fs::exists(temp));

        CHECK_FALSE(combiner.finalize(writer, temp, final_path, 100));
    }
}
