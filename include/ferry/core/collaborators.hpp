// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/job.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

//=============================================================================
// Job catalog
//=============================================================================

// Supplies jobs in chunks so the full list never has to be live at once
class JobSource {
public:
    virtual ~JobSource() = default;

    // Up to `max` jobs; empty means end of input
    [[nodiscard]] virtual std::vector<JobSpec> next_batch(std::size_t max) = 0;
};

class VectorJobSource final : public JobSource {
public:
    explicit VectorJobSource(std::vector<JobSpec> jobs) : jobs_(std::move(jobs)) {}

    [[nodiscard]] std::vector<JobSpec> next_batch(std::size_t max) override;

    [[nodiscard]] std::size_t size() const noexcept { return jobs_.size(); }

private:
    std::vector<JobSpec> jobs_;
    std::size_t next_{0};
    std::mutex mutex_;
};

//=============================================================================
// Telemetry
//=============================================================================

enum class AttemptStatus : std::uint8_t {
    success,
    already_exists,
    failed
};

[[nodiscard]] std::string_view to_string(AttemptStatus status) noexcept;

struct AttemptRecord {
    std::string url;
    AttemptStatus status{AttemptStatus::success};
    std::uint64_t bytes{0};
    std::chrono::milliseconds duration{0};
};

// Receives one record per finished job; called from worker threads
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual void record(const AttemptRecord& record) = 0;
};

// Writes records through the engine logger
class LogTelemetrySink final : public TelemetrySink {
public:
    void record(const AttemptRecord& record) override;
};

//=============================================================================
// Notification
//=============================================================================

// Called once after a whole batch finished
class BatchNotifier {
public:
    virtual ~BatchNotifier() = default;
    virtual void notify(const BatchSummary& summary) = 0;
};

} // namespace ferry::core
