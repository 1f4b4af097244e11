// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/collaborators.hpp>
#include <ferry/core/log.hpp>
#include <algorithm>
#include <iterator>

namespace ferry::core {

std::vector<JobSpec> VectorJobSource::next_batch(std::size_t max) {
    auto lock = std::unique_lock(mutex_);

    std::size_t count = std::min(max, jobs_.size() - next_);
    std::vector<JobSpec> batch;
    batch.reserve(count);
    auto first = jobs_.begin() + static_cast<std::ptrdiff_t>(next_);
    std::move(first, first + static_cast<std::ptrdiff_t>(count), std::back_inserter(batch));
    next_ += count;
    return batch;
}

std::string_view to_string(AttemptStatus status) noexcept {
    switch (status) {
        case AttemptStatus::success:        return "success";
        case AttemptStatus::already_exists: return "already-exists";
        case AttemptStatus::failed:         return "failed";
    }
    return "unknown";
}

void LogTelemetrySink::record(const AttemptRecord& record) {
    log::logger()->info("telemetry: {} status={} bytes={} duration={}ms",
                        record.url, to_string(record.status), record.bytes,
                        record.duration.count());
}

} // namespace ferry::core
