// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/job.hpp>

namespace ferry::core {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::pending:       return "pending";
        case JobState::probing:       return "probing";
        case JobState::single_stream: return "single-stream";
        case JobState::segmented:     return "segmented";
        case JobState::combining:     return "combining";
        case JobState::verifying:     return "verifying";
        case JobState::completed:     return "completed";
        case JobState::failed:        return "failed";
    }
    return "unknown";
}

bool can_transition(JobState from, JobState to) noexcept {
    if (is_terminal(from)) return false;
    if (to == JobState::failed) return true;

    switch (from) {
        case JobState::pending:
            // An existing final file skips straight to verification
            return to == JobState::probing || to == JobState::verifying;
        case JobState::probing:
            return to == JobState::single_stream || to == JobState::segmented;
        case JobState::single_stream:
            return to == JobState::verifying;
        case JobState::segmented:
            // Server ignored ranges: whole-file fallback before any combining
            return to == JobState::combining || to == JobState::single_stream;
        case JobState::combining:
            return to == JobState::verifying;
        case JobState::verifying:
            return to == JobState::completed;
        default:
            return false;
    }
}

//=============================================================================
// DownloadJob
//=============================================================================

DownloadJob::DownloadJob(JobSpec spec, std::filesystem::path final_path,
                         std::filesystem::path temp_path, std::filesystem::path meta_path)
    : spec_(std::move(spec))
    , final_path_(std::move(final_path))
    , temp_path_(std::move(temp_path))
    , meta_path_(std::move(meta_path)) {}

std::error_code DownloadJob::transition(JobState next) noexcept {
    if (!can_transition(state_, next)) {
        return make_error_code(DownloadErrc::invalid_state);
    }
    state_ = next;
    return {};
}

void DownloadJob::fail(TransferError error) noexcept {
    last_error_ = error;
    if (!is_terminal(state_)) {
        state_ = JobState::failed;
    }
}

} // namespace ferry::core
