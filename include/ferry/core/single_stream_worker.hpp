// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/job.hpp>
#include <ferry/core/transfer_planner.hpp>
#include <ferry/core/transfer_worker.hpp>
#include <ferry/disk/file_writer.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ferry::core {

// Downloads a whole URL as one sequential stream into the job's temp file,
// resuming from the temp length when the server supports ranges and the
// sidecar validator still matches. Publishes by renaming on success.
class SingleStreamWorker final : public TransferWorker {
public:
    SingleStreamWorker(DownloadJob& job, const ProbeResult& info, const WorkerContext& ctx);

    [[nodiscard]] std::expected<std::uint64_t, TransferError> run() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "whole-file"; }

    // Offset the first request started from (0 when nothing was reused)
    [[nodiscard]] std::uint64_t initial_offset() const noexcept { return initial_offset_; }

private:
    // One request under one concurrency permit
    [[nodiscard]] std::error_code stream_once();

    // Decide how much of an existing temp file is reusable
    [[nodiscard]] std::uint64_t reusable_offset() const;

    [[nodiscard]] std::error_code restart_from_zero();
    [[nodiscard]] std::error_code save_sidecar() const;

    DownloadJob& job_;
    ProbeResult info_;
    const WorkerContext& ctx_;

    disk::FileWriter writer_;
    std::uint64_t offset_{0};               // bytes in the temp file
    std::uint64_t initial_offset_{0};
    std::uint64_t transferred_{0};
    std::optional<std::uint64_t> expected_total_;
    std::string validator_;
    bool complete_{false};
};

} // namespace ferry::core
