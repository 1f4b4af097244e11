// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <stop_token>

namespace ferry::core {

class RateLimiter;

// Concurrency permit, released on destruction
class SlotPermit {
public:
    SlotPermit() = default;
    ~SlotPermit() { release(); }

    SlotPermit(const SlotPermit&) = delete;
    SlotPermit& operator=(const SlotPermit&) = delete;
    SlotPermit(SlotPermit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
    SlotPermit& operator=(SlotPermit&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }

private:
    friend class RateLimiter;
    explicit SlotPermit(RateLimiter* owner) noexcept : owner_(owner) {}

    RateLimiter* owner_{nullptr};
};

// Process-wide throttle: a bounded pool of concurrency permits plus a byte
// token bucket. Both are shared by every worker and never go below zero.
class RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    // `bytes_per_sec` == 0 disables the byte budget
    RateLimiter(std::uint32_t max_concurrent, std::uint64_t bytes_per_sec);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Block until a permit is free; cancelled if `stop` fires while waiting
    [[nodiscard]] std::expected<SlotPermit, std::error_code>
    acquire_slot(std::stop_token stop = {});

    // Block until `bytes` of budget are available and debit them
    [[nodiscard]] std::error_code acquire_bytes(std::size_t bytes, std::stop_token stop = {});

    [[nodiscard]] std::uint32_t max_concurrent() const noexcept { return max_concurrent_; }
    [[nodiscard]] std::uint64_t bytes_per_sec() const noexcept { return rate_; }

    // Permits currently handed out / highest count ever handed out
    [[nodiscard]] std::uint32_t in_flight() const;
    [[nodiscard]] std::uint32_t peak_in_flight() const;

    // Tokens in the bucket after refilling to now
    [[nodiscard]] double available_tokens();

private:
    friend class SlotPermit;
    void release_slot() noexcept;

    // Caller holds bucket_mutex_
    void refill(clock::time_point now) noexcept;

    const std::uint32_t max_concurrent_;
    const std::uint64_t rate_;
    const double capacity_;          // one second of budget

    mutable std::mutex slot_mutex_;
    std::condition_variable_any slot_cv_;
    std::uint32_t in_flight_{0};
    std::uint32_t peak_in_flight_{0};

    std::mutex bucket_mutex_;
    std::condition_variable_any bucket_cv_;
    double tokens_{0.0};
    clock::time_point last_refill_;
};

} // namespace ferry::core
