// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/rate_limiter.hpp>
#include <algorithm>

namespace ferry::core {

//=============================================================================
// SlotPermit
//=============================================================================

SlotPermit& SlotPermit::operator=(SlotPermit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void SlotPermit::release() noexcept {
    if (owner_) {
        owner_->release_slot();
        owner_ = nullptr;
    }
}

//=============================================================================
// RateLimiter
//=============================================================================

RateLimiter::RateLimiter(std::uint32_t max_concurrent, std::uint64_t bytes_per_sec)
    : max_concurrent_(std::max<std::uint32_t>(1, max_concurrent))
    , rate_(bytes_per_sec)
    , capacity_(static_cast<double>(bytes_per_sec))
    , tokens_(static_cast<double>(bytes_per_sec))
    , last_refill_(clock::now()) {}

std::expected<SlotPermit, std::error_code>
RateLimiter::acquire_slot(std::stop_token stop) {
    auto lock = std::unique_lock(slot_mutex_);
    bool acquired = slot_cv_.wait(lock, stop, [this] {
        return in_flight_ < max_concurrent_;
    });
    if (!acquired || stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    return SlotPermit(this);
}

void RateLimiter::release_slot() noexcept {
    {
        auto lock = std::unique_lock(slot_mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    slot_cv_.notify_one();
}

std::uint32_t RateLimiter::in_flight() const {
    auto lock = std::unique_lock(slot_mutex_);
    return in_flight_;
}

std::uint32_t RateLimiter::peak_in_flight() const {
    auto lock = std::unique_lock(slot_mutex_);
    return peak_in_flight_;
}

void RateLimiter::refill(clock::time_point now) noexcept {
    if (now <= last_refill_) return;

    std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(capacity_, tokens_ + elapsed.count() * static_cast<double>(rate_));
    last_refill_ = now;
}

double RateLimiter::available_tokens() {
    auto lock = std::unique_lock(bucket_mutex_);
    if (rate_ == 0) return 0.0;
    refill(clock::now());
    return tokens_;
}

std::error_code RateLimiter::acquire_bytes(std::size_t bytes, std::stop_token stop) {
    // Unlimited
    if (rate_ == 0 || bytes == 0) {
        return {};
    }

    auto lock = std::unique_lock(bucket_mutex_);
    double remaining = static_cast<double>(bytes);

    // Requests above the bucket size are debited one bucket at a time
    while (remaining > 0.0) {
        double piece = std::min(remaining, capacity_);

        for (;;) {
            if (stop.stop_requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }
            refill(clock::now());
            if (tokens_ >= piece) {
                break;
            }

            std::chrono::duration<double> deficit((piece - tokens_) / static_cast<double>(rate_));
            auto wait = std::max(std::chrono::ceil<std::chrono::microseconds>(deficit),
                                 std::chrono::microseconds{1});
            bucket_cv_.wait_for(lock, stop, wait, [] { return false; });
        }

        tokens_ -= piece;
        remaining -= piece;
    }
    return {};
}

} // namespace ferry::core
