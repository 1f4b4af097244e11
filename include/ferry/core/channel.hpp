// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace ferry::core {

// Bounded multi-producer / multi-consumer queue with an explicit close.
// push blocks while full, pop blocks while empty. After close() pushes are
// refused and pops drain what is left, then return nullopt.
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False when the channel is closed or `stop` fired while waiting
    [[nodiscard]] bool push(T value, std::stop_token stop = {}) {
        auto lock = std::unique_lock(mutex_);
        bool ready = not_full_.wait(lock, stop, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (!ready || closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // nullopt once closed and drained, or when `stop` fired while waiting
    [[nodiscard]] std::optional<T> pop(std::stop_token stop = {}) {
        auto lock = std::unique_lock(mutex_);
        bool ready = not_empty_.wait(lock, stop, [this] {
            return closed_ || !items_.empty();
        });
        if (!ready || items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    void close() noexcept {
        {
            auto lock = std::unique_lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        auto lock = std::unique_lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        auto lock = std::unique_lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace ferry::core
