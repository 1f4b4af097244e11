// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/http_client.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ferry::test {

using namespace ferry::core;

// In-memory HTTP server for engine tests. Resources are byte strings with
// optional range support and ETag; fetch() answers can be scripted per URL.
class FakeHttpClient final : public HttpClient {
public:
    struct Resource {
        std::string body;
        bool accept_ranges{true};
        bool head_supported{true};
        bool report_length{true};
        bool honour_ranges{true};            // false: answer 200 to ranged GETs
        std::string etag{"\"v1\""};
        std::chrono::milliseconds chunk_delay{0};
    };

    // One scripted answer, consumed by the next fetch of that URL
    struct Script {
        long status{0};                      // non-zero: answer this status, no body
        std::error_code error;               // transport error, no response at all
        std::optional<std::uint64_t> cut_after;  // close cleanly after this many bytes
        std::uint64_t range_shift{0};            // serve a ranged GET from this much later
    };

    struct Call {
        std::string method;
        std::string url;
        std::optional<std::uint64_t> range_from;
        std::optional<std::uint64_t> range_to;
        std::chrono::steady_clock::time_point at;
    };

    void add(const std::string& url, Resource resource) {
        auto lock = std::unique_lock(mutex_);
        resources_[url] = std::move(resource);
    }

    void set_etag(const std::string& url, std::string etag) {
        auto lock = std::unique_lock(mutex_);
        resources_[url].etag = std::move(etag);
    }

    void script(const std::string& url, Script answer) {
        auto lock = std::unique_lock(mutex_);
        scripts_[url].push_back(answer);
    }

    [[nodiscard]] std::vector<Call> calls() const {
        auto lock = std::unique_lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<Call> calls(const std::string& url, const std::string& method) const {
        auto lock = std::unique_lock(mutex_);
        std::vector<Call> out;
        for (const auto& call : calls_) {
            if (call.url == url && call.method == method) out.push_back(call);
        }
        return out;
    }

    [[nodiscard]] std::size_t call_count() const {
        auto lock = std::unique_lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] int peak_in_flight() const noexcept { return peak_.load(); }
    [[nodiscard]] int in_flight() const noexcept { return in_flight_.load(); }

    // Block until at least `count` requests are in flight (or timeout)
    [[nodiscard]] bool wait_in_flight(int count, std::chrono::milliseconds timeout) {
        auto lock = std::unique_lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return in_flight_.load() >= count; });
    }

    std::expected<HttpResponse, std::error_code> head(const HttpRequest& request) override {
        InFlight guard(*this);
        record("HEAD", request);

        auto resource = find(request.url);
        HttpResponse response;
        if (!resource) {
            response.status_code = 404;
            return response;
        }
        if (!resource->head_supported) {
            response.status_code = 405;
            return response;
        }
        response.status_code = 200;
        describe(*resource, response);
        response.parse_headers();
        return response;
    }

    std::expected<HttpResponse, std::error_code>
    fetch(const HttpRequest& request, BodySink& sink) override {
        InFlight guard(*this);
        record("GET", request);

        auto scripted = next_script(request.url);
        if (scripted && scripted->error) {
            return std::unexpected(scripted->error);
        }

        HttpResponse response;
        auto resource = find(request.url);
        if (scripted && scripted->status != 0) {
            response.status_code = scripted->status;
        } else if (!resource) {
            response.status_code = 404;
        }
        if (response.status_code != 0) {
            if (auto ec = sink.on_response(response)) {
                return std::unexpected(ec);
            }
            return response;
        }

        std::uint64_t size = resource->body.size();
        std::uint64_t from = 0;
        std::uint64_t to = size == 0 ? 0 : size - 1;
        bool ranged = request.range && resource->accept_ranges && resource->honour_ranges;

        if (ranged) {
            from = request.range->from;
            if (scripted) from += scripted->range_shift;
            if (from >= size) {
                response.status_code = 416;
                response.headers["content-range"] = "bytes */" + std::to_string(size);
                response.parse_headers();
                if (auto ec = sink.on_response(response)) {
                    return std::unexpected(ec);
                }
                return response;
            }
            if (request.range->to) to = std::min(*request.range->to, size - 1);
            response.status_code = 206;
            response.headers["content-range"] = "bytes " + std::to_string(from) + "-" +
                                                std::to_string(to) + "/" + std::to_string(size);
        } else {
            response.status_code = 200;
        }

        std::uint64_t length = size == 0 ? 0 : to - from + 1;
        describe(*resource, response);
        if (resource->report_length) {
            response.headers["content-length"] = std::to_string(length);
        }
        response.parse_headers();

        if (auto ec = sink.on_response(response)) {
            return std::unexpected(ec);
        }

        std::uint64_t limit = length;
        if (scripted && scripted->cut_after) {
            limit = std::min(limit, *scripted->cut_after);
        }

        std::size_t chunk = std::max<std::size_t>(1, request.chunk_size);
        const auto* bytes = reinterpret_cast<const std::byte*>(resource->body.data());
        for (std::uint64_t done = 0; done < limit;) {
            if (request.stop.stop_requested()) {
                return std::unexpected(make_error_code(DownloadErrc::cancelled));
            }
            if (resource->chunk_delay.count() > 0 && !sleep(resource->chunk_delay, request.stop)) {
                return std::unexpected(make_error_code(DownloadErrc::cancelled));
            }
            auto n = static_cast<std::size_t>(std::min<std::uint64_t>(chunk, limit - done));
            if (auto ec = sink.on_data(bytes + from + done, n)) {
                return std::unexpected(ec);
            }
            done += n;
        }
        return response;
    }

private:
    class InFlight {
    public:
        explicit InFlight(FakeHttpClient& client) : client_(client) {
            int now = ++client_.in_flight_;
            int peak = client_.peak_.load();
            while (now > peak && !client_.peak_.compare_exchange_weak(peak, now)) {}
            { auto lock = std::unique_lock(client_.mutex_); }
            client_.cv_.notify_all();
        }
        ~InFlight() { --client_.in_flight_; }

        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;

    private:
        FakeHttpClient& client_;
    };

    static void describe(const Resource& resource, HttpResponse& response) {
        if (resource.report_length && response.status_code == 200) {
            response.headers["content-length"] = std::to_string(resource.body.size());
        }
        if (resource.accept_ranges) {
            response.headers["accept-ranges"] = "bytes";
        }
        if (!resource.etag.empty()) {
            response.headers["etag"] = resource.etag;
        }
    }

    static bool sleep(std::chrono::milliseconds delay, std::stop_token stop) {
        std::mutex m;
        std::condition_variable_any cv;
        auto lock = std::unique_lock(m);
        return !cv.wait_for(lock, stop, delay, [] { return false; }) && !stop.stop_requested();
    }

    void record(const char* method, const HttpRequest& request) {
        Call call;
        call.method = method;
        call.url = request.url;
        if (request.range) {
            call.range_from = request.range->from;
            call.range_to = request.range->to;
        }
        call.at = std::chrono::steady_clock::now();
        auto lock = std::unique_lock(mutex_);
        calls_.push_back(std::move(call));
    }

    std::optional<Resource> find(const std::string& url) const {
        auto lock = std::unique_lock(mutex_);
        auto it = resources_.find(url);
        if (it == resources_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Script> next_script(const std::string& url) {
        auto lock = std::unique_lock(mutex_);
        auto it = scripts_.find(url);
        if (it == scripts_.end() || it->second.empty()) return std::nullopt;
        Script answer = it->second.front();
        it->second.pop_front();
        return answer;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, std::deque<Script>> scripts_;
    std::vector<Call> calls_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
};

// Deterministic body of `size` bytes
inline std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
    }
    return body;
}

} // namespace ferry::test
