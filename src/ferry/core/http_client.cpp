// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/http_client.hpp>
#include <charconv>

namespace ferry::core {

namespace {

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    // Digits only; values past 64 bits are treated as absent
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

const std::string* find_header(const std::map<std::string, std::string>& headers,
                               const char* name) noexcept {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return nullptr;
    return &it->second;
}

} // namespace

std::string RangeSpec::header_value() const {
    std::string value = "bytes=" + std::to_string(from) + "-";
    if (to) {
        value += std::to_string(*to);
    }
    return value;
}

std::string HttpResponse::validator() const {
    // Weak ETags (W/"...") do not identify exact bytes
    if (!etag.empty() && !etag.starts_with("W/")) {
        return etag;
    }
    return last_modified;
}

void HttpResponse::parse_headers() {
    content_length.reset();
    content_range_start.reset();
    content_range_total.reset();
    accepts_ranges = false;
    etag.clear();
    last_modified.clear();

    if (auto* cl = find_header(headers, "content-length")) {
        content_length = parse_u64(*cl);
    }

    // Content-Range: bytes 0-99/1234 or bytes */1234
    if (auto* cr = find_header(headers, "content-range")) {
        std::string_view range(*cr);
        auto slash = range.rfind('/');
        if (slash != std::string_view::npos) {
            content_range_total = parse_u64(range.substr(slash + 1));
        }
        constexpr std::string_view UNIT = "bytes ";
        auto dash = range.find('-');
        if (range.starts_with(UNIT) && dash != std::string_view::npos && dash < slash) {
            content_range_start = parse_u64(range.substr(UNIT.size(), dash - UNIT.size()));
        }
    }

    if (auto* ar = find_header(headers, "accept-ranges")) {
        accepts_ranges = ar->find("bytes") != std::string::npos;
    }
    if (status_code == 206) {
        accepts_ranges = true;
    }

    if (auto* et = find_header(headers, "etag")) {
        etag = *et;
    }
    if (auto* lm = find_header(headers, "last-modified")) {
        last_modified = *lm;
    }
}

} // namespace ferry::core
