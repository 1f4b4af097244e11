// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    connection_lost,
    dns_error,
    ssl_error,
    too_many_redirects,
    short_read,
    server_error,
    throttled,
    range_not_satisfiable,
    validator_changed,
    not_found,
    permission_denied,
    client_error,
    malformed_response,
    invalid_url,
    size_mismatch,
    probe_failed,
    cancelled,
    invalid_state,
    invalid_config,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::network_error:         return "Network error";
            case DownloadErrc::timeout:               return "Operation timed out";
            case DownloadErrc::refused:               return "Connection refused";
            case DownloadErrc::connection_lost:       return "Connection lost";
            case DownloadErrc::dns_error:             return "DNS resolution failed";
            case DownloadErrc::ssl_error:             return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:    return "Too many redirects";
            case DownloadErrc::short_read:            return "Connection closed before range was complete";
            case DownloadErrc::server_error:          return "Server error (5xx)";
            case DownloadErrc::throttled:             return "Throttled by server (429)";
            case DownloadErrc::range_not_satisfiable: return "Range not satisfiable (416)";
            case DownloadErrc::validator_changed:     return "Remote resource changed";
            case DownloadErrc::not_found:             return "Resource not found (404)";
            case DownloadErrc::permission_denied:     return "Access denied by server";
            case DownloadErrc::client_error:          return "Client error (4xx)";
            case DownloadErrc::malformed_response:    return "Malformed response";
            case DownloadErrc::invalid_url:           return "Invalid URL";
            case DownloadErrc::size_mismatch:         return "Downloaded size does not match expected size";
            case DownloadErrc::probe_failed:          return "Could not determine size or range support";
            case DownloadErrc::cancelled:             return "Download cancelled";
            case DownloadErrc::invalid_state:         return "Invalid job state transition";
            case DownloadErrc::invalid_config:        return "Invalid configuration";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Closed set of failure classes. Decided once where the failure happens and
// carried with the error through retry and reporting.
enum class FailureKind : std::uint8_t {
    transient_network,
    transient_server,
    permanent,
    local_io,
    cancelled,
    probe_failure,
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

// Map any error code (download, disk, generic or system category) to its class
[[nodiscard]] FailureKind classify(const std::error_code& ec) noexcept;

// Error for a final HTTP status; empty for 2xx
[[nodiscard]] std::error_code http_status_error(long status) noexcept;

// An error together with its classification
struct TransferError {
    std::error_code code;
    FailureKind kind{FailureKind::permanent};

    TransferError() = default;
    TransferError(std::error_code ec) noexcept : code(ec), kind(classify(ec)) {}

    [[nodiscard]] std::string message() const { return code.message(); }
};

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::DownloadErrc> : true_type {};

} // namespace std
