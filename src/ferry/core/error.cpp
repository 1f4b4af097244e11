// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>
#include <ferry/disk/error.hpp>

namespace ferry::core {

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::transient_network: return "transient-network";
        case FailureKind::transient_server:  return "transient-server";
        case FailureKind::permanent:         return "permanent";
        case FailureKind::local_io:          return "local-io";
        case FailureKind::cancelled:         return "cancelled";
        case FailureKind::probe_failure:     return "probe-failure";
    }
    return "unknown";
}

FailureKind classify(const std::error_code& ec) noexcept {
    if (ec.category() == disk::disk_errc_category()) {
        return FailureKind::local_io;
    }

    if (ec.category() != download_errc_category()) {
        // generic/system codes come from the filesystem layer
        if (ec == std::errc::operation_canceled) {
            return FailureKind::cancelled;
        }
        return FailureKind::local_io;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::refused:
        case DownloadErrc::connection_lost:
        case DownloadErrc::dns_error:
        case DownloadErrc::short_read:
            return FailureKind::transient_network;

        case DownloadErrc::server_error:
        case DownloadErrc::throttled:
        case DownloadErrc::range_not_satisfiable:
        case DownloadErrc::validator_changed:
            return FailureKind::transient_server;

        case DownloadErrc::cancelled:
            return FailureKind::cancelled;

        case DownloadErrc::probe_failed:
            return FailureKind::probe_failure;

        case DownloadErrc::ssl_error:
        case DownloadErrc::too_many_redirects:
        case DownloadErrc::not_found:
        case DownloadErrc::permission_denied:
        case DownloadErrc::client_error:
        case DownloadErrc::malformed_response:
        case DownloadErrc::invalid_url:
        case DownloadErrc::size_mismatch:
        case DownloadErrc::invalid_state:
        case DownloadErrc::invalid_config:
        case DownloadErrc::success:
        default:
            return FailureKind::permanent;
    }
}

std::error_code http_status_error(long status) noexcept {
    if (status >= 200 && status < 300) {
        return {};
    }
    if (status == 408) {
        return make_error_code(DownloadErrc::timeout);
    }
    if (status == 429) {
        return make_error_code(DownloadErrc::throttled);
    }
    if (status == 416) {
        return make_error_code(DownloadErrc::range_not_satisfiable);
    }
    if (status == 404 || status == 410) {
        return make_error_code(DownloadErrc::not_found);
    }
    if (status == 401 || status == 403) {
        return make_error_code(DownloadErrc::permission_denied);
    }
    if (status >= 400 && status < 500) {
        return make_error_code(DownloadErrc::client_error);
    }
    if (status >= 500 && status < 600) {
        return make_error_code(DownloadErrc::server_error);
    }
    return make_error_code(DownloadErrc::malformed_response);
}

} // namespace ferry::core
