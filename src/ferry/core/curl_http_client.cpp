// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/curl_http_client.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/url.hpp>
#include <ferry/version.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>

namespace ferry::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// State shared by the callbacks of one transfer
struct TransferContext {
    CURL* curl{nullptr};
    const HttpRequest* request{nullptr};
    BodySink* sink{nullptr};
    HttpResponse response;
    bool delivered{false};        // on_response called
    std::error_code sink_error;
};

long response_status(CURL* curl, const HttpRequest& request) noexcept {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    // Non-HTTP schemes (file://) report no status
    if (http_code == 0 && !request.url.starts_with("http")) {
        http_code = 200;
    }
    return http_code;
}

// Hand the headers of the final response to the sink exactly once
bool deliver_response(TransferContext& ctx) {
    if (ctx.delivered) return !ctx.sink_error;
    ctx.delivered = true;

    ctx.response.status_code = response_status(ctx.curl, *ctx.request);
    ctx.response.parse_headers();
    ctx.sink_error = ctx.sink->on_response(ctx.response);
    return !ctx.sink_error;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string_view line(buffer, total);

    // Blank line ends a header block; only the last (non-redirect) block counts
    if (line == "\r\n" || line == "\n") {
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        bool interim = code < 200 || (FOLLOW_REDIRECTS && code >= 300 && code < 400);
        if (!interim && ctx->sink && !deliver_response(*ctx)) {
            return 0;  // abort
        }
        return total;
    }

    CurlHttpClient::parse_header_line(line, ctx->response.headers);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    std::size_t total = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);

    if (!deliver_response(*ctx)) {
        return 0;
    }

    // libcurl buffers may exceed the requested chunk size
    std::size_t chunk = std::max<std::size_t>(1, ctx->request->chunk_size);
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    for (std::size_t done = 0; done < total; done += chunk) {
        auto ec = ctx->sink->on_data(bytes + done, std::min(chunk, total - done));
        if (ec) {
            ctx->sink_error = ec;
            return 0;
        }
    }
    return total;
}

// Aborts the transfer once the request's stop token fires
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->request->stop.stop_requested() ? 1 : 0;
}

void apply_common_options(CURL* curl, const HttpRequest& request, TransferContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent().c_str());

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

} // namespace

//=============================================================================
// CurlHttpClient
//=============================================================================

std::expected<HttpResponse, std::error_code>
CurlHttpClient::head(const HttpRequest& request) {
    if (!Url::parse(request.url)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.request = &request;

    apply_common_options(curl.ptr, request, ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result));
    }

    ctx.response.status_code = response_status(curl.ptr, request);
    ctx.response.parse_headers();
    return ctx.response;
}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::fetch(const HttpRequest& request, BodySink& sink) {
    if (!Url::parse(request.url)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.request = &request;
    ctx.sink = &sink;

    apply_common_options(curl.ptr, request, ctx);

    std::string range;
    if (request.range) {
        // CURLOPT_RANGE takes the value without the "bytes=" prefix
        range = request.range->header_value().substr(6);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE,
                     static_cast<long>(std::clamp<std::size_t>(request.chunk_size, 1024, CURL_MAX_READ_SIZE)));

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.sink_error) {
        return std::unexpected(ctx.sink_error);
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result));
    }

    // Empty bodies never reach the write callback
    if (!deliver_response(ctx)) {
        return std::unexpected(ctx.sink_error);
    }
    return ctx.response;
}

void CurlHttpClient::parse_header_line(std::string_view line,
                                       std::map<std::string, std::string>& headers) {
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    // Trim whitespace and \r\n
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    headers[lower_name] = std::string(value);
}

std::error_code CurlHttpClient::curl_error(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return {};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_PARTIAL_FILE:
            return make_error_code(DownloadErrc::short_read);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::range_not_satisfiable);
        case CURLE_FILE_COULDNT_READ_FILE:
            return make_error_code(DownloadErrc::not_found);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        log::logger()->critical("curl_global_init failed");
    }
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::core
