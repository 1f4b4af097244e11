// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/webhook_notifier.hpp>
#include <ferry/core/curl_http_client.hpp>
#include <ferry/core/log.hpp>
#include <ferry/version.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ferry::core {

namespace {

struct CurlHandle {
    CURL* ptr = nullptr;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct SlistGuard {
    curl_slist* list = nullptr;
    ~SlistGuard() { if (list) curl_slist_free_all(list); }
};

// Response body is not needed
std::size_t discard_body(char*, std::size_t size, std::size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

std::string WebhookNotifier::payload(const BatchSummary& summary) {
    nlohmann::json body = {
        {"message", "Download job completed"},
        {"total_files", summary.total},
        {"successful_downloads", summary.succeeded},
        {"failed_downloads", summary.failed},
    };
    return body.dump();
}

void WebhookNotifier::notify(const BatchSummary& summary) {
    if (url_.empty()) {
        return;
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        log::logger()->error("webhook: cannot create curl handle");
        return;
    }

    auto body = payload(summary);
    SlistGuard headers;
    headers.list = curl_slist_append(headers.list, "Content-Type: application/json");

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent().c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, discard_body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        auto ec = CurlHttpClient::curl_error(result);
        log::logger()->error("webhook {} failed: {} ({})", url_, ec.message(), curl_easy_strerror(result));
        return;
    }

    long status = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        log::logger()->error("webhook {} answered {}", url_, status);
        return;
    }
    log::logger()->info("webhook notified: {} total, {} succeeded, {} failed",
                        summary.total, summary.succeeded, summary.failed);
}

} // namespace ferry::core
