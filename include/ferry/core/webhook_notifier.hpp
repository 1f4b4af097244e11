// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/collaborators.hpp>
#include <chrono>
#include <string>

namespace ferry::core {

// Posts the batch summary as JSON to a webhook URL. Failures are logged,
// never thrown; an empty URL disables it.
class WebhookNotifier final : public BatchNotifier {
public:
    explicit WebhookNotifier(std::string url,
                             std::chrono::seconds timeout = std::chrono::seconds{30})
        : url_(std::move(url)), timeout_(timeout) {}

    void notify(const BatchSummary& summary) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    // {"message", "total_files", "successful_downloads", "failed_downloads"}
    [[nodiscard]] static std::string payload(const BatchSummary& summary);

private:
    std::string url_;
    std::chrono::seconds timeout_;
};

} // namespace ferry::core
