// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_worker.hpp>

namespace ferry::core {

HttpRequest WorkerContext::make_request(const std::string& url) const {
    HttpRequest request;
    request.url = url;
    request.timeout = std::chrono::seconds{config.timeout_seconds};
    request.chunk_size = config.chunk_size_bytes;
    request.stop = stop;
    return request;
}

} // namespace ferry::core
