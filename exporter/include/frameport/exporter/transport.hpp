#pragma once

#include "frameport/exporter/core.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace frameport {
namespace exporter {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    int64_t timeout_ms = 30000;
};

struct HttpResponse {
    int status_code = 0;          // 0 when no response arrived
    std::string body;             // empty for download()
    std::string retry_after;      // raw Retry-After header value
    std::string content_type;
    std::string error;            // transport-level failure message
    ErrorCode error_code = ErrorCode::none;
    int64_t bytes = 0;

    bool is_transport_error() const { return error_code != ErrorCode::none; }
    bool is_success() const { return !is_transport_error() && status_code >= 200 && status_code < 300; }
    bool is_rate_limited() const { return status_code == 429; }
};

/**
 * HTTP collaborator used by the pipeline. Implementations must be safe to call
 * from many threads at once.
 */
class Transport {
public:
    virtual ~Transport() = default;

    // Buffered request; body returned in the response
    virtual HttpResponse get(const HttpRequest& request) = 0;

    // Streams the body into `destination`. The transfer is aborted when
    // `abort_flag` becomes true. The caller owns cleanup of the file.
    virtual HttpResponse download(const HttpRequest& request,
                                  const std::filesystem::path& destination,
                                  const std::atomic<bool>* abort_flag) = 0;
};

} // namespace exporter
} // namespace frameport
