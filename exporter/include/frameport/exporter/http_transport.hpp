#pragma once

#include "frameport/exporter/transport.hpp"
#include <curl/curl.h>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace frameport {
namespace exporter {

/**
 * libcurl transport.
 *
 * Easy handles are pooled and reset between requests so keep-alive
 * connections to the API and the CDN are reused across workers.
 */
class CurlTransport : public Transport {
public:
    // Headers of the last response in a redirect chain
    struct ResponseHeaders {
        std::string retry_after;
        std::string content_type;
    };

    // One raw header line as libcurl delivers it; a status line starts a new response
    static void apply_header_line(const std::string& line, ResponseHeaders& headers);

    explicit CurlTransport(std::size_t max_pooled_handles = 16);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const HttpRequest& request) override;
    HttpResponse download(const HttpRequest& request,
                          const std::filesystem::path& destination,
                          const std::atomic<bool>* abort_flag) override;

    std::size_t pooled_handles() const;

private:
    CURL* acquire_handle();
    void release_handle(CURL* handle);

    std::size_t max_pooled_handles_;
    mutable std::mutex pool_mutex_;
    std::vector<CURL*> available_handles_;
};

} // namespace exporter
} // namespace frameport
