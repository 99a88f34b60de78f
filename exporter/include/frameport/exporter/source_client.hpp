#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/transport.hpp"
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace frameport {
namespace exporter {

struct SourceClientConfig {
    std::string api_base = "https://api.figma.com/v1";
    std::string token;
    std::string token_header = "X-Figma-Token";
};

// Outcome of one bulk resolve call
struct ResolveResponse {
    HttpResponse http;
    std::unordered_map<std::string, std::string> urls; // node id -> download URL
    std::vector<std::string> unresolved;               // ids answered with null or omitted
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;

    bool ok() const { return error_code == ErrorCode::none && http.is_success(); }
};

/**
 * Thin client for the design service's REST API.
 *
 * Every request carries the access token header. Responses are decoded here;
 * retry and rate-limit decisions belong to the callers.
 */
class SourceClient {
public:
    SourceClient(std::shared_ptr<Transport> transport, SourceClientConfig config);

    /**
     * Fetch the document tree of a source, or of a single subtree when
     * `root_node_id` is set. Fails on transport errors, non-2xx status and
     * undecodable bodies.
     */
    caf::expected<nlohmann::json> fetch_hierarchy(const std::string& source_id,
                                                  const std::optional<std::string>& root_node_id,
                                                  int64_t timeout_ms) const;

    // Resolve download URLs for a batch of node ids in one call
    ResolveResponse resolve_images(const std::string& source_id,
                                   const std::vector<std::string>& node_ids,
                                   double scale,
                                   ExportFormat format,
                                   int64_t timeout_ms) const;

    // Request for the CDN; no credentials are attached
    HttpRequest download_request(const std::string& url, int64_t timeout_ms) const;

    const SourceClientConfig& config() const { return config_; }
    std::shared_ptr<Transport> transport() const { return transport_; }

    static std::string url_encode(const std::string& value);
    static std::string format_scale(double scale);

    // File key from a share URL such as https://www.figma.com/design/<key>/Name
    static std::optional<std::string> extract_source_id(const std::string& url);

private:
    HttpRequest api_request(const std::string& url, int64_t timeout_ms) const;

    std::shared_ptr<Transport> transport_;
    SourceClientConfig config_;
};

} // namespace exporter
} // namespace frameport
