#include "frameport/exporter/source_client.hpp"
#include "frameport/exporter/result_converter.hpp"
#include <caf/sec.hpp>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

namespace frameport {
namespace exporter {

using json = nlohmann::json;

SourceClient::SourceClient(std::shared_ptr<Transport> transport, SourceClientConfig config)
    : transport_(std::move(transport)), config_(std::move(config)) {
    while (!config_.api_base.empty() && config_.api_base.back() == '/') {
        config_.api_base.pop_back();
    }
}

std::string SourceClient::url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

// 2.0 -> "2", 1.5 -> "1.5"
std::string SourceClient::format_scale(double scale) {
    std::ostringstream out;
    out << std::setprecision(6) << std::noshowpoint << scale;
    return out.str();
}

std::optional<std::string> SourceClient::extract_source_id(const std::string& url) {
    static const std::regex pattern(R"(figma\.com/(?:file|design)/([A-Za-z0-9]+))");
    std::smatch match;
    if (std::regex_search(url, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

HttpRequest SourceClient::api_request(const std::string& url, int64_t timeout_ms) const {
    HttpRequest request;
    request.url = url;
    request.timeout_ms = timeout_ms;
    request.headers.emplace_back(config_.token_header, config_.token);
    request.headers.emplace_back("Accept", "application/json");
    return request;
}

HttpRequest SourceClient::download_request(const std::string& url, int64_t timeout_ms) const {
    HttpRequest request;
    request.url = url;
    request.timeout_ms = timeout_ms;
    return request;
}

caf::expected<json> SourceClient::fetch_hierarchy(const std::string& source_id,
                                                  const std::optional<std::string>& root_node_id,
                                                  int64_t timeout_ms) const {
    std::string url = config_.api_base + "/files/" + url_encode(source_id);
    if (root_node_id) {
        url += "/nodes?ids=" + url_encode(*root_node_id);
    }

    HttpResponse response = transport_->get(api_request(url, timeout_ms));
    if (response.is_transport_error()) {
        return caf::make_error(caf::sec::runtime_error,
                               "hierarchy request failed: " + response.error);
    }
    if (!response.is_success()) {
        return caf::make_error(caf::sec::runtime_error,
                               "hierarchy request failed: HTTP " + std::to_string(response.status_code));
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        return caf::make_error(caf::sec::runtime_error,
                               "malformed hierarchy response: " + std::string(e.what()));
    }

    if (root_node_id) {
        // {"nodes": {"<id>": {"document": {...}}}}
        auto nodes = body.find("nodes");
        if (nodes == body.end() || !nodes->is_object()) {
            return caf::make_error(caf::sec::runtime_error, "malformed hierarchy response: missing nodes");
        }
        auto entry = nodes->find(*root_node_id);
        if (entry == nodes->end() || !entry->is_object() || !entry->contains("document")) {
            return caf::make_error(caf::sec::runtime_error,
                                   "root node " + *root_node_id + " not found in " + source_id);
        }
        return (*entry)["document"];
    }

    auto document = body.find("document");
    if (document == body.end() || !document->is_object()) {
        return caf::make_error(caf::sec::runtime_error, "malformed hierarchy response: missing document");
    }
    return *document;
}

ResolveResponse SourceClient::resolve_images(const std::string& source_id,
                                             const std::vector<std::string>& node_ids,
                                             double scale,
                                             ExportFormat format,
                                             int64_t timeout_ms) const {
    ResolveResponse result;

    std::string ids;
    for (size_t i = 0; i < node_ids.size(); ++i) {
        if (i > 0) ids += ',';
        ids += url_encode(node_ids[i]);
    }
    std::string url = config_.api_base + "/images/" + url_encode(source_id) + "?ids=" + ids +
                      "&format=" + ResultConverter::format_to_string(format) +
                      "&scale=" + format_scale(scale);

    result.http = transport_->get(api_request(url, timeout_ms));
    if (result.http.is_transport_error()) {
        result.error_code = result.http.error_code;
        result.error_message = result.http.error;
        return result;
    }
    if (result.http.is_rate_limited()) {
        result.error_code = ErrorCode::rate_limited;
        result.error_message = "HTTP 429";
        return result;
    }
    if (!result.http.is_success()) {
        result.error_code = ErrorCode::http_error;
        result.error_message = "HTTP " + std::to_string(result.http.status_code);
        return result;
    }

    json body;
    try {
        body = json::parse(result.http.body);
    } catch (const json::parse_error& e) {
        result.error_code = ErrorCode::invalid_format;
        result.error_message = "malformed resolve response: " + std::string(e.what());
        return result;
    }

    auto images = body.find("images");
    if (images == body.end() || !images->is_object()) {
        result.error_code = ErrorCode::invalid_format;
        result.error_message = "malformed resolve response: missing images";
        if (body.contains("err") && body["err"].is_string()) {
            result.error_message += " (" + body["err"].get<std::string>() + ")";
        }
        return result;
    }

    for (const auto& id : node_ids) {
        auto it = images->find(id);
        if (it != images->end() && it->is_string() && !it->get<std::string>().empty()) {
            result.urls[id] = it->get<std::string>();
        } else {
            result.unresolved.push_back(id);
        }
    }
    return result;
}

} // namespace exporter
} // namespace frameport
