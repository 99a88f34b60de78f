#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/source_client.hpp"
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace frameport {
namespace exporter {

/**
 * Lists the exportable nodes of a source.
 *
 * Traversal is depth-first through DOCUMENT, CANVAS and SECTION containers.
 * FRAME, COMPONENT and COMPONENT_SET nodes are collected but not descended
 * into. Hidden subtrees are skipped and ids are de-duplicated keeping the
 * first occurrence, so the output order is deterministic.
 *
 * With a page name only the CANVAS carrying that exact name is walked.
 */
class NodeEnumerator {
public:
    explicit NodeEnumerator(std::shared_ptr<SourceClient> client);

    // No retries: any fetch or decode failure is returned as an error
    caf::expected<std::vector<NodeDescriptor>> enumerate(const std::string& source_id,
                                                         int64_t timeout_ms,
                                                         const std::optional<std::string>& root_node_id = std::nullopt,
                                                         const std::optional<std::string>& page_name = std::nullopt) const;

    static std::vector<NodeDescriptor> collect(const nlohmann::json& document);

    // The first CANVAS named `page_name`, the document itself included
    static caf::expected<nlohmann::json> find_page(const nlohmann::json& document, const std::string& page_name);

    static bool is_exportable_type(const std::string& type);
    static bool is_container_type(const std::string& type);

private:
    std::shared_ptr<SourceClient> client_;
};

} // namespace exporter
} // namespace frameport
