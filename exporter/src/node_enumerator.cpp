#include "frameport/exporter/node_enumerator.hpp"
#include <caf/sec.hpp>
#include <unordered_set>

namespace frameport {
namespace exporter {

using json = nlohmann::json;

namespace {

std::string string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it != node.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

void walk(const json& node,
          std::vector<std::string>& path,
          std::unordered_set<std::string>& seen,
          std::vector<NodeDescriptor>& out) {
    if (!node.is_object()) {
        return;
    }
    auto visible = node.find("visible");
    if (visible != node.end() && visible->is_boolean() && !visible->get<bool>()) {
        return;
    }

    std::string type = string_field(node, "type");
    std::string id = string_field(node, "id");

    if (NodeEnumerator::is_exportable_type(type)) {
        if (!id.empty() && seen.insert(id).second) {
            NodeDescriptor descriptor;
            descriptor.id = id;
            descriptor.name = string_field(node, "name");
            descriptor.type = type;
            descriptor.path = path;
            out.push_back(std::move(descriptor));
        }
        return;
    }

    if (!NodeEnumerator::is_container_type(type)) {
        return;
    }

    auto children = node.find("children");
    if (children == node.end() || !children->is_array()) {
        return;
    }

    // The document root contributes no path segment
    bool named_segment = type != "DOCUMENT";
    if (named_segment) {
        path.push_back(string_field(node, "name"));
    }
    for (const auto& child : *children) {
        walk(child, path, seen, out);
    }
    if (named_segment) {
        path.pop_back();
    }
}

} // namespace

NodeEnumerator::NodeEnumerator(std::shared_ptr<SourceClient> client) : client_(std::move(client)) {}

bool NodeEnumerator::is_exportable_type(const std::string& type) {
    return type == "FRAME" || type == "COMPONENT" || type == "COMPONENT_SET";
}

bool NodeEnumerator::is_container_type(const std::string& type) {
    return type == "DOCUMENT" || type == "CANVAS" || type == "SECTION";
}

std::vector<NodeDescriptor> NodeEnumerator::collect(const json& document) {
    std::vector<NodeDescriptor> nodes;
    std::vector<std::string> path;
    std::unordered_set<std::string> seen;
    walk(document, path, seen, nodes);
    return nodes;
}

caf::expected<json> NodeEnumerator::find_page(const json& document, const std::string& page_name) {
    const auto is_page = [&page_name](const json& node) {
        return node.is_object() && string_field(node, "type") == "CANVAS" &&
               string_field(node, "name") == page_name;
    };
    if (is_page(document)) {
        return document;
    }
    auto children = document.find("children");
    if (children != document.end() && children->is_array()) {
        for (const auto& child : *children) {
            if (is_page(child)) {
                return child;
            }
        }
    }
    return caf::make_error(caf::sec::invalid_argument, "page '" + page_name + "' not found");
}

caf::expected<std::vector<NodeDescriptor>> NodeEnumerator::enumerate(
    const std::string& source_id,
    int64_t timeout_ms,
    const std::optional<std::string>& root_node_id,
    const std::optional<std::string>& page_name) const {
    if (source_id.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "source id is empty");
    }

    auto document = client_->fetch_hierarchy(source_id, root_node_id, timeout_ms);
    if (!document) {
        return document.error();
    }
    if (!document->is_object() || !document->contains("type")) {
        return caf::make_error(caf::sec::runtime_error, "malformed hierarchy response: root has no type");
    }
    if (page_name) {
        auto page = find_page(*document, *page_name);
        if (!page) {
            return page.error();
        }
        return collect(*page);
    }
    return collect(*document);
}

} // namespace exporter
} // namespace frameport
