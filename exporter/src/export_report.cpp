#include "frameport/exporter/export_report.hpp"
#include "frameport/exporter/result_converter.hpp"
#include <caf/sec.hpp>
#include <fstream>
#include <optional>
#include <system_error>

namespace frameport {
namespace exporter {

using json = nlohmann::json;

void ReportBuilder::set_total(int64_t total) {
    std::lock_guard<std::mutex> lock(mu_);
    total_ = total;
}

void ReportBuilder::add(const ExportResult& result) {
    std::lock_guard<std::mutex> lock(mu_);
    if (result.is_success()) {
        succeeded_.push_back(result);
    } else {
        failed_.push_back(result);
    }
}

size_t ReportBuilder::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return succeeded_.size() + failed_.size();
}

bool ReportBuilder::contains(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& r : succeeded_) {
        if (r.node.id == node_id) return true;
    }
    for (const auto& r : failed_) {
        if (r.node.id == node_id) return true;
    }
    return false;
}

ExportReport ReportBuilder::build(std::chrono::milliseconds duration) const {
    std::lock_guard<std::mutex> lock(mu_);
    ExportReport report;
    report.total = total_;
    report.succeeded = succeeded_;
    report.failed = failed_;
    report.duration = duration;
    return report;
}

static json result_to_json(const ExportResult& result) {
    json entry;
    entry["id"] = result.node.id;
    entry["name"] = result.node.name;
    entry["type"] = result.node.type;
    entry["ancestors"] = result.node.path;
    entry["status"] = ResultConverter::outcome_to_string(result.status);
    entry["attempts"] = result.attempts;
    if (result.is_success()) {
        entry["path"] = result.path;
    } else {
        entry["reason"] = result.reason;
        entry["error_code"] = ResultConverter::error_code_to_string(result.error_code);
    }
    return entry;
}

json report_to_json(const ExportReport& report, const ExportJob& job, JobStatus status) {
    json config;
    config["format"] = ResultConverter::format_to_string(job.format);
    config["scale"] = job.scale;
    config["max_workers"] = job.max_workers;
    config["batch_size"] = job.batch_size;
    config["api_timeout_ms"] = job.api_timeout_ms;
    config["transfer_timeout_ms"] = job.transfer_timeout_ms;
    config["max_retries"] = job.max_retries;
    if (job.root_node_id) {
        config["root_node_id"] = *job.root_node_id;
    }
    if (job.page_name) {
        config["page_name"] = *job.page_name;
    }

    json nodes = json::array();
    for (const auto& result : report.succeeded) {
        nodes.push_back(result_to_json(result));
    }
    for (const auto& result : report.failed) {
        nodes.push_back(result_to_json(result));
    }

    json manifest;
    manifest["source_id"] = job.source_id;
    manifest["output_dir"] = job.output_dir;
    manifest["status"] = ResultConverter::job_status_to_string(status);
    manifest["config"] = config;
    manifest["total"] = report.total;
    manifest["succeeded"] = report.succeeded.size();
    manifest["failed"] = report.failed.size();
    manifest["duration_ms"] = report.duration.count();
    manifest["success_rate"] = report.success_rate();
    manifest["nodes"] = nodes;
    return manifest;
}

caf::expected<std::filesystem::path> write_manifest(const ExportReport& report,
                                                    const ExportJob& job,
                                                    JobStatus status) {
    std::filesystem::path target = std::filesystem::path(job.output_dir) / kManifestFileName;
    std::filesystem::path temp = target;
    temp += ".part";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return caf::make_error(caf::sec::runtime_error, "cannot open " + temp.string() + " for writing");
        }
        out << report_to_json(report, job, status).dump(2) << '\n';
        if (!out) {
            return caf::make_error(caf::sec::runtime_error, "failed writing " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp, cleanup_ec);
        return caf::make_error(caf::sec::runtime_error, "cannot move manifest into place: " + ec.message());
    }
    return target;
}

caf::expected<std::vector<NodeDescriptor>> read_failed_nodes(const std::filesystem::path& manifest_path) {
    std::ifstream in(manifest_path);
    if (!in) {
        return caf::make_error(caf::sec::invalid_argument, "cannot read manifest " + manifest_path.string());
    }

    json manifest;
    try {
        in >> manifest;
    } catch (const json::parse_error& e) {
        return caf::make_error(caf::sec::invalid_argument,
                               "malformed manifest " + manifest_path.string() + ": " + e.what());
    }

    auto nodes = manifest.find("nodes");
    if (nodes == manifest.end() || !nodes->is_array()) {
        return caf::make_error(caf::sec::invalid_argument, "manifest has no node list");
    }

    const auto string_member = [](const json& entry, const char* key) -> std::optional<std::string> {
        auto it = entry.find(key);
        if (it == entry.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    };

    std::vector<NodeDescriptor> failed;
    for (const auto& entry : *nodes) {
        if (!entry.is_object() || string_member(entry, "status").value_or("") != "failed") {
            continue;
        }
        auto id = string_member(entry, "id");
        if (!id) {
            return caf::make_error(caf::sec::invalid_argument,
                                   "malformed manifest " + manifest_path.string() + ": failed entry without a string id");
        }
        NodeDescriptor node;
        node.id = *id;
        node.name = string_member(entry, "name").value_or("");
        node.type = string_member(entry, "type").value_or("");
        if (entry.contains("ancestors") && entry["ancestors"].is_array()) {
            for (const auto& segment : entry["ancestors"]) {
                if (segment.is_string()) {
                    node.path.push_back(segment.get<std::string>());
                }
            }
        }
        if (!node.id.empty()) {
            failed.push_back(std::move(node));
        }
    }
    return failed;
}

QualityReport validate_outputs(const ExportReport& report, int64_t min_bytes) {
    QualityReport quality;
    for (const auto& result : report.succeeded) {
        std::error_code ec;
        auto size = std::filesystem::file_size(result.path, ec);
        if (ec) {
            quality.invalid_files++;
            quality.issues.push_back(result.path + ": missing (" + ec.message() + ")");
            continue;
        }
        quality.total_bytes += static_cast<int64_t>(size);
        if (static_cast<int64_t>(size) < min_bytes) {
            quality.invalid_files++;
            quality.issues.push_back(result.path + ": " + std::to_string(size) + " bytes, expected at least " +
                                     std::to_string(min_bytes));
            continue;
        }
        quality.valid_files++;
    }
    return quality;
}

} // namespace exporter
} // namespace frameport
