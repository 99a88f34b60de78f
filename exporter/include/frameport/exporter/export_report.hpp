#pragma once

#include "frameport/exporter/core.hpp"
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace frameport {
namespace exporter {

inline constexpr const char* kManifestFileName = "export_report.json";

/**
 * Collects per-node outcomes as workers finish them and freezes the report
 * once the job is over. Safe to call add() from any thread.
 */
class ReportBuilder {
public:
    explicit ReportBuilder(int64_t total = 0) : total_(total) {}

    void set_total(int64_t total);
    void add(const ExportResult& result);
    size_t size() const;
    bool contains(const std::string& node_id) const;

    ExportReport build(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mu_;
    int64_t total_;
    std::vector<ExportResult> succeeded_;
    std::vector<ExportResult> failed_;
};

// Summary of validate_outputs()
struct QualityReport {
    int64_t valid_files = 0;
    int64_t invalid_files = 0;
    int64_t total_bytes = 0;
    std::vector<std::string> issues;

    bool ok() const { return invalid_files == 0; }
};

nlohmann::json report_to_json(const ExportReport& report, const ExportJob& job, JobStatus status);

// Writes <output_dir>/export_report.json atomically (temp file + rename)
caf::expected<std::filesystem::path> write_manifest(const ExportReport& report,
                                                    const ExportJob& job,
                                                    JobStatus status);

// Nodes recorded as failed in a previous manifest, for re-export
caf::expected<std::vector<NodeDescriptor>> read_failed_nodes(const std::filesystem::path& manifest_path);

// Every succeeded path must exist and be at least min_bytes long
QualityReport validate_outputs(const ExportReport& report, int64_t min_bytes = 1024);

} // namespace exporter
} // namespace frameport
