#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace frameport {
namespace exporter {

// Output formats accepted by the bulk resolve endpoint
enum class ExportFormat {
    png,
    jpg,
    svg,
    pdf
};

// Preset selection resolved once per job; presets differ only in job defaults
enum class ExportStrategy {
    fast,
    conservative
};

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    invalid_format = 1003,
    // Pipeline errors (2xxx)
    enumeration_failed = 2001,
    resolution_failed = 2002,
    transfer_failed = 2003,
    storage_failed = 2004,
    all_nodes_failed = 2005,
    // Network errors (3xxx)
    network_error = 3001,
    connection_timeout = 3002,
    http_error = 3003,
    rate_limited = 3004,
    // System errors (4xxx)
    internal_error = 4001,
    // Cancellation (5xxx)
    cancelled_by_user = 5001
};

// An addressable, exportable unit of the remote hierarchy.
// Identity is `id`; the enumerator guarantees ids are unique within a job.
struct NodeDescriptor {
    std::string id;
    std::string name;
    std::string type;
    std::vector<std::string> path; // ancestor names, outermost first

    bool operator==(const NodeDescriptor& other) const {
        return id == other.id && name == other.name && type == other.type && path == other.path;
    }
};

// One complete export request. Immutable once handed to the coordinator.
struct ExportJob {
    std::string source_id;
    std::vector<NodeDescriptor> nodes; // non-empty: export exactly these, skip enumeration
    std::string output_dir;
    std::optional<std::string> root_node_id;
    std::optional<std::string> page_name; // only frames of the CANVAS with this name
    double scale = 2.0;
    std::vector<double> scales;           // non-empty: one pass per scale into scale_<N>x/
    ExportFormat format = ExportFormat::png;
    int max_workers = 8;
    int batch_size = 15;
    int64_t api_timeout_ms = 15000;      // bounds one resolve/hierarchy call
    int64_t transfer_timeout_ms = 30000; // bounds one download attempt
    int32_t max_retries = 5;
    bool write_manifest = true;

    static ExportJob for_strategy(ExportStrategy strategy) {
        ExportJob job;
        if (strategy == ExportStrategy::conservative) {
            job.max_workers = 1;
            job.batch_size = 5;
            job.api_timeout_ms = 60000;
            job.transfer_timeout_ms = 120000;
            job.max_retries = 3;
        }
        return job;
    }
};

enum class OutcomeStatus {
    success,
    permanent_failure
};

// Per-node outcome. Failures are values, never exceptions.
struct ExportResult {
    NodeDescriptor node;
    OutcomeStatus status = OutcomeStatus::success;
    ErrorCode error_code = ErrorCode::none;
    std::string path;    // set on success
    std::string reason;  // human-readable, set on failure
    int32_t attempts = 0;

    bool is_success() const { return status == OutcomeStatus::success; }
    bool is_failure() const { return status == OutcomeStatus::permanent_failure; }

    static ExportResult success(const NodeDescriptor& node, const std::string& path, int32_t attempts = 1) {
        ExportResult result;
        result.node = node;
        result.status = OutcomeStatus::success;
        result.path = path;
        result.attempts = attempts;
        return result;
    }

    static ExportResult permanent_failure(const NodeDescriptor& node,
                                          ErrorCode code,
                                          const std::string& reason,
                                          int32_t attempts = 0) {
        ExportResult result;
        result.node = node;
        result.status = OutcomeStatus::permanent_failure;
        result.error_code = code;
        result.reason = reason;
        result.attempts = attempts;
        return result;
    }
};

// Final, immutable summary of a job. total == succeeded.size() + failed.size().
struct ExportReport {
    int64_t total = 0;
    std::vector<ExportResult> succeeded;
    std::vector<ExportResult> failed;
    std::chrono::milliseconds duration{0};

    double success_rate() const {
        return total > 0 ? static_cast<double>(succeeded.size()) / static_cast<double>(total) : 0.0;
    }
};

// Job status aligned with the CLI exit codes
enum class JobStatus {
    ok,        // every node succeeded
    partial,   // at least one success, at least one failure
    failed,    // invalid job, enumeration failure, or zero successes
    cancelled  // cancellation requested before completion
};

// What the coordinator hands back to the caller.
// A zero-success job is `failed` yet still carries its report.
struct JobResult {
    JobStatus status = JobStatus::ok;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    std::optional<ExportReport> report;

    bool is_success() const { return status == JobStatus::ok || status == JobStatus::partial; }
    bool is_failed() const { return status == JobStatus::failed; }
    bool is_cancelled() const { return status == JobStatus::cancelled; }

    static JobResult completed(ExportReport report) {
        JobResult result;
        result.status = report.failed.empty() ? JobStatus::ok : JobStatus::partial;
        result.report = std::move(report);
        return result;
    }

    static JobResult error_result(ErrorCode code, const std::string& message,
                                  std::optional<ExportReport> report = std::nullopt) {
        JobResult result;
        result.status = JobStatus::failed;
        result.error_code = code;
        result.error_message = message;
        result.report = std::move(report);
        return result;
    }

    static JobResult cancelled_result(ExportReport report) {
        JobResult result;
        result.status = JobStatus::cancelled;
        result.error_code = ErrorCode::cancelled_by_user;
        result.error_message = "export cancelled";
        result.report = std::move(report);
        return result;
    }
};

} // namespace exporter
} // namespace frameport
