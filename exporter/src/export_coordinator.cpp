#include "frameport/exporter/export_coordinator.hpp"
#include "frameport/exporter/batch_scheduler.hpp"
#include "frameport/exporter/download_dispatcher.hpp"
#include "frameport/exporter/export_report.hpp"
#include "frameport/exporter/node_enumerator.hpp"
#include "frameport/exporter/result_converter.hpp"
#include <caf/error.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace frameport {
namespace exporter {

namespace {

std::string make_job_id() {
    return "job_" + std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

ExportCoordinator::ExportCoordinator(std::shared_ptr<Transport> transport,
                                     SourceClientConfig client_config,
                                     std::shared_ptr<Clock> clock,
                                     std::shared_ptr<Observability> observability,
                                     std::shared_ptr<RateLimitGovernor> governor,
                                     std::shared_ptr<ProgressTracker> progress)
    : client_(std::make_shared<SourceClient>(std::move(transport), std::move(client_config))),
      clock_(clock ? std::move(clock) : make_steady_clock()),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      governor_(governor ? std::move(governor) : std::make_shared<RateLimitGovernor>(clock_)),
      progress_(progress ? std::move(progress) : std::make_shared<ProgressTracker>()) {}

void ExportCoordinator::on_progress(ProgressCallback callback) {
    progress_->on_update(std::move(callback));
}

void ExportCoordinator::cancel() {
    token_.cancel();
}

std::string ExportCoordinator::validate(const ExportJob& job) {
    if (job.source_id.empty()) {
        return "source id is required";
    }
    if (job.output_dir.empty()) {
        return "output directory is required";
    }
    if (!(job.scale > 0.0 && job.scale <= 4.0)) {
        return "scale must be in (0, 4]";
    }
    for (double scale : job.scales) {
        if (!(scale > 0.0 && scale <= 4.0)) {
            return "every scale must be in (0, 4]";
        }
    }
    std::vector<double> sorted_scales = job.scales;
    std::sort(sorted_scales.begin(), sorted_scales.end());
    if (std::adjacent_find(sorted_scales.begin(), sorted_scales.end()) != sorted_scales.end()) {
        return "scales must be distinct";
    }
    if (job.max_workers < 1) {
        return "max_workers must be at least 1";
    }
    if (job.max_workers > kMaxWorkers) {
        return "max_workers must be at most " + std::to_string(kMaxWorkers);
    }
    if (job.batch_size < 1) {
        return "batch_size must be at least 1";
    }
    if (job.api_timeout_ms <= 0 || job.transfer_timeout_ms <= 0) {
        return "timeouts must be positive";
    }
    if (job.max_retries < 0) {
        return "max_retries must not be negative";
    }
    return "";
}

std::vector<NodeDescriptor> ExportCoordinator::deduplicate(const std::vector<NodeDescriptor>& nodes) {
    std::vector<NodeDescriptor> unique;
    std::unordered_set<std::string> seen;
    for (const auto& node : nodes) {
        if (seen.insert(node.id).second) {
            unique.push_back(node);
        }
    }
    return unique;
}

std::string ExportCoordinator::scale_directory(double scale) {
    return "scale_" + SourceClient::format_scale(scale) + "x";
}

JobStatus ExportCoordinator::combined_status(const std::vector<ScaleRun>& runs) {
    size_t ok = 0;
    size_t failed = 0;
    for (const auto& run : runs) {
        switch (run.result.status) {
            case JobStatus::cancelled:
                return JobStatus::cancelled;
            case JobStatus::ok:
                ok++;
                break;
            case JobStatus::failed:
                failed++;
                break;
            case JobStatus::partial:
                break;
        }
    }
    if (ok == runs.size()) {
        return JobStatus::ok;
    }
    if (failed == runs.size()) {
        return JobStatus::failed;
    }
    return JobStatus::partial;
}

caf::expected<std::vector<NodeDescriptor>> ExportCoordinator::enumerate(const ExportJob& job) {
    NodeEnumerator enumerator(client_);
    auto nodes = enumerator.enumerate(job.source_id, job.api_timeout_ms, job.root_node_id, job.page_name);
    observability_->record_request("hierarchy", nodes ? "success" : "error");
    return nodes;
}

caf::expected<std::vector<NodeDescriptor>> ExportCoordinator::select_nodes(const ExportJob& job,
                                                                          const std::string& job_id) {
    if (!job.nodes.empty()) {
        auto nodes = deduplicate(job.nodes);
        observability_->log_info("Exporting explicit node list", job_id, job.source_id, "", {
            {"nodes", std::to_string(nodes.size())}
        });
        return nodes;
    }
    auto nodes = enumerate(job);
    if (nodes) {
        observability_->log_info("Enumerated exportable nodes", job_id, job.source_id, "", {
            {"nodes", std::to_string(nodes->size())}
        });
    }
    return nodes;
}

std::string ExportCoordinator::create_output_dir(const ExportJob& job, const std::string& job_id) {
    std::error_code ec;
    std::filesystem::create_directories(job.output_dir, ec);
    if (!ec) {
        return "";
    }
    observability_->log_error("Output directory unavailable", job_id, job.source_id, "", {
        {"output_dir", job.output_dir},
        {"error", ec.message()}
    });
    return "cannot create output directory " + job.output_dir + ": " + ec.message();
}

JobResult ExportCoordinator::run(const ExportJob& job) {
    auto started = clock_->now();
    std::string job_id = make_job_id();

    std::string invalid = validate(job);
    if (!invalid.empty()) {
        observability_->log_error("Invalid export job", job_id, job.source_id, "", {{"reason", invalid}});
        return JobResult::error_result(ErrorCode::invalid_input, invalid);
    }

    std::string dir_error = create_output_dir(job, job_id);
    if (!dir_error.empty()) {
        return JobResult::error_result(ErrorCode::storage_failed, dir_error);
    }

    auto nodes = select_nodes(job, job_id);
    if (!nodes) {
        std::string message = "enumeration failed: " + caf::to_string(nodes.error());
        observability_->log_error("Enumeration failed", job_id, job.source_id, "", {{"error", message}});
        return JobResult::error_result(ErrorCode::enumeration_failed, message);
    }

    ExportJob effective = job;
    effective.nodes = std::move(*nodes);
    return execute(effective, job_id, started);
}

std::vector<ScaleRun> ExportCoordinator::run_scales(const ExportJob& job) {
    std::vector<ScaleRun> runs;
    if (job.scales.empty()) {
        runs.push_back(ScaleRun{job.scale, job.output_dir, run(job)});
        return runs;
    }

    std::string job_id = make_job_id();
    const auto single_failure = [&job](ErrorCode code, const std::string& message) {
        return std::vector<ScaleRun>{ScaleRun{0.0, job.output_dir, JobResult::error_result(code, message)}};
    };

    std::string invalid = validate(job);
    if (!invalid.empty()) {
        observability_->log_error("Invalid export job", job_id, job.source_id, "", {{"reason", invalid}});
        return single_failure(ErrorCode::invalid_input, invalid);
    }

    // Every pass exports the same nodes
    auto nodes = select_nodes(job, job_id);
    if (!nodes) {
        std::string message = "enumeration failed: " + caf::to_string(nodes.error());
        observability_->log_error("Enumeration failed", job_id, job.source_id, "", {{"error", message}});
        return single_failure(ErrorCode::enumeration_failed, message);
    }

    ExportJob base = job;
    base.nodes = std::move(*nodes);
    base.scales.clear();

    for (double scale : job.scales) {
        ExportJob pass = base;
        pass.scale = scale;
        pass.output_dir = (std::filesystem::path(job.output_dir) / scale_directory(scale)).string();
        std::string pass_id = job_id + "_" + scale_directory(scale);

        observability_->log_info("Exporting scale pass", pass_id, job.source_id, "", {
            {"scale", SourceClient::format_scale(scale)},
            {"output_dir", pass.output_dir}
        });

        auto started = clock_->now();
        std::string dir_error = create_output_dir(pass, pass_id);
        JobResult result = dir_error.empty()
            ? execute(pass, pass_id, started)
            : JobResult::error_result(ErrorCode::storage_failed, dir_error);

        bool cancelled = result.is_cancelled();
        runs.push_back(ScaleRun{scale, pass.output_dir, std::move(result)});
        if (cancelled) {
            break;
        }
    }
    return runs;
}

JobResult ExportCoordinator::execute(const ExportJob& effective, const std::string& job_id,
                                     Clock::time_point started) {
    const auto elapsed = [this, started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started);
    };

    const int64_t total = static_cast<int64_t>(effective.nodes.size());
    progress_->reset(total);
    ReportBuilder builder(total);

    std::unordered_map<std::string, const NodeDescriptor*> by_id;
    for (const auto& node : effective.nodes) {
        by_id[node.id] = &node;
    }

    observability_->log_info("Export started", job_id, effective.source_id, "", {
        {"total", std::to_string(total)},
        {"max_workers", std::to_string(effective.max_workers)},
        {"batch_size", std::to_string(effective.batch_size)},
        {"format", ResultConverter::format_to_string(effective.format)}
    });

    if (total > 0) {
        DownloadDispatcher dispatcher(client_, effective, governor_, clock_, progress_, token_,
                                      [&builder](const ExportResult& result) { builder.add(result); },
                                      observability_);
        BatchScheduler scheduler(client_, effective, governor_, clock_, token_, observability_);

        while (auto batch = scheduler.next()) {
            for (const auto& entry : batch->urls_by_id) {
                auto node = by_id.find(entry.first);
                if (node != by_id.end()) {
                    dispatcher.submit(*node->second, entry.second);
                }
            }
            for (const auto& id : batch->unresolved_ids) {
                auto node = by_id.find(id);
                if (node != by_id.end()) {
                    dispatcher.reject(*node->second, batch->error_code, batch->failure_reason, batch->attempts);
                }
            }
        }
        dispatcher.wait();
    }

    // Every node must appear in the report exactly once
    if (static_cast<int64_t>(builder.size()) != total) {
        for (const auto& node : effective.nodes) {
            if (!builder.contains(node.id)) {
                builder.add(ExportResult::permanent_failure(node, ErrorCode::internal_error, "no outcome recorded"));
                progress_->increment(ProgressKind::failed, node.name);
            }
        }
    }

    ExportReport report = builder.build(elapsed());

    JobResult result;
    if (token_.is_cancelled()) {
        result = JobResult::cancelled_result(report);
    } else if (total > 0 && report.succeeded.empty()) {
        result = JobResult::error_result(ErrorCode::all_nodes_failed, "no node was exported", report);
    } else {
        if (total == 0) {
            observability_->log_warn("No exportable nodes found", job_id, effective.source_id);
        }
        result = JobResult::completed(report);
    }

    if (effective.write_manifest) {
        auto manifest = write_manifest(report, effective, result.status);
        if (!manifest) {
            observability_->log_error("Failed to write manifest", job_id, effective.source_id, "", {
                {"error", caf::to_string(manifest.error())}
            });
        }
    }

    auto summary = std::unordered_map<std::string, std::string>{
        {"status", ResultConverter::job_status_to_string(result.status)},
        {"total", std::to_string(report.total)},
        {"succeeded", std::to_string(report.succeeded.size())},
        {"failed", std::to_string(report.failed.size())},
        {"duration_ms", std::to_string(report.duration.count())}
    };
    if (result.status == JobStatus::ok) {
        observability_->log_info("Export finished", job_id, effective.source_id, "", summary);
    } else {
        observability_->log_warn("Export finished", job_id, effective.source_id, "", summary);
    }
    return result;
}

} // namespace exporter
} // namespace frameport
