#include "frameport/exporter/download_dispatcher.hpp"
#include "frameport/exporter/filename.hpp"
#include <chrono>
#include <system_error>

namespace frameport {
namespace exporter {

DownloadDispatcher::DownloadDispatcher(std::shared_ptr<SourceClient> client,
                                       const ExportJob& job,
                                       std::shared_ptr<RateLimitGovernor> governor,
                                       std::shared_ptr<Clock> clock,
                                       std::shared_ptr<ProgressTracker> progress,
                                       CancellationToken token,
                                       ResultSink sink,
                                       std::shared_ptr<Observability> observability)
    : client_(std::move(client)),
      job_(job),
      governor_(std::move(governor)),
      clock_(std::move(clock)),
      progress_(std::move(progress)),
      token_(std::move(token)),
      sink_(std::move(sink)),
      observability_(std::move(observability)),
      retry_policy_(RetryPolicy::for_transfer(job)) {
    auto obs = observability_;
    pool_ = std::make_unique<WorkerPool>(job_.max_workers, [obs](const std::string& error) {
        if (obs) {
            obs->log_error("Download worker task threw", "", "", "", {{"error", error}});
        }
    });
}

DownloadDispatcher::~DownloadDispatcher() {
    wait();
    pool_.reset();
}

std::string DownloadDispatcher::extension_for(ExportFormat format) {
    switch (format) {
        case ExportFormat::png:
            return "png";
        case ExportFormat::jpg:
            return "jpg";
        case ExportFormat::svg:
            return "svg";
        case ExportFormat::pdf:
            return "pdf";
    }
    return "png";
}

std::filesystem::path DownloadDispatcher::target_path_for(const NodeDescriptor& node, const ExportJob& job) {
    std::string filename = sanitize_filename(node.name) + "_" + sanitize_node_id(node.id) + "." +
                           extension_for(job.format);
    return std::filesystem::path(job.output_dir) / filename;
}

void DownloadDispatcher::submit(const NodeDescriptor& node, const std::string& url) {
    DownloadTask task;
    task.node = node;
    task.url = url;
    task.target_path = target_path_for(node, job_);
    enqueue(std::move(task));
}

void DownloadDispatcher::reject(const NodeDescriptor& node, ErrorCode code,
                                const std::string& reason, int32_t attempts) {
    finish(ExportResult::permanent_failure(node, code, reason, attempts));
}

void DownloadDispatcher::wait() {
    pool_->wait_idle();
}

int64_t DownloadDispatcher::outstanding() const {
    return static_cast<int64_t>(pool_->pending());
}

void DownloadDispatcher::enqueue(DownloadTask task) {
    pool_->submit([this, task]() {
        try {
            process(task);
        } catch (const std::exception& e) {
            // Every task reports exactly once, even when it throws
            finish(ExportResult::permanent_failure(task.node, ErrorCode::internal_error,
                                                   std::string("internal error: ") + e.what(), task.attempt));
        }
    });
}

void DownloadDispatcher::finish(const ExportResult& result) {
    if (sink_) {
        sink_(result);
    }
    if (progress_) {
        progress_->increment(result.is_success() ? ProgressKind::completed : ProgressKind::failed,
                             result.node.name);
    }
    if (observability_) {
        observability_->record_export(result.is_success() ? "success" : "failed");
    }
}

void DownloadDispatcher::process(DownloadTask task) {
    const auto cancelled = [&task]() {
        return ExportResult::permanent_failure(task.node, ErrorCode::cancelled_by_user, "cancelled", task.attempt);
    };

    if (token_.is_cancelled() || !governor_->wait_until_clear(token_)) {
        finish(cancelled());
        return;
    }

    std::filesystem::path part_path = task.target_path;
    part_path += ".part";

    if (observability_) {
        observability_->transfer_started();
    }
    auto started = std::chrono::steady_clock::now();
    HttpResponse response = client_->transport()->download(
        client_->download_request(task.url, job_.transfer_timeout_ms), part_path, token_.flag());
    if (observability_) {
        observability_->transfer_finished();
        observability_->record_transfer_duration(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    }

    std::error_code ec;
    if (response.is_success()) {
        std::filesystem::rename(part_path, task.target_path, ec);
        if (ec) {
            std::error_code cleanup_ec;
            std::filesystem::remove(part_path, cleanup_ec);
            finish(ExportResult::permanent_failure(task.node, ErrorCode::storage_failed,
                                                   "write failed: " + ec.message(), task.attempt + 1));
            return;
        }
        governor_->record_success();
        if (observability_) {
            observability_->record_request("transfer", "success");
            observability_->log_debug("Exported node", "", job_.source_id, task.node.id, {
                {"path", task.target_path.string()},
                {"bytes", std::to_string(response.bytes)},
                {"attempt", std::to_string(task.attempt + 1)}
            });
        }
        finish(ExportResult::success(task.node, task.target_path.string(), task.attempt + 1));
        return;
    }

    std::filesystem::remove(part_path, ec);

    if (response.error_code == ErrorCode::cancelled_by_user || token_.is_cancelled()) {
        finish(cancelled());
        return;
    }

    if (response.is_rate_limited()) {
        auto hint = RateLimitGovernor::parse_retry_after(response.retry_after);
        auto pause = governor_->record_limit_hit(hint);
        if (observability_) {
            observability_->record_request("transfer", "rate_limited");
            observability_->record_rate_limit_hit("transfer");
            observability_->log_warn("Rate limited while downloading", "", job_.source_id, task.node.id, {
                {"pause_ms", std::to_string(pause.count())}
            });
        }
        enqueue(std::move(task));
        return;
    }

    if (observability_) {
        observability_->record_request("transfer", "error");
    }

    std::string detail = response.is_transport_error()
        ? response.error
        : "HTTP " + std::to_string(response.status_code);

    if (response.error_code == ErrorCode::storage_failed) {
        finish(ExportResult::permanent_failure(task.node, ErrorCode::storage_failed,
                                               "write failed: " + detail, task.attempt + 1));
        return;
    }

    if (retry_policy_.is_retryable(response.error_code, response.status_code)) {
        auto decision = retry_policy_.next_attempt(task.attempt);
        if (decision.retry) {
            if (observability_) {
                observability_->record_retry("transfer");
                observability_->log_warn("Download failed, retrying", "", job_.source_id, task.node.id, {
                    {"reason", detail},
                    {"attempt", std::to_string(task.attempt + 1)},
                    {"delay_ms", std::to_string(decision.delay.count())}
                });
            }
            if (!interruptible_sleep(*clock_, decision.delay, token_)) {
                finish(cancelled());
                return;
            }
            task.attempt++;
            enqueue(std::move(task));
            return;
        }
        if (observability_) {
            observability_->log_error("Download exhausted retries", "", job_.source_id, task.node.id, {
                {"reason", detail}
            });
        }
        finish(ExportResult::permanent_failure(
            task.node, ErrorCode::transfer_failed,
            "transfer failed after " + std::to_string(task.attempt + 1) + " attempts: " + detail,
            task.attempt + 1));
        return;
    }

    finish(ExportResult::permanent_failure(task.node, ErrorCode::transfer_failed,
                                           "transfer failed: " + detail, task.attempt + 1));
}

} // namespace exporter
} // namespace frameport
