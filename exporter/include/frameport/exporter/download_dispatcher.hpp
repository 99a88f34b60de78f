#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/clock.hpp"
#include "frameport/exporter/observability.hpp"
#include "frameport/exporter/progress_tracker.hpp"
#include "frameport/exporter/rate_limit_governor.hpp"
#include "frameport/exporter/retry_policy.hpp"
#include "frameport/exporter/source_client.hpp"
#include "frameport/exporter/worker_pool.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace frameport {
namespace exporter {

struct DownloadTask {
    NodeDescriptor node;
    std::string url;
    std::filesystem::path target_path;
    int32_t attempt = 0;
};

/**
 * Downloads resolved URLs on a pool of job.max_workers threads.
 *
 * Each transfer streams into "<target>.part" and is renamed into place only on
 * success, so a target path never holds a truncated file. Every submitted
 * task produces exactly one ExportResult through the sink, including tasks
 * cut short by cancellation.
 */
class DownloadDispatcher {
public:
    using ResultSink = std::function<void(const ExportResult&)>;

    DownloadDispatcher(std::shared_ptr<SourceClient> client,
                       const ExportJob& job,
                       std::shared_ptr<RateLimitGovernor> governor,
                       std::shared_ptr<Clock> clock,
                       std::shared_ptr<ProgressTracker> progress,
                       CancellationToken token,
                       ResultSink sink,
                       std::shared_ptr<Observability> observability = nullptr);
    ~DownloadDispatcher();

    DownloadDispatcher(const DownloadDispatcher&) = delete;
    DownloadDispatcher& operator=(const DownloadDispatcher&) = delete;

    void submit(const NodeDescriptor& node, const std::string& url);

    // Report a node that never reached the download stage; the result is delivered before this returns
    void reject(const NodeDescriptor& node, ErrorCode code, const std::string& reason, int32_t attempts);

    // Block until every submitted task has produced its result
    void wait();

    // Transfer tasks queued or running
    int64_t outstanding() const;

    static std::filesystem::path target_path_for(const NodeDescriptor& node, const ExportJob& job);
    static std::string extension_for(ExportFormat format);

private:
    void enqueue(DownloadTask task);
    void process(DownloadTask task);
    void finish(const ExportResult& result);

    std::shared_ptr<SourceClient> client_;
    ExportJob job_;
    std::shared_ptr<RateLimitGovernor> governor_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ProgressTracker> progress_;
    CancellationToken token_;
    ResultSink sink_;
    std::shared_ptr<Observability> observability_;
    RetryPolicy retry_policy_;

    // Declared last: workers reference the members above
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace exporter
} // namespace frameport
