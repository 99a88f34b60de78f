#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/clock.hpp"
#include "frameport/exporter/observability.hpp"
#include "frameport/exporter/progress_tracker.hpp"
#include "frameport/exporter/rate_limit_governor.hpp"
#include "frameport/exporter/source_client.hpp"
#include "frameport/exporter/transport.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>
#include <vector>

namespace frameport {
namespace exporter {

// One pass of a multi-scale export
struct ScaleRun {
    double scale = 0.0;
    std::string output_dir;
    JobResult result;
};

/**
 * Export Coordinator
 *
 * Runs one job end to end:
 * - validates the job and prepares the output directory
 * - enumerates nodes unless the job lists them explicitly
 * - resolves URLs batch by batch on the calling thread
 * - downloads on the dispatcher's worker pool as URLs arrive
 * - assembles the report and writes the manifest
 *
 * run() blocks until every node has an outcome. cancel() may be called from
 * any thread (e.g. a signal handler's watcher) while run() is in progress.
 *
 * run() exports at job.scale. run_scales() enumerates once and then runs one
 * pass per entry of job.scales, each into <output_dir>/scale_<N>x.
 */
class ExportCoordinator {
public:
    ExportCoordinator(std::shared_ptr<Transport> transport,
                      SourceClientConfig client_config,
                      std::shared_ptr<Clock> clock = nullptr,
                      std::shared_ptr<Observability> observability = nullptr,
                      std::shared_ptr<RateLimitGovernor> governor = nullptr,
                      std::shared_ptr<ProgressTracker> progress = nullptr);

    static constexpr int kMaxWorkers = 64;

    JobResult run(const ExportJob& job);
    std::vector<ScaleRun> run_scales(const ExportJob& job);

    // Nodes that would be exported, without exporting them
    caf::expected<std::vector<NodeDescriptor>> enumerate(const ExportJob& job);

    void on_progress(ProgressCallback callback);
    void cancel();
    bool is_cancelled() const { return token_.is_cancelled(); }

    static std::string validate(const ExportJob& job);
    static std::vector<NodeDescriptor> deduplicate(const std::vector<NodeDescriptor>& nodes);
    static std::string scale_directory(double scale);
    // cancelled if any pass was, ok / failed if every pass was, partial otherwise
    static JobStatus combined_status(const std::vector<ScaleRun>& runs);

    std::shared_ptr<ProgressTracker> progress() const { return progress_; }
    std::shared_ptr<RateLimitGovernor> governor() const { return governor_; }
    CancellationToken token() const { return token_; }

private:
    caf::expected<std::vector<NodeDescriptor>> select_nodes(const ExportJob& job, const std::string& job_id);
    std::string create_output_dir(const ExportJob& job, const std::string& job_id);
    JobResult execute(const ExportJob& effective, const std::string& job_id, Clock::time_point started);

    std::shared_ptr<SourceClient> client_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;
    std::shared_ptr<RateLimitGovernor> governor_;
    std::shared_ptr<ProgressTracker> progress_;
    CancellationToken token_;
};

} // namespace exporter
} // namespace frameport
