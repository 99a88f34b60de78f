#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/clock.hpp"
#include "frameport/exporter/observability.hpp"
#include "frameport/exporter/rate_limit_governor.hpp"
#include "frameport/exporter/retry_policy.hpp"
#include "frameport/exporter/source_client.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace frameport {
namespace exporter {

struct BatchRequest {
    std::vector<std::string> node_ids;
    int32_t attempt = 0;
    Clock::time_point not_before{};
};

/**
 * Resolution outcome for one group of ids.
 *
 * Ids in `urls_by_id` are ready for download. Ids in `unresolved_ids` failed
 * permanently with `failure_reason` / `error_code`. A single result may carry
 * both when a bisected batch only partly resolved.
 */
struct BatchResult {
    std::unordered_map<std::string, std::string> urls_by_id;
    std::vector<std::string> unresolved_ids;
    std::string failure_reason;
    ErrorCode error_code = ErrorCode::none;
    int32_t attempts = 0;
};

/**
 * Turns the node list into bulk resolve calls.
 *
 * Results are produced lazily by next(), one resolve call at a time, so the
 * caller can hand URLs to the download workers while later batches are still
 * pending. Retries wait out their backoff without holding up batches that
 * are already due. Every id given to the scheduler ends up in exactly one result.
 */
class BatchScheduler {
public:
    BatchScheduler(std::shared_ptr<SourceClient> client,
                   const ExportJob& job,
                   std::shared_ptr<RateLimitGovernor> governor,
                   std::shared_ptr<Clock> clock,
                   CancellationToken token,
                   std::shared_ptr<Observability> observability = nullptr);

    // Contiguous groups of at most batch_size ids
    static std::vector<std::vector<std::string>> partition(const std::vector<NodeDescriptor>& nodes,
                                                           int batch_size);

    // Blocks for one resolve call (plus any pause); nullopt once every id is accounted for
    std::optional<BatchResult> next();

    bool done() const { return pending_.empty(); }
    int64_t calls_issued() const { return calls_issued_; }
    size_t pending_batches() const { return pending_.size(); }

private:
    BatchResult drain_cancelled();
    // Removes the pending request with the earliest not_before
    BatchRequest take_earliest();
    void requeue_with_backoff(BatchRequest request, std::chrono::milliseconds delay, const std::string& reason);

    std::shared_ptr<SourceClient> client_;
    ExportJob job_;
    std::shared_ptr<RateLimitGovernor> governor_;
    std::shared_ptr<Clock> clock_;
    CancellationToken token_;
    std::shared_ptr<Observability> observability_;
    RetryPolicy retry_policy_;

    std::deque<BatchRequest> pending_;
    int64_t calls_issued_ = 0;
};

} // namespace exporter
} // namespace frameport
