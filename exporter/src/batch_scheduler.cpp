#include "frameport/exporter/batch_scheduler.hpp"
#include <algorithm>

namespace frameport {
namespace exporter {

BatchScheduler::BatchScheduler(std::shared_ptr<SourceClient> client,
                               const ExportJob& job,
                               std::shared_ptr<RateLimitGovernor> governor,
                               std::shared_ptr<Clock> clock,
                               CancellationToken token,
                               std::shared_ptr<Observability> observability)
    : client_(std::move(client)),
      job_(job),
      governor_(std::move(governor)),
      clock_(std::move(clock)),
      token_(std::move(token)),
      observability_(std::move(observability)),
      retry_policy_(RetryPolicy::for_resolution(job)) {
    for (auto& ids : partition(job_.nodes, job_.batch_size)) {
        BatchRequest request;
        request.node_ids = std::move(ids);
        pending_.push_back(std::move(request));
    }
}

std::vector<std::vector<std::string>> BatchScheduler::partition(const std::vector<NodeDescriptor>& nodes,
                                                                int batch_size) {
    std::vector<std::vector<std::string>> batches;
    size_t size = static_cast<size_t>(batch_size > 0 ? batch_size : 1);
    for (size_t start = 0; start < nodes.size(); start += size) {
        size_t end = std::min(nodes.size(), start + size);
        std::vector<std::string> ids;
        ids.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            ids.push_back(nodes[i].id);
        }
        batches.push_back(std::move(ids));
    }
    return batches;
}

BatchResult BatchScheduler::drain_cancelled() {
    BatchResult result;
    result.failure_reason = "cancelled";
    result.error_code = ErrorCode::cancelled_by_user;
    for (auto& request : pending_) {
        result.unresolved_ids.insert(result.unresolved_ids.end(),
                                     request.node_ids.begin(), request.node_ids.end());
    }
    pending_.clear();
    return result;
}

void BatchScheduler::requeue_with_backoff(BatchRequest request, std::chrono::milliseconds delay,
                                          const std::string& reason) {
    request.attempt++;
    request.not_before = clock_->now() + delay;
    if (observability_) {
        observability_->record_retry("resolve");
        observability_->log_warn("Resolve batch failed, retrying", "", job_.source_id, "", {
            {"reason", reason},
            {"batch_size", std::to_string(request.node_ids.size())},
            {"attempt", std::to_string(request.attempt)},
            {"delay_ms", std::to_string(delay.count())}
        });
    }
    pending_.push_back(std::move(request));
}

BatchRequest BatchScheduler::take_earliest() {
    // First among equals keeps fresh batches in partition order
    auto it = std::min_element(pending_.begin(), pending_.end(),
                               [](const BatchRequest& a, const BatchRequest& b) {
                                   return a.not_before < b.not_before;
                               });
    BatchRequest request = std::move(*it);
    pending_.erase(it);
    return request;
}

std::optional<BatchResult> BatchScheduler::next() {
    while (!pending_.empty()) {
        if (token_.is_cancelled()) {
            return drain_cancelled();
        }

        BatchRequest request = take_earliest();

        auto now = clock_->now();
        if (request.not_before > now) {
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(request.not_before - now);
            if (!interruptible_sleep(*clock_, wait, token_)) {
                pending_.push_front(std::move(request));
                continue;
            }
        }
        if (!governor_->wait_until_clear(token_)) {
            pending_.push_front(std::move(request));
            continue;
        }

        calls_issued_++;
        ResolveResponse response = client_->resolve_images(job_.source_id, request.node_ids, job_.scale,
                                                           job_.format, job_.api_timeout_ms);

        if (response.http.is_rate_limited()) {
            auto hint = RateLimitGovernor::parse_retry_after(response.http.retry_after);
            auto pause = governor_->record_limit_hit(hint);
            if (observability_) {
                observability_->record_request("resolve", "rate_limited");
                observability_->record_rate_limit_hit("resolve");
                observability_->log_warn("Rate limited while resolving batch", "", job_.source_id, "", {
                    {"pause_ms", std::to_string(pause.count())},
                    {"retry_after", response.http.retry_after}
                });
            }
            // Same attempt: throttling does not spend retry budget
            pending_.push_front(std::move(request));
            continue;
        }

        if (response.error_code == ErrorCode::cancelled_by_user) {
            pending_.push_front(std::move(request));
            continue;
        }

        if (response.ok()) {
            governor_->record_success();
            if (observability_) {
                observability_->record_request("resolve", "success");
            }

            BatchResult result;
            result.urls_by_id = std::move(response.urls);
            result.attempts = request.attempt + 1;

            if (!response.unresolved.empty()) {
                auto decision = retry_policy_.next_attempt(request.attempt);
                if (decision.retry) {
                    // Bisect so a single poisoned id cannot hold its siblings hostage
                    auto& unresolved = response.unresolved;
                    size_t half = (unresolved.size() + 1) / 2;
                    auto not_before = clock_->now() + decision.delay;

                    // Queued behind fresh batches; take_earliest() only waits when nothing else is due
                    BatchRequest first;
                    first.node_ids.assign(unresolved.begin(), unresolved.begin() + half);
                    first.attempt = request.attempt + 1;
                    first.not_before = not_before;
                    pending_.push_back(std::move(first));

                    if (half < unresolved.size()) {
                        BatchRequest second;
                        second.node_ids.assign(unresolved.begin() + half, unresolved.end());
                        second.attempt = request.attempt + 1;
                        second.not_before = not_before;
                        pending_.push_back(std::move(second));
                    }

                    if (observability_) {
                        observability_->record_retry("resolve");
                        observability_->log_debug("Bisecting unresolved ids", "", job_.source_id, "", {
                            {"unresolved", std::to_string(unresolved.size())},
                            {"attempt", std::to_string(request.attempt + 1)}
                        });
                    }
                } else {
                    result.unresolved_ids = std::move(response.unresolved);
                    result.failure_reason = "resolution failed";
                    result.error_code = ErrorCode::resolution_failed;
                }
            }

            if (result.urls_by_id.empty() && result.unresolved_ids.empty()) {
                continue;
            }
            return result;
        }

        int status = response.http.status_code;
        if (observability_) {
            observability_->record_request("resolve", "error");
        }

        if (retry_policy_.is_retryable(response.error_code, status)) {
            auto decision = retry_policy_.next_attempt(request.attempt);
            if (decision.retry) {
                requeue_with_backoff(std::move(request), decision.delay, response.error_message);
                continue;
            }
            BatchResult exhausted;
            exhausted.unresolved_ids = std::move(request.node_ids);
            exhausted.failure_reason = "resolution failed";
            exhausted.error_code = ErrorCode::resolution_failed;
            exhausted.attempts = request.attempt + 1;
            if (observability_) {
                observability_->log_error("Resolve batch exhausted retries", "", job_.source_id, "", {
                    {"reason", response.error_message},
                    {"batch_size", std::to_string(exhausted.unresolved_ids.size())}
                });
            }
            return exhausted;
        }

        BatchResult rejected;
        rejected.unresolved_ids = std::move(request.node_ids);
        rejected.failure_reason = status > 0
            ? "resolution failed: HTTP " + std::to_string(status)
            : "resolution failed: " + response.error_message;
        rejected.error_code = ErrorCode::resolution_failed;
        rejected.attempts = request.attempt + 1;
        if (observability_) {
            observability_->log_error("Resolve batch rejected", "", job_.source_id, "", {
                {"reason", rejected.failure_reason}
            });
        }
        return rejected;
    }
    return std::nullopt;
}

} // namespace exporter
} // namespace frameport
