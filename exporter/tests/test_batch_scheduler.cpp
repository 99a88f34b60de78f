#include <iostream>
#include <cassert>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "frameport/exporter/batch_scheduler.hpp"
#include "test_support.hpp"

using namespace frameport::exporter;
using namespace frameport::exporter::testing;
using std::chrono::milliseconds;

namespace {

struct Harness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<FakeDesignService> service = std::make_shared<FakeDesignService>(clock);
    std::shared_ptr<RateLimitGovernor> governor = std::make_shared<RateLimitGovernor>(clock);
    CancellationToken token;
    ExportJob job;

    explicit Harness(int nodes) {
        job.source_id = "FILEKEY";
        job.output_dir = "/tmp/unused";
        job.nodes = make_nodes(nodes);
    }

    std::shared_ptr<SourceClient> client() {
        SourceClientConfig config;
        config.token = "t";
        return std::make_shared<SourceClient>(service, config);
    }

    std::vector<BatchResult> run_all() {
        BatchScheduler scheduler(client(), job, governor, clock, token);
        std::vector<BatchResult> results;
        while (auto result = scheduler.next()) {
            results.push_back(std::move(*result));
        }
        assert(scheduler.done());
        return results;
    }
};

std::set<std::string> resolved_ids(const std::vector<BatchResult>& results) {
    std::set<std::string> ids;
    for (const auto& r : results) {
        for (const auto& entry : r.urls_by_id) ids.insert(entry.first);
    }
    return ids;
}

std::set<std::string> unresolved_ids(const std::vector<BatchResult>& results) {
    std::set<std::string> ids;
    for (const auto& r : results) {
        ids.insert(r.unresolved_ids.begin(), r.unresolved_ids.end());
    }
    return ids;
}

} // namespace

void test_partition() {
    std::cout << "Testing partition..." << std::endl;

    auto nodes = make_nodes(177);
    auto batches = BatchScheduler::partition(nodes, 15);
    assert(batches.size() == 12);
    size_t total = 0;
    for (size_t i = 0; i < batches.size(); ++i) {
        assert(batches[i].size() <= 15);
        total += batches[i].size();
    }
    assert(batches.back().size() == 12);
    assert(total == 177);
    assert(batches[0][0] == nodes[0].id);

    assert(BatchScheduler::partition({}, 15).empty());
    assert(BatchScheduler::partition(make_nodes(3), 0).size() == 3);

    std::cout << "✓ Partition test passed" << std::endl;
}

void test_one_call_per_batch() {
    std::cout << "Testing one resolve call per batch..." << std::endl;

    Harness h(177);
    auto results = h.run_all();

    assert(h.service->resolve_calls == 12);
    assert(results.size() == 12);
    for (const auto& batch : h.service->resolve_batches()) {
        assert(batch.size() <= 15);
    }
    assert(resolved_ids(results).size() == 177);
    assert(unresolved_ids(results).empty());
    for (const auto& r : results) {
        assert(r.attempts == 1);
        for (const auto& entry : r.urls_by_id) {
            assert(entry.second == "https://cdn.test/" + entry.first);
        }
    }

    std::cout << "✓ One resolve call per batch test passed" << std::endl;
}

void test_bisects_unresolved() {
    std::cout << "Testing bisection of unresolved ids..." << std::endl;

    Harness h(4);
    h.job.batch_size = 4;
    // 3:30 and 4:40 come back null once, then resolve
    h.service->resolve_after["3:30"] = 1;
    h.service->resolve_after["4:40"] = 1;

    auto results = h.run_all();
    auto batches = h.service->resolve_batches();

    assert(batches.size() == 3);
    assert(batches[0].size() == 4);
    assert((batches[1] == std::vector<std::string>{"3:30"}));
    assert((batches[2] == std::vector<std::string>{"4:40"}));
    assert(resolved_ids(results).size() == 4);
    assert(unresolved_ids(results).empty());

    std::cout << "✓ Bisection test passed" << std::endl;
}

void test_poisoned_id_exhausts_alone() {
    std::cout << "Testing poisoned id exhaustion..." << std::endl;

    Harness h(15);
    h.job.max_retries = 5;
    h.service->never_resolve.insert("7:70");

    auto results = h.run_all();

    // Initial call plus five single-id retries
    assert(h.service->resolve_calls == 6);
    assert(resolved_ids(results).size() == 14);
    auto failed = unresolved_ids(results);
    assert(failed.size() == 1);
    assert(failed.count("7:70") == 1);

    const BatchResult& last = results.back();
    assert(last.failure_reason == "resolution failed");
    assert(last.error_code == ErrorCode::resolution_failed);
    assert(last.attempts == 6);

    std::cout << "✓ Poisoned id exhaustion test passed" << std::endl;
}

void test_retry_does_not_block_later_batches() {
    std::cout << "Testing retry backoff does not block later batches..." << std::endl;

    Harness h(30);
    h.job.max_retries = 5;
    h.service->never_resolve.insert("1:10");

    BatchScheduler scheduler(h.client(), h.job, h.governor, h.clock, h.token);

    auto first = scheduler.next();
    assert(first);
    assert(first->urls_by_id.size() == 14);

    // The second batch goes out at once, before any retry of 1:10
    auto second = scheduler.next();
    assert(second);
    assert(second->urls_by_id.size() == 15);
    assert(second->urls_by_id.count("16:160") == 1);

    auto batches = h.service->resolve_batches();
    auto times = h.service->resolve_times();
    assert(batches.size() == 2);
    assert(batches[1].size() == 15);
    assert(times[1] == times[0]);

    std::vector<BatchResult> rest;
    while (auto result = scheduler.next()) {
        rest.push_back(std::move(*result));
    }
    assert(scheduler.done());
    assert(h.service->resolve_calls == 7);
    assert(rest.size() == 1);
    assert((rest[0].unresolved_ids == std::vector<std::string>{"1:10"}));
    assert(rest[0].attempts == 6);

    std::cout << "✓ Retry backoff does not block later batches test passed" << std::endl;
}

void test_rate_limit_pauses_requests() {
    std::cout << "Testing Retry-After pause..." << std::endl;

    Harness h(30);
    h.job.max_retries = 0;
    h.service->resolve_rate_limits = 1;
    h.service->resolve_retry_after = "2";

    auto results = h.run_all();
    auto times = h.service->resolve_times();

    // 429 on the first call, then both batches; budget untouched by the 429
    assert(times.size() == 3);
    assert(times[1] - times[0] >= milliseconds(2000));
    assert(resolved_ids(results).size() == 30);
    assert(h.governor->state().consecutive_limit_hits == 0);

    std::cout << "✓ Retry-After pause test passed" << std::endl;
}

void test_server_error_retried_with_backoff() {
    std::cout << "Testing 5xx retry with backoff..." << std::endl;

    Harness h(10);
    h.job.api_timeout_ms = 15000; // base delay 500 ms
    h.service->resolve_server_errors = 2;

    auto results = h.run_all();
    auto times = h.service->resolve_times();

    assert(h.service->resolve_calls == 3);
    assert(times[1] - times[0] >= milliseconds(500));
    assert(times[2] - times[1] >= milliseconds(1000));
    assert(results.size() == 1);
    assert(results[0].urls_by_id.size() == 10);
    assert(results[0].attempts == 3);

    std::cout << "✓ 5xx retry with backoff test passed" << std::endl;
}

void test_server_error_exhausted() {
    std::cout << "Testing 5xx retry exhaustion..." << std::endl;

    Harness h(20);
    h.job.max_retries = 2;
    h.service->resolve_server_errors = 1000;

    auto results = h.run_all();

    // Two batches, three attempts each
    assert(h.service->resolve_calls == 6);
    assert(results.size() == 2);
    assert(unresolved_ids(results).size() == 20);
    for (const auto& r : results) {
        assert(r.failure_reason == "resolution failed");
        assert(r.attempts == 3);
    }

    std::cout << "✓ 5xx retry exhaustion test passed" << std::endl;
}

void test_client_error_not_retried() {
    std::cout << "Testing 4xx rejection..." << std::endl;

    Harness h(5);
    h.service->resolve_status = 404;

    auto results = h.run_all();

    assert(h.service->resolve_calls == 1);
    assert(results.size() == 1);
    assert(results[0].unresolved_ids.size() == 5);
    assert(results[0].failure_reason == "resolution failed: HTTP 404");
    assert(results[0].error_code == ErrorCode::resolution_failed);

    std::cout << "✓ 4xx rejection test passed" << std::endl;
}

void test_cancellation_drains() {
    std::cout << "Testing cancellation drain..." << std::endl;

    Harness h(45);
    BatchScheduler scheduler(h.client(), h.job, h.governor, h.clock, h.token);

    auto first = scheduler.next();
    assert(first);
    assert(first->urls_by_id.size() == 15);

    h.token.cancel();
    auto drained = scheduler.next();
    assert(drained);
    assert(drained->unresolved_ids.size() == 30);
    assert(drained->failure_reason == "cancelled");
    assert(drained->error_code == ErrorCode::cancelled_by_user);
    assert(!scheduler.next());
    assert(h.service->resolve_calls == 1);

    std::cout << "✓ Cancellation drain test passed" << std::endl;
}

int main() {
    std::cout << "Running Batch Scheduler Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Batching]" << std::endl;
        test_partition();
        test_one_call_per_batch();
        test_bisects_unresolved();
        test_poisoned_id_exhausts_alone();
        test_retry_does_not_block_later_batches();

        std::cout << "\n[Failure Handling]" << std::endl;
        test_rate_limit_pauses_requests();
        test_server_error_retried_with_backoff();
        test_server_error_exhausted();
        test_client_error_not_retried();
        test_cancellation_drains();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All batch scheduler tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
