#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "frameport/exporter/download_dispatcher.hpp"
#include "test_support.hpp"

using namespace frameport::exporter;
using namespace frameport::exporter::testing;
using std::chrono::milliseconds;

namespace {

struct Harness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<FakeDesignService> service = std::make_shared<FakeDesignService>(clock);
    std::shared_ptr<RateLimitGovernor> governor = std::make_shared<RateLimitGovernor>(clock);
    std::shared_ptr<ProgressTracker> progress = std::make_shared<ProgressTracker>();
    CancellationToken token;
    ExportJob job;

    std::mutex results_mu;
    std::vector<ExportResult> results;

    explicit Harness(const std::string& name) {
        job.source_id = "FILEKEY";
        job.output_dir = make_temp_dir(name).string();
    }

    std::unique_ptr<DownloadDispatcher> dispatcher() {
        SourceClientConfig config;
        config.token = "t";
        auto client = std::make_shared<SourceClient>(service, config);
        return std::make_unique<DownloadDispatcher>(
            client, job, governor, clock, progress, token,
            [this](const ExportResult& result) {
                std::lock_guard<std::mutex> lock(results_mu);
                results.push_back(result);
            });
    }

    void submit_all(DownloadDispatcher& dispatcher, const std::vector<NodeDescriptor>& nodes) {
        for (const auto& node : nodes) {
            dispatcher.submit(node, "https://cdn.test/" + node.id);
        }
    }

    size_t successes() {
        std::lock_guard<std::mutex> lock(results_mu);
        size_t count = 0;
        for (const auto& r : results) {
            if (r.is_success()) count++;
        }
        return count;
    }

    ~Harness() {
        std::error_code ec;
        std::filesystem::remove_all(job.output_dir, ec);
    }
};

} // namespace

void test_target_path() {
    std::cout << "Testing target path naming..." << std::endl;

    ExportJob job;
    job.output_dir = "/tmp/exports";
    job.format = ExportFormat::svg;
    NodeDescriptor node{"12:34", "Login / Screen", "FRAME", {"Page 1"}};

    auto path = DownloadDispatcher::target_path_for(node, job);
    assert(path == std::filesystem::path("/tmp/exports/Login-Screen_12-34.svg"));

    // Same name, different ids: distinct files
    NodeDescriptor twin{"12:35", "Login / Screen", "FRAME", {"Page 1"}};
    assert(DownloadDispatcher::target_path_for(twin, job) != path);

    assert(DownloadDispatcher::extension_for(ExportFormat::jpg) == "jpg");
    assert(DownloadDispatcher::extension_for(ExportFormat::pdf) == "pdf");

    std::cout << "✓ Target path naming test passed" << std::endl;
}

void test_concurrency_bound() {
    std::cout << "Testing worker concurrency bound..." << std::endl;

    Harness h("concurrency");
    h.job.max_workers = 8;
    h.service->download_delay = milliseconds(20);
    auto nodes = make_nodes(40);
    h.progress->reset(40);

    {
        auto dispatcher = h.dispatcher();
        h.submit_all(*dispatcher, nodes);
        dispatcher->wait();
        assert(dispatcher->outstanding() == 0);
    }

    assert(h.service->download_calls == 40);
    assert(h.service->peak_in_flight <= 8);
    assert(h.service->peak_in_flight >= 2);
    assert(h.successes() == 40);
    assert(h.progress->snapshot().completed == 40);

    for (const auto& r : h.results) {
        assert(std::filesystem::exists(r.path));
        assert(std::filesystem::file_size(r.path) == 2048);
        assert(r.attempts == 1);
    }
    assert(count_files_with_suffix(h.job.output_dir, ".part") == 0);

    std::cout << "✓ Worker concurrency bound test passed" << std::endl;
}

void test_retry_budget() {
    std::cout << "Testing download retry budget..." << std::endl;

    Harness h("retry_budget");
    h.job.max_workers = 2;
    h.job.max_retries = 5;
    auto nodes = make_nodes(3);
    h.service->failing_downloads.insert(nodes[1].id);

    {
        auto dispatcher = h.dispatcher();
        h.submit_all(*dispatcher, nodes);
        dispatcher->wait();
    }

    assert(h.service->download_attempts(nodes[1].id) == 6);
    assert(h.service->download_attempts(nodes[0].id) == 1);
    assert(h.results.size() == 3);
    assert(h.successes() == 2);

    for (const auto& r : h.results) {
        if (r.node.id == nodes[1].id) {
            assert(r.is_failure());
            assert(r.error_code == ErrorCode::transfer_failed);
            assert(r.attempts == 6);
            assert(r.reason.find("transfer failed after 6 attempts") == 0);
            assert(r.reason.find("HTTP 500") != std::string::npos);
            assert(!std::filesystem::exists(DownloadDispatcher::target_path_for(r.node, h.job)));
        }
    }
    // Backoff waited on the injected clock
    assert(h.clock->total_slept() >= milliseconds(1000));
    assert(count_files_with_suffix(h.job.output_dir, ".part") == 0);

    std::cout << "✓ Download retry budget test passed" << std::endl;
}

void test_rate_limit_spends_no_budget() {
    std::cout << "Testing 429 during download..." << std::endl;

    Harness h("rate_limit");
    h.job.max_workers = 1;
    h.job.max_retries = 0;
    h.service->download_rate_limits = 3;
    h.service->download_retry_after = "1";
    auto nodes = make_nodes(4);

    {
        auto dispatcher = h.dispatcher();
        h.submit_all(*dispatcher, nodes);
        dispatcher->wait();
    }

    assert(h.successes() == 4);
    assert(h.service->download_calls == 7);
    auto times = h.service->download_times();
    assert(times[1] - times[0] >= milliseconds(1000));

    std::cout << "✓ 429 during download test passed" << std::endl;
}

void test_reject_reports_failure() {
    std::cout << "Testing rejected nodes..." << std::endl;

    Harness h("reject");
    auto nodes = make_nodes(2);
    h.progress->reset(2);

    {
        auto dispatcher = h.dispatcher();
        dispatcher->reject(nodes[0], ErrorCode::resolution_failed, "resolution failed", 6);
        dispatcher->submit(nodes[1], "https://cdn.test/" + nodes[1].id);
        dispatcher->wait();
    }

    assert(h.results.size() == 2);
    assert(h.service->download_calls == 1);
    auto snapshot = h.progress->snapshot();
    assert(snapshot.completed == 1);
    assert(snapshot.failed == 1);

    std::cout << "✓ Rejected nodes test passed" << std::endl;
}

void test_cancellation_mid_transfer() {
    std::cout << "Testing cancellation mid-transfer..." << std::endl;

    Harness h("cancel");
    h.job.max_workers = 2;
    h.service->block_downloads_until_abort = true;
    auto nodes = make_nodes(6);

    {
        auto dispatcher = h.dispatcher();
        h.submit_all(*dispatcher, nodes);
        std::this_thread::sleep_for(milliseconds(50));
        h.token.cancel();
        dispatcher->wait();
    }

    assert(h.results.size() == 6);
    for (const auto& r : h.results) {
        assert(r.is_failure());
        assert(r.error_code == ErrorCode::cancelled_by_user);
        assert(r.reason == "cancelled");
    }
    // Only the two in-flight transfers ever started
    assert(h.service->download_calls <= 2);
    assert(count_files_with_suffix(h.job.output_dir, ".part") == 0);
    assert(count_files_with_suffix(h.job.output_dir, ".png") == 0);

    std::cout << "✓ Cancellation mid-transfer test passed" << std::endl;
}

int main() {
    std::cout << "Running Download Dispatcher Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_target_path();
        test_concurrency_bound();
        test_retry_budget();
        test_rate_limit_spends_no_budget();
        test_reject_reports_failure();
        test_cancellation_mid_transfer();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All download dispatcher tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
