#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "frameport/exporter/rate_limit_governor.hpp"
#include "test_support.hpp"

using namespace frameport::exporter;
using frameport::exporter::testing::ManualClock;
using std::chrono::milliseconds;

void test_parse_retry_after() {
    std::cout << "Testing Retry-After parsing..." << std::endl;

    assert(RateLimitGovernor::parse_retry_after("2") == milliseconds(2000));
    assert(RateLimitGovernor::parse_retry_after(" 30 ") == milliseconds(30000));
    assert(RateLimitGovernor::parse_retry_after("0") == milliseconds(0));
    assert(!RateLimitGovernor::parse_retry_after("").has_value());
    assert(!RateLimitGovernor::parse_retry_after("-1").has_value());
    assert(!RateLimitGovernor::parse_retry_after("1.5").has_value());
    assert(!RateLimitGovernor::parse_retry_after("Wed, 21 Oct 2026 07:28:00 GMT").has_value());

    std::cout << "✓ Retry-After parsing test passed" << std::endl;
}

void test_hint_sets_pause_window() {
    std::cout << "Testing pause window from hint..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RateLimitGovernor governor(clock);

    assert(governor.should_pause() == milliseconds(0));

    auto pause = governor.record_limit_hit(milliseconds(2000));
    assert(pause == milliseconds(2000));
    assert(governor.should_pause() == milliseconds(2000));

    clock->advance(milliseconds(1500));
    assert(governor.should_pause() == milliseconds(500));

    clock->advance(milliseconds(500));
    assert(governor.should_pause() == milliseconds(0));

    std::cout << "✓ Pause window from hint test passed" << std::endl;
}

void test_window_never_shrinks() {
    std::cout << "Testing pause window monotonicity..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RateLimitGovernor governor(clock);

    governor.record_limit_hit(milliseconds(10000));
    auto before = governor.state().resume_not_before;

    // A shorter hint seen by another worker must not cut the pause short
    governor.record_limit_hit(milliseconds(1000));
    assert(governor.state().resume_not_before == before);
    assert(governor.should_pause() == milliseconds(10000));

    // Success inside the window keeps it
    governor.record_success();
    assert(governor.should_pause() == milliseconds(10000));
    assert(governor.state().consecutive_limit_hits == 0);

    std::cout << "✓ Pause window monotonicity test passed" << std::endl;
}

void test_exponential_without_hint() {
    std::cout << "Testing exponential pause without hint..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RateLimitGovernor::Config config;
    config.base_delay_ms = 1000;
    config.max_delay_ms = 60000;
    RateLimitGovernor governor(clock, config);

    assert(governor.record_limit_hit(std::nullopt) == milliseconds(1000));
    assert(governor.record_limit_hit(std::nullopt) == milliseconds(2000));
    assert(governor.record_limit_hit(std::nullopt) == milliseconds(4000));
    for (int i = 0; i < 10; ++i) {
        governor.record_limit_hit(std::nullopt);
    }
    assert(governor.record_limit_hit(std::nullopt) == milliseconds(60000));

    clock->advance(milliseconds(60000));
    governor.record_success();
    assert(governor.state().consecutive_limit_hits == 0);
    assert(governor.state().resume_not_before == Clock::time_point::min());
    assert(governor.record_limit_hit(std::nullopt) == milliseconds(1000));

    std::cout << "✓ Exponential pause without hint test passed" << std::endl;
}

void test_wait_until_clear() {
    std::cout << "Testing wait_until_clear..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RateLimitGovernor governor(clock);
    CancellationToken token;

    auto start = clock->now();
    governor.record_limit_hit(milliseconds(3000));
    assert(governor.wait_until_clear(token));
    assert(clock->now() - start >= milliseconds(3000));
    assert(governor.should_pause() == milliseconds(0));

    governor.record_limit_hit(milliseconds(3000));
    token.cancel();
    assert(!governor.wait_until_clear(token));

    std::cout << "✓ wait_until_clear test passed" << std::endl;
}

void test_shared_across_threads() {
    std::cout << "Testing governor shared across threads..." << std::endl;

    auto clock = std::make_shared<ManualClock>();
    RateLimitGovernor governor(clock);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&governor, i]() {
            governor.record_limit_hit(milliseconds(1000 * (i + 1)));
        });
    }
    for (auto& t : threads) t.join();

    assert(governor.state().consecutive_limit_hits == 8);
    assert(governor.should_pause() >= milliseconds(8000) - milliseconds(1));

    std::cout << "✓ Governor shared across threads test passed" << std::endl;
}

int main() {
    std::cout << "Running Rate Limit Governor Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_parse_retry_after();
        test_hint_sets_pause_window();
        test_window_never_shrinks();
        test_exponential_without_hint();
        test_wait_until_clear();
        test_shared_across_threads();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All rate limit governor tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
