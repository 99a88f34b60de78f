#pragma once

#include "frameport/exporter/clock.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace frameport {
namespace exporter {

struct RateLimitState {
    Clock::time_point resume_not_before = Clock::time_point::min(); // min() = no restriction
    int32_t consecutive_limit_hits = 0;
};

/**
 * Process-wide gate for outbound requests after the service signals throttling.
 *
 * Every worker asks should_pause() before a request, so a 429 seen by one
 * worker pauses all of them until the same instant. The pause window only
 * ever grows while hits are recorded; record_success() clears it once it has
 * elapsed.
 */
class RateLimitGovernor {
public:
    struct Config {
        int64_t base_delay_ms = 1000;   // first backoff when no Retry-After was sent
        int64_t max_delay_ms = 60000;
    };

    explicit RateLimitGovernor(std::shared_ptr<Clock> clock) : RateLimitGovernor(std::move(clock), Config()) {}
    RateLimitGovernor(std::shared_ptr<Clock> clock, Config config);

    RateLimitGovernor(const RateLimitGovernor&) = delete;
    RateLimitGovernor& operator=(const RateLimitGovernor&) = delete;

    // Time left before requests may resume; zero when unrestricted
    std::chrono::milliseconds should_pause() const;

    // Returns the pause that was applied
    std::chrono::milliseconds record_limit_hit(std::optional<std::chrono::milliseconds> retry_after_hint);

    void record_success();

    // Block until the window has passed; false if cancelled first
    bool wait_until_clear(const CancellationToken& token) const;

    RateLimitState state() const;

    // Parse a Retry-After header value given in seconds.
    // HTTP-date values and garbage yield no hint.
    static std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value);

private:
    std::shared_ptr<Clock> clock_;
    Config config_;
    mutable std::mutex mu_;
    RateLimitState state_;
};

} // namespace exporter
} // namespace frameport
