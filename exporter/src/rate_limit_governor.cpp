#include "frameport/exporter/rate_limit_governor.hpp"
#include <algorithm>
#include <cctype>

namespace frameport {
namespace exporter {

RateLimitGovernor::RateLimitGovernor(std::shared_ptr<Clock> clock, Config config)
    : clock_(clock ? std::move(clock) : make_steady_clock()), config_(config) {}

std::chrono::milliseconds RateLimitGovernor::should_pause() const {
    std::lock_guard<std::mutex> lock(mu_);
    auto now = clock_->now();
    if (state_.resume_not_before <= now) {
        return std::chrono::milliseconds(0);
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(state_.resume_not_before - now);
    // Round sub-millisecond remainders up so callers never spin on a zero wait
    return remaining.count() > 0 ? remaining : std::chrono::milliseconds(1);
}

std::chrono::milliseconds RateLimitGovernor::record_limit_hit(
    std::optional<std::chrono::milliseconds> retry_after_hint) {
    std::lock_guard<std::mutex> lock(mu_);

    std::chrono::milliseconds pause;
    if (retry_after_hint) {
        pause = *retry_after_hint;
    } else {
        int32_t exponent = std::min<int32_t>(state_.consecutive_limit_hits, 30);
        int64_t delay = config_.base_delay_ms * (1LL << exponent);
        pause = std::chrono::milliseconds(std::min(delay, config_.max_delay_ms));
    }

    auto candidate = clock_->now() + pause;
    if (candidate > state_.resume_not_before) {
        state_.resume_not_before = candidate;
    }
    state_.consecutive_limit_hits++;
    return pause;
}

void RateLimitGovernor::record_success() {
    std::lock_guard<std::mutex> lock(mu_);
    state_.consecutive_limit_hits = 0;
    if (state_.resume_not_before <= clock_->now()) {
        state_.resume_not_before = Clock::time_point::min();
    }
}

bool RateLimitGovernor::wait_until_clear(const CancellationToken& token) const {
    for (;;) {
        if (token.is_cancelled()) {
            return false;
        }
        auto pause = should_pause();
        if (pause.count() == 0) {
            return true;
        }
        if (!interruptible_sleep(*clock_, pause, token)) {
            return false;
        }
    }
}

RateLimitState RateLimitGovernor::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

std::optional<std::chrono::milliseconds> RateLimitGovernor::parse_retry_after(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    std::string trimmed = value.substr(start, end - start + 1);

    if (!std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    if (trimmed.size() > 9) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::stoll(trimmed) * 1000);
}

} // namespace exporter
} // namespace frameport
