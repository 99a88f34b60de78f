#pragma once

#include "frameport/exporter/core.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace frameport {
namespace exporter {

/**
 * Retry Controller
 *
 * Implements:
 * - Exponential backoff with jitter
 * - Error classification
 * - Attempt budget (initial attempt + max_retries)
 *
 * Stateless apart from the jitter source: the decision is a function of the
 * attempt index only. Resolution and download call sites differ only in the
 * base/max delay they are built with.
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 500;    // Base delay for exponential backoff
        int64_t max_delay_ms = 15000;   // Cap applied before jitter
        int32_t max_retries = 5;        // Retries after the initial attempt
        double jitter_ratio = 0.2;      // Jitter drawn from [0, ratio * delay]
    };

    struct Decision {
        bool retry = false;
        std::chrono::milliseconds delay{0};

        static Decision exhausted() { return Decision{}; }
        static Decision after(std::chrono::milliseconds delay) { return Decision{true, delay}; }
    };

    explicit RetryPolicy() : RetryPolicy(Config()) {}
    explicit RetryPolicy(const Config& config) : config_(config) {}

    // Resolution calls back off in steps scaled from the API timeout
    static RetryPolicy for_resolution(const ExportJob& job) {
        Config config;
        config.base_delay_ms = std::max<int64_t>(1, job.api_timeout_ms / 30);
        config.max_delay_ms = std::max<int64_t>(config.base_delay_ms, job.api_timeout_ms);
        config.max_retries = job.max_retries;
        return RetryPolicy(config);
    }

    // Downloads back off in steps scaled from the transfer timeout
    static RetryPolicy for_transfer(const ExportJob& job) {
        Config config;
        config.base_delay_ms = std::max<int64_t>(1, job.transfer_timeout_ms / 30);
        config.max_delay_ms = std::max<int64_t>(config.base_delay_ms, job.transfer_timeout_ms);
        config.max_retries = job.max_retries;
        return RetryPolicy(config);
    }

    /**
     * Decide what happens after attempt number `attempt` (0 = initial) failed.
     * Exhausted once attempt >= max_retries, so at most max_retries + 1 attempts run.
     */
    Decision next_attempt(int32_t attempt) const {
        if (attempt >= config_.max_retries) {
            return Decision::exhausted();
        }
        int64_t delay = calculate_backoff_delay(attempt);
        return Decision::after(std::chrono::milliseconds(delay + jitter_for(delay)));
    }

    /**
     * Calculate delay for retry attempt using exponential backoff
     * Formula: delay = base * 2^attempt (capped at max_delay_ms)
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        int32_t exponent = std::min<int32_t>(std::max<int32_t>(attempt, 0), 30);
        int64_t delay = config_.base_delay_ms * (1LL << exponent);
        return std::min(delay, config_.max_delay_ms);
    }

    /**
     * Check if error is retryable
     *
     * Retryable errors:
     * - Network errors and timeouts (3001, 3002)
     * - 5xx HTTP errors
     * - Malformed response bodies (1003)
     *
     * Non-retryable errors:
     * - Other 4xx HTTP errors (client errors)
     * - Cancellation
     *
     * 429 is handled by the RateLimitGovernor and never reaches this check.
     */
    bool is_retryable(ErrorCode error_code, int http_status_code = 0) const {
        if (error_code == ErrorCode::cancelled_by_user) {
            return false;
        }

        if (http_status_code > 0) {
            if (http_status_code >= 500) {
                return true;
            }
            if (http_status_code == 408) {
                return true; // request timeout is transient
            }
            if (http_status_code >= 400 && http_status_code < 500) {
                return false;
            }
        }

        switch (error_code) {
            case ErrorCode::network_error:
            case ErrorCode::connection_timeout:
            case ErrorCode::invalid_format:
                return true;

            case ErrorCode::invalid_input:
            case ErrorCode::storage_failed:
                return false;

            default:
                return http_status_code == 0;
        }
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

    const Config& config() const {
        return config_;
    }

private:
    int64_t jitter_for(int64_t delay) const {
        if (config_.jitter_ratio <= 0.0 || delay <= 0) {
            return 0;
        }
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, config_.jitter_ratio);
        return static_cast<int64_t>(static_cast<double>(delay) * dist(rng));
    }

    Config config_;
};

} // namespace exporter
} // namespace frameport
