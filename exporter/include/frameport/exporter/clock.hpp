#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace frameport {
namespace exporter {

/**
 * Time source used by every component that waits.
 *
 * Production code uses SteadyClock. Tests inject a clock whose sleep_for()
 * advances virtual time, so backoff and rate-limit windows can be verified
 * without real delays.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

inline std::shared_ptr<Clock> make_steady_clock() {
    return std::make_shared<SteadyClock>();
}

/**
 * Cooperative cancellation signal shared by the coordinator, scheduler,
 * dispatcher workers and in-flight transfers. Copies share one flag.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

    // Raw flag handed to the transport so it can abort a transfer mid-body
    const std::atomic<bool>* flag() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * Sleep in short slices so cancellation is observed promptly.
 * Returns false if the token was cancelled before the full duration elapsed.
 */
inline bool interruptible_sleep(Clock& clock, std::chrono::milliseconds duration,
                                const CancellationToken& token,
                                std::chrono::milliseconds slice = std::chrono::milliseconds(100)) {
    auto deadline = clock.now() + duration;
    while (!token.is_cancelled()) {
        auto now = clock.now();
        if (now >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() <= 0) {
            remaining = std::chrono::milliseconds(1);
        }
        clock.sleep_for(remaining < slice ? remaining : slice);
    }
    return false;
}

} // namespace exporter
} // namespace frameport
