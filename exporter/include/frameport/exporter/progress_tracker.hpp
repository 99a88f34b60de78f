#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace frameport {
namespace exporter {

enum class ProgressKind {
    completed,
    failed
};

struct ProgressSnapshot {
    int64_t total = 0;
    int64_t completed = 0;
    int64_t failed = 0;

    int64_t finished() const { return completed + failed; }
};

// current = completed + failed
using ProgressCallback = std::function<void(int64_t current, int64_t total, const std::string& label)>;

/**
 * Thread-safe progress counters with an optional observer.
 *
 * The observer runs synchronously under the tracker's lock, so successive
 * invocations see strictly increasing `current` values. It must not call back
 * into the tracker.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(int64_t total = 0) { snapshot_.total = total; }

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void reset(int64_t total);
    void increment(ProgressKind kind, const std::string& label = "");
    ProgressSnapshot snapshot() const;
    void on_update(ProgressCallback callback);

private:
    mutable std::mutex mu_;
    ProgressSnapshot snapshot_;
    ProgressCallback callback_;
};

} // namespace exporter
} // namespace frameport
