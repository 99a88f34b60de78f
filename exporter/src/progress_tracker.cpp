#include "frameport/exporter/progress_tracker.hpp"

namespace frameport {
namespace exporter {

void ProgressTracker::reset(int64_t total) {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot_ = ProgressSnapshot{};
    snapshot_.total = total;
}

void ProgressTracker::increment(ProgressKind kind, const std::string& label) {
    std::lock_guard<std::mutex> lock(mu_);
    if (kind == ProgressKind::completed) {
        snapshot_.completed++;
    } else {
        snapshot_.failed++;
    }
    if (callback_) {
        callback_(snapshot_.finished(), snapshot_.total, label);
    }
}

ProgressSnapshot ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return snapshot_;
}

void ProgressTracker::on_update(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mu_);
    callback_ = std::move(callback);
}

} // namespace exporter
} // namespace frameport
