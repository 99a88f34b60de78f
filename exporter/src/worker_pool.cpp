#include "frameport/exporter/worker_pool.hpp"
#include <exception>

namespace frameport {
namespace exporter {

WorkerPool::WorkerPool(int concurrency, ErrorHandler on_error)
    : concurrency_(concurrency > 0 ? concurrency : 1),
      on_error_(std::move(on_error)) {
    threads_.reserve(static_cast<size_t>(concurrency_));
    for (int i = 0; i < concurrency_; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& thread : threads_) {
        thread.join();
    }
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size() + running_;
}

size_t WorkerPool::running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
}

void WorkerPool::task_done() {
    std::lock_guard<std::mutex> lock(mu_);
    running_--;
    if (running_ == 0 && queue_.empty()) {
        idle_cv_.notify_all();
    }
}

void WorkerPool::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            // Counted as running before the lock drops, so pending() never dips
            running_++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            if (on_error_) {
                on_error_(e.what());
            }
        }
        task_done();
    }
}

} // namespace exporter
} // namespace frameport
