#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace frameport {
namespace exporter {

/**
 * Fixed set of threads draining a FIFO of transfer tasks.
 *
 * The pool tracks work as queued plus running tasks. A task may submit its
 * own follow-up (a retry or a throttled requeue) before it returns, so the
 * count never touches zero while a chain of attempts is still alive and
 * wait_idle() only returns once every chain has ended.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit WorkerPool(int concurrency, ErrorHandler on_error = nullptr);

    // Runs whatever is still queued, then joins the threads
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Safe to call from inside a running task
    void submit(Task task);

    void wait_idle();

    size_t pending() const;
    size_t running() const;
    int concurrency() const { return concurrency_; }

private:
    void worker_loop();
    void task_done();

    const int concurrency_;
    ErrorHandler on_error_;

    mutable std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t running_ = 0;
    bool stopping_ = false;

    std::vector<std::thread> threads_;
};

} // namespace exporter
} // namespace frameport
