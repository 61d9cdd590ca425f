#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace recload {

// Fixed-capacity task queue drained by a growable set of worker threads.
// submit() blocks while the queue is full, which throttles input discovery.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(unsigned threads, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // false once the pool is closed or shut down; the task is not run
    bool submit(Task task);

    // Grows the pool to `threads` workers. Never shrinks; no-op after shutdown_now().
    // Still grows after close(), while queued tasks drain.
    void resize(unsigned threads);
    unsigned size() const;

    // Stop accepting tasks; queued tasks still run.
    void close();

    // Stop accepting tasks and drop the queued ones. Returns how many were dropped.
    size_t shutdown_now();

    // Waits for all workers (call close() or shutdown_now() first).
    // Rethrows the first exception that escaped a task.
    void join();

    size_t pending() const;
    bool closed() const;

private:
    void worker_loop();
    void join_threads();

    const size_t cap_;

    mutable std::mutex mu_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;
    std::deque<Task> q_;
    bool closed_{false};
    bool shut_down_{false};

    mutable std::mutex threads_mu_;
    std::deque<std::thread> threads_; // deque: join() keeps references while resize() appends

    std::mutex err_mu_;
    std::exception_ptr first_error_;
};

} // namespace recload
