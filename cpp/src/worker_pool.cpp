#include "recload/worker_pool.h"
#include "recload/log.h"
#include "recload/utilities.h"

namespace recload {

WorkerPool::WorkerPool(unsigned threads, size_t queue_capacity)
    : cap_(queue_capacity ? queue_capacity : 1) {
    resize(threads ? threads : 1);
}

WorkerPool::~WorkerPool() {
    shutdown_now();
    join_threads();
}

bool WorkerPool::submit(Task task) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_not_full_.wait(lk, [&] { return closed_ || q_.size() < cap_; });
    if (closed_) return false;
    q_.push_back(std::move(task));
    cv_not_empty_.notify_one();
    return true;
}

void WorkerPool::resize(unsigned threads) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shut_down_) return; // a closed pool still drains its queue and may widen
    }
    std::lock_guard<std::mutex> lk(threads_mu_);
    while (threads_.size() < threads) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

unsigned WorkerPool::size() const {
    std::lock_guard<std::mutex> lk(threads_mu_);
    return (unsigned)threads_.size();
}

void WorkerPool::close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
}

size_t WorkerPool::shutdown_now() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    shut_down_ = true;
    const size_t dropped = q_.size();
    q_.clear();
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
    return dropped;
}

void WorkerPool::join() {
    join_threads();

    std::lock_guard<std::mutex> lk(err_mu_);
    if (first_error_) {
        std::exception_ptr e = first_error_;
        first_error_ = nullptr;
        std::rethrow_exception(e);
    }
}

// A worker may append threads (resize) while we join, so re-check the size each round.
void WorkerPool::join_threads() {
    size_t i = 0;
    while (true) {
        std::thread* th = nullptr;
        {
            std::lock_guard<std::mutex> lk(threads_mu_);
            if (i >= threads_.size()) break;
            th = &threads_[i];
        }
        if (th->joinable()) th->join();
        ++i;
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
}

bool WorkerPool::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
            if (q_.empty()) return; // closed and drained
            task = std::move(q_.front());
            q_.pop_front();
            cv_not_full_.notify_one();
        }

        try {
            task();
        } catch (...) {
            std::exception_ptr e = std::current_exception();
            log_error("worker task failed: " + exception_message(e));
            std::lock_guard<std::mutex> lk(err_mu_);
            if (!first_error_) first_error_ = e;
        }
    }
}

} // namespace recload
