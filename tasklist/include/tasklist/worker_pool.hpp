#pragma once
// WorkerPool: fixed set of threads draining a shared job queue
//
// Jobs run to completion on whichever worker picks them up; there is no
// ordering between jobs. wait_idle() blocks until the queue is empty and
// no job is running.

#include <tasklist/log.hpp>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tasklist {

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is shutting down
    bool submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return false;
            jobs_.push(std::move(job));
        }
        work_available_.notify_one();
        return true;
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
    }

    // Finishes queued jobs, then joins every worker
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
        }
        work_available_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    size_t active_ = 0;
    bool stopping_ = false;

    void worker_loop(size_t index) {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_available_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;  // stopping and drained
                }
                job = std::move(jobs_.front());
                jobs_.pop();
                ++active_;
            }

            try {
                job();
            } catch (const std::exception& e) {
                log_error("worker", "worker %zu: job failed: %s", index, e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --active_;
                if (jobs_.empty() && active_ == 0) {
                    idle_.notify_all();
                }
            }
        }
    }
};

} // namespace tasklist
