#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace civdl::downloader {

/**
 * Fixed-size pool of transfer workers.
 *
 * The pool size bounds the number of concurrent sockets and open files.
 * Thread-safe and follows RAII principles; the destructor stops and joins.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * Submit a job without expecting a result.
     * @return false if the pool is stopping and the job was dropped
     */
    bool enqueue_detached(std::function<void()> job);

    /**
     * Stop accepting jobs. Jobs already queued still run; returns once every
     * worker has exited.
     */
    void stop();

    size_t queue_size() const;
    size_t size() const noexcept { return size_; }
    bool is_stopping() const { return state_->stopping.load(); }

private:
    struct PoolState {
        std::queue<std::function<void()>> jobs;
        mutable std::mutex queue_mutex;
        std::condition_variable_any condition;
        std::atomic<bool> stopping{false};
    };

    static void worker_thread(std::shared_ptr<PoolState> state, std::stop_token token);

    size_t size_;
    std::vector<std::jthread> workers_;
    std::shared_ptr<PoolState> state_;
};

} // namespace civdl::downloader
