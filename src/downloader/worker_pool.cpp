#include <civdl/downloader/worker_pool.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace civdl::downloader {

WorkerPool::WorkerPool(size_t num_threads)
    : size_(num_threads == 0 ? 1 : num_threads), state_(std::make_shared<PoolState>()) {
    workers_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        workers_.emplace_back(
            [state = state_](std::stop_token token) { worker_thread(state, token); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::enqueue_detached(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        if (state_->stopping)
            return false;
        state_->jobs.push(std::move(job));
    }
    state_->condition.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        if (state_->stopping && workers_.empty())
            return;
        state_->stopping = true;
    }
    state_->condition.notify_all();

    // Queued jobs are drained before workers exit, so no request_stop() here.
    for (auto& worker : workers_) {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
}

size_t WorkerPool::queue_size() const {
    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    return state_->jobs.size();
}

void WorkerPool::worker_thread(std::shared_ptr<PoolState> state, std::stop_token token) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);
            state->condition.wait(lock, token,
                                  [&state] { return state->stopping || !state->jobs.empty(); });

            if (state->jobs.empty()) {
                if (state->stopping || token.stop_requested())
                    return;
                continue;
            }
            job = std::move(state->jobs.front());
            state->jobs.pop();
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Download worker job threw: {}", e.what());
        } catch (...) {
            spdlog::error("Download worker job threw unknown exception");
        }
    }
}

} // namespace civdl::downloader
