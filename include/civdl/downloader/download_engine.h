#pragma once

#include <civdl/api/rate_limited_client.h>
#include <civdl/core/types.h>
#include <civdl/downloader/download_task.h>
#include <civdl/downloader/progress_tracker.h>
#include <civdl/downloader/task_queue.h>
#include <civdl/downloader/worker_pool.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace civdl::downloader {

struct DownloaderConfig {
    size_t maxWorkers{3};
    size_t chunkSize{8192};
    int retryTimes{3};
    std::chrono::milliseconds retryDelay{5000};
    std::chrono::milliseconds maxRetryDelay{60000};
    std::chrono::milliseconds progressInterval{500};
    std::chrono::milliseconds schedulerTick{100};
    std::string outputDir{"."}; // used by submitBatch() when no directory is given
};

/**
 * DownloadEngine
 *
 * Owns the task registry, the priority queue, a scheduler thread and a pool
 * of transfer workers. Transfers resume from whatever is already on disk
 * (Range: bytes=<size>-), are retried with exponential backoff on transient
 * failures, and can be paused, resumed or cancelled at chunk granularity.
 *
 * All public methods are thread-safe. Only submit() throws:
 * std::invalid_argument for an empty URL or output path and
 * std::runtime_error after shutdown().
 */
class DownloadEngine {
public:
    explicit DownloadEngine(DownloaderConfig config = {},
                            std::shared_ptr<api::RateLimitedClient> client = nullptr);
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    std::string submit(const std::string& url, const std::string& outputPath,
                       const std::optional<std::string>& filename = std::nullopt,
                       const std::vector<Header>& headers = {}, int priority = 0);

    // Submits every URL into outputPath (config().outputDir when empty).
    // Entries rejected by submit() are logged and skipped.
    std::vector<std::string> submitBatch(const std::vector<std::string>& urls,
                                         const std::string& outputPath = {});

    [[nodiscard]] std::optional<DownloadTask> get(const std::string& taskId) const;
    [[nodiscard]] std::vector<DownloadTask> tasks() const;
    [[nodiscard]] std::vector<DownloadTask> activeTasks() const;

    bool cancel(const std::string& taskId);
    bool pause(const std::string& taskId);
    bool resume(const std::string& taskId);
    size_t cancelAll();

    void registerProgressCallback(ProgressCallback cb);
    void registerCompletionCallback(CompletionCallback cb);

    // True once every known task is terminal and its callbacks have run;
    // false on timeout.
    bool waitAll(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // wait=true: refuse new work, let queued and running transfers finish.
    // wait=false: cancel everything not yet terminal, then stop.
    void shutdown(bool wait = true);

    [[nodiscard]] ThroughputSnapshot stats() const { return tracker_.snapshot(); }
    [[nodiscard]] const DownloaderConfig& config() const noexcept { return config_; }

private:
    enum class Control : int { None, Pause, Cancel };

    struct TaskRecord {
        DownloadTask task;
        std::vector<Header> headers;
        std::atomic<Control> control{Control::None};
        bool incompleteRetried{false};
        bool restartedAfter416{false};
    };
    using RecordPtr = std::shared_ptr<TaskRecord>;

    // What a HEAD reports before the first byte is fetched.
    struct RemoteInfo {
        std::optional<std::string> filename; // from Content-Disposition
        std::optional<std::uint64_t> size;
    };

    void schedulerLoop(std::stop_token token);
    void dispatchLocked();
    void runTask(const RecordPtr& rec);

    Expected<void> transferWithRetry(TaskRecord& rec);
    Expected<void> transferOnce(TaskRecord& rec);
    // Name and size the server would give a fresh GET. A failed HEAD yields an
    // empty RemoteInfo; only pause/cancel is reported as an error.
    Expected<RemoteInfo> queryRemote(TaskRecord& rec, const std::string& url,
                                     const std::vector<Header>& headers);
    // 416 on a resumed transfer. true: local file already matches the remote
    // size. false: partial file discarded, restart from zero.
    Expected<bool> recoverFromRangeError(TaskRecord& rec);
    bool sleepInterruptibly(const TaskRecord& rec, std::chrono::milliseconds delay);
    // Paused or Cancelled, whichever the control flag asks for.
    static Error interruption(const TaskRecord& rec, const std::string& where);
    void finish(TaskRecord& rec, const Expected<void>& result);
    void bumpRetry(TaskRecord& rec, int by = 1);

    // Status change under mutex_; rejects edges outside the transition table.
    bool transitionLocked(TaskRecord& rec, TaskStatus to);
    void wakeScheduler();
    bool allTerminalLocked() const;

    DownloaderConfig config_;
    std::shared_ptr<api::RateLimitedClient> client_;
    ProgressTracker tracker_;

    mutable std::mutex mutex_;
    std::condition_variable_any schedCv_;
    std::condition_variable_any doneCv_;
    std::unordered_map<std::string, RecordPtr> tasks_;
    TaskQueue queue_;
    size_t active_{0};
    std::uint64_t nextId_{0};
    bool wake_{false};
    bool shutdown_{false};
    bool stopped_{false};

    WorkerPool pool_;
    std::jthread scheduler_;
};

} // namespace civdl::downloader
