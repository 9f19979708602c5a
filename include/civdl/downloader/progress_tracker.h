#pragma once

#include <civdl/downloader/download_task.h>

#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace civdl::downloader {

using ProgressCallback = std::function<void(const DownloadTask&)>;
using CompletionCallback = std::function<void(const DownloadTask&)>;

struct ThroughputSnapshot {
    std::array<size_t, 6> byStatus{}; // indexed by TaskStatus
    std::uint64_t totalBytes{0};      // downloadedSize summed over all tasks
    double aggregateSpeed{0.0};       // bytes/s over Downloading tasks

    [[nodiscard]] size_t count(TaskStatus s) const { return byStatus[static_cast<size_t>(s)]; }
};

/**
 * ProgressTracker
 *
 * Callback bus plus aggregate bookkeeping. Workers publish task snapshots;
 * a dedicated dispatcher thread drains the event queue and invokes the
 * registered observers in publication order, so a slow or throwing observer
 * never stalls a transfer. Observer exceptions are logged and dropped.
 *
 * Observers must not call flush() or stop() (the dispatcher would wait on
 * itself).
 */
class ProgressTracker {
public:
    ProgressTracker();
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void addProgressCallback(ProgressCallback cb);
    void addCompletionCallback(CompletionCallback cb);

    // Records the snapshot and queues a progress event.
    void publishProgress(const DownloadTask& task);
    // Records the snapshot and queues a completion event (terminal states).
    void publishCompletion(const DownloadTask& task);
    // Records the snapshot without notifying anyone.
    void record(const DownloadTask& task);

    [[nodiscard]] ThroughputSnapshot snapshot() const;

    // Blocks until every event queued so far has been delivered.
    void flush();

    // Delivers what is queued, then stops the dispatcher. Later publishes only record.
    void stop();

private:
    enum class EventKind { Progress, Completion };
    struct Event {
        EventKind kind;
        DownloadTask task;
    };

    void enqueue(EventKind kind, const DownloadTask& task);
    void dispatchLoop(std::stop_token token);
    void deliver(const Event& ev);

    struct TaskFigures {
        TaskStatus status{TaskStatus::Pending};
        std::uint64_t downloaded{0};
        double speed{0.0};
    };

    mutable std::mutex stateMutex_;
    std::unordered_map<std::string, TaskFigures> figures_;

    std::mutex callbackMutex_;
    std::vector<ProgressCallback> progressCallbacks_;
    std::vector<CompletionCallback> completionCallbacks_;

    std::mutex queueMutex_;
    std::condition_variable_any queueCv_;
    std::condition_variable_any drainedCv_;
    std::deque<Event> events_;
    size_t inFlight_{0};
    bool stopping_{false};

    std::jthread dispatcher_;
};

} // namespace civdl::downloader
