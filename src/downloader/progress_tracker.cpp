#include <civdl/downloader/progress_tracker.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <optional>

namespace civdl::downloader {

ProgressTracker::ProgressTracker()
    : dispatcher_([this](std::stop_token token) { dispatchLoop(token); }) {}

ProgressTracker::~ProgressTracker() {
    stop();
}

void ProgressTracker::addProgressCallback(ProgressCallback cb) {
    if (!cb)
        return;
    std::lock_guard<std::mutex> lk(callbackMutex_);
    progressCallbacks_.push_back(std::move(cb));
}

void ProgressTracker::addCompletionCallback(CompletionCallback cb) {
    if (!cb)
        return;
    std::lock_guard<std::mutex> lk(callbackMutex_);
    completionCallbacks_.push_back(std::move(cb));
}

void ProgressTracker::record(const DownloadTask& task) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    auto& f = figures_[task.id];
    f.status = task.status;
    f.downloaded = task.downloadedSize;
    f.speed = task.status == TaskStatus::Downloading ? task.speed : 0.0;
}

void ProgressTracker::publishProgress(const DownloadTask& task) {
    record(task);
    enqueue(EventKind::Progress, task);
}

void ProgressTracker::publishCompletion(const DownloadTask& task) {
    record(task);
    enqueue(EventKind::Completion, task);
}

ThroughputSnapshot ProgressTracker::snapshot() const {
    ThroughputSnapshot snap;
    std::lock_guard<std::mutex> lk(stateMutex_);
    for (const auto& [id, f] : figures_) {
        snap.byStatus[static_cast<size_t>(f.status)]++;
        snap.totalBytes += f.downloaded;
        if (f.status == TaskStatus::Downloading)
            snap.aggregateSpeed += f.speed;
    }
    return snap;
}

void ProgressTracker::enqueue(EventKind kind, const DownloadTask& task) {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        if (stopping_)
            return;
        events_.push_back(Event{kind, task});
    }
    queueCv_.notify_one();
}

void ProgressTracker::flush() {
    if (std::this_thread::get_id() == dispatcher_.get_id())
        return;
    std::unique_lock<std::mutex> lk(queueMutex_);
    drainedCv_.wait(lk, [this] { return events_.empty() && inFlight_ == 0; });
}

void ProgressTracker::stop() {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (dispatcher_.joinable() && std::this_thread::get_id() != dispatcher_.get_id())
        dispatcher_.join();
}

void ProgressTracker::dispatchLoop(std::stop_token token) {
    while (true) {
        std::optional<Event> ev;
        {
            std::unique_lock<std::mutex> lk(queueMutex_);
            queueCv_.wait(lk, token, [this] { return stopping_ || !events_.empty(); });
            if (events_.empty()) {
                drainedCv_.notify_all();
                if (stopping_ || token.stop_requested())
                    return;
                continue;
            }
            ev.emplace(std::move(events_.front()));
            events_.pop_front();
            ++inFlight_;
        }

        deliver(*ev);

        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            --inFlight_;
            if (events_.empty())
                drainedCv_.notify_all();
        }
    }
}

void ProgressTracker::deliver(const Event& ev) {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lk(callbackMutex_);
        callbacks = ev.kind == EventKind::Progress ? progressCallbacks_ : completionCallbacks_;
    }
    for (const auto& cb : callbacks) {
        try {
            cb(ev.task);
        } catch (const std::exception& e) {
            spdlog::error("{} callback for task {} threw: {}",
                          ev.kind == EventKind::Progress ? "Progress" : "Completion", ev.task.id,
                          e.what());
        } catch (...) {
            spdlog::error("{} callback for task {} threw unknown exception",
                          ev.kind == EventKind::Progress ? "Progress" : "Completion", ev.task.id);
        }
    }
}

} // namespace civdl::downloader
