#include <civdl/downloader/task_queue.h>

namespace civdl::downloader {

void TaskQueue::add(const DownloadTask& task) {
    add(task.id, task.priority);
}

void TaskQueue::add(const std::string& id, int priority) {
    // A second add() of a live id supersedes the earlier entry.
    remove(id);
    auto flag = std::make_shared<bool>(false);
    live_[id] = flag;
    heap_.push(Entry{priority, seq_++, id, std::move(flag)});
}

std::optional<std::string> TaskQueue::next() {
    while (!heap_.empty()) {
        Entry top = heap_.top();
        heap_.pop();
        if (*top.removed)
            continue;
        live_.erase(top.id);
        return top.id;
    }
    return std::nullopt;
}

bool TaskQueue::remove(const std::string& id) {
    auto it = live_.find(id);
    if (it == live_.end())
        return false;
    *it->second = true;
    live_.erase(it);
    return true;
}

bool TaskQueue::contains(const std::string& id) const {
    return live_.find(id) != live_.end();
}

} // namespace civdl::downloader
