#pragma once

#include <civdl/downloader/download_task.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace civdl::downloader {

/**
 * Priority queue of task ids with logical deletion.
 *
 * Ordering is priority ascending, ties broken by insertion order. remove()
 * flags the queued entry instead of searching the heap; next() discards
 * flagged entries as it meets them. Re-adding an id after removal creates a
 * fresh entry, the stale one stays flagged.
 *
 * Not thread-safe; callers serialize access.
 */
class TaskQueue {
public:
    void add(const DownloadTask& task);
    void add(const std::string& id, int priority);

    // Highest-priority live id, or nullopt when nothing live is queued.
    std::optional<std::string> next();

    // Flags the live entry for id. false if id is not queued.
    bool remove(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;

    // Number of live entries.
    [[nodiscard]] size_t size() const noexcept { return live_.size(); }
    [[nodiscard]] bool empty() const noexcept { return live_.empty(); }

private:
    struct Entry {
        int priority;
        std::uint64_t seq;
        std::string id;
        std::shared_ptr<bool> removed;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.priority != b.priority)
                return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
    std::unordered_map<std::string, std::shared_ptr<bool>> live_;
    std::uint64_t seq_{0};
};

} // namespace civdl::downloader
