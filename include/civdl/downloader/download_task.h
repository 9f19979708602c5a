#pragma once

#include <civdl/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace civdl::downloader {

enum class TaskStatus { Pending, Downloading, Paused, Completed, Failed, Cancelled };

constexpr const char* toString(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Downloading: return "downloading";
        case TaskStatus::Paused: return "paused";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

constexpr bool isTerminal(TaskStatus s) {
    return s == TaskStatus::Completed || s == TaskStatus::Failed || s == TaskStatus::Cancelled;
}

/**
 * Allowed status transitions:
 *   Pending     -> Downloading | Paused | Cancelled
 *   Downloading -> Paused | Completed | Failed | Cancelled
 *   Paused      -> Pending | Cancelled
 * Terminal states have no outgoing edges.
 */
constexpr bool canTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Pending:
            return to == TaskStatus::Downloading || to == TaskStatus::Paused ||
                   to == TaskStatus::Cancelled;
        case TaskStatus::Downloading:
            return to == TaskStatus::Paused || to == TaskStatus::Completed ||
                   to == TaskStatus::Failed || to == TaskStatus::Cancelled;
        case TaskStatus::Paused:
            return to == TaskStatus::Pending || to == TaskStatus::Cancelled;
        default:
            return false;
    }
}

/**
 * Snapshot of one download. The engine owns the live copy; everything handed
 * out (get(), callbacks) is a value copy.
 */
struct DownloadTask {
    std::string id;
    std::string url;
    std::string outputPath;              // target directory
    std::optional<std::string> filename; // explicit name requested at submit()
    std::string filePath;                // resolved destination, empty until known
    int priority{0};                     // lower runs first

    TaskStatus status{TaskStatus::Pending};
    std::uint64_t downloadedSize{0};
    std::uint64_t totalSize{0}; // 0 when unknown
    double speed{0.0};          // bytes/s
    std::optional<std::uint64_t> eta; // seconds
    int retryCount{0};
    std::optional<std::string> error; // set iff Failed

    TimePoint createdAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;

    // Percentage in [0, 100]; 0 when the size is unknown.
    [[nodiscard]] double progress() const {
        if (totalSize == 0)
            return 0.0;
        return 100.0 * static_cast<double>(downloadedSize) / static_cast<double>(totalSize);
    }
};

// Filename from a Content-Disposition header value. filename*=UTF-8''... wins
// over a plain filename=; the result is sanitized. nullopt when absent/empty.
std::optional<std::string> parseContentDisposition(std::string_view header);

// Best-effort name for a URL: percent-decoded path basename, else the
// "filename" query parameter (".download" appended when it has no extension),
// else "download_<id>", else "download_<8 hex>".
std::string filenameFromUrl(std::string_view url);

// Replaces \ / * ? : " < > | with '_' and trims surrounding whitespace.
std::string sanitizeFilename(std::string_view name);

} // namespace civdl::downloader
