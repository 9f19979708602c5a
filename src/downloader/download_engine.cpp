/*
 * download_engine.cpp
 *
 * Scheduler + worker pool around single-stream resumable transfers.
 * - One engine mutex guards the registry, the queue and the active count. It is
 *   never held across network or file I/O.
 * - Workers own the transfer; pause/cancel reach them through a per-task
 *   control flag checked between chunk writes and during backoff sleeps.
 * - Resume offset is always the size of the partial file on disk.
 */

#include <civdl/downloader/download_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace civdl::downloader {

namespace fs = std::filesystem;

namespace {

using clock_t = std::chrono::steady_clock;

constexpr auto kSleepSlice = std::chrono::milliseconds(50);

// NetworkError and 5xx are worth another attempt; everything else is final.
bool isTransient(const Error& err) {
    if (err.code == ErrorCode::NetworkError)
        return true;
    return err.code == ErrorCode::ApiError && err.httpStatus >= 500;
}

std::uint64_t localSize(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        return 0;
    auto size = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::string describe(const Error& err) {
    return std::string(errorToString(err.code)) + ": " + err.message;
}

} // namespace

DownloadEngine::DownloadEngine(DownloaderConfig config,
                               std::shared_ptr<api::RateLimitedClient> client)
    : config_(std::move(config)), client_(std::move(client)),
      pool_(config_.maxWorkers == 0 ? 1 : config_.maxWorkers) {
    if (config_.maxWorkers == 0) {
        spdlog::warn("max_workers is 0; using 1");
        config_.maxWorkers = 1;
    }
    if (config_.chunkSize == 0)
        config_.chunkSize = DownloaderConfig{}.chunkSize;
    if (!client_)
        client_ = std::make_shared<api::RateLimitedClient>(api::ClientConfig{});

    scheduler_ = std::jthread([this](std::stop_token token) { schedulerLoop(token); });
    spdlog::debug("DownloadEngine started: {} workers, chunk {} bytes", config_.maxWorkers,
                  config_.chunkSize);
}

DownloadEngine::~DownloadEngine() {
    shutdown(false);
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

std::string DownloadEngine::submit(const std::string& url, const std::string& outputPath,
                                   const std::optional<std::string>& filename,
                                   const std::vector<Header>& headers, int priority) {
    if (url.empty())
        throw std::invalid_argument("download URL must not be empty");
    if (outputPath.empty())
        throw std::invalid_argument("output path must not be empty");

    auto rec = std::make_shared<TaskRecord>();
    rec->headers = headers;
    auto& t = rec->task;
    t.url = url;
    t.outputPath = outputPath;
    if (filename && !filename->empty())
        t.filename = sanitizeFilename(*filename);
    t.priority = priority;
    t.createdAt = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_)
            throw std::runtime_error("DownloadEngine has been shut down");
        t.id = "task-" + std::to_string(++nextId_);
        tasks_.emplace(t.id, rec);
        queue_.add(t);
        tracker_.record(t);
    }
    wakeScheduler();
    spdlog::info("Queued {} ({}) priority {}", t.id, url, priority);
    return t.id;
}

std::vector<std::string> DownloadEngine::submitBatch(const std::vector<std::string>& urls,
                                                     const std::string& outputPath) {
    const std::string& dir = outputPath.empty() ? config_.outputDir : outputPath;
    std::vector<std::string> ids;
    ids.reserve(urls.size());
    for (const auto& url : urls) {
        try {
            ids.push_back(submit(url, dir));
        } catch (const std::invalid_argument& e) {
            spdlog::error("Skipping batch entry '{}': {}", url, e.what());
        }
    }
    return ids;
}

std::optional<DownloadTask> DownloadEngine::get(const std::string& taskId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second->task;
}

std::vector<DownloadTask> DownloadEngine::tasks() const {
    std::vector<DownloadTask> out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        out.reserve(tasks_.size());
        for (const auto& [id, rec] : tasks_)
            out.push_back(rec->task);
    }
    std::sort(out.begin(), out.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
    });
    return out;
}

std::vector<DownloadTask> DownloadEngine::activeTasks() const {
    auto all = tasks();
    std::erase_if(all, [](const DownloadTask& t) { return t.status != TaskStatus::Downloading; });
    return all;
}

bool DownloadEngine::cancel(const std::string& taskId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return false;
    auto& rec = *it->second;

    switch (rec.task.status) {
        case TaskStatus::Pending:
        case TaskStatus::Paused:
            queue_.remove(taskId);
            transitionLocked(rec, TaskStatus::Cancelled);
            rec.task.completedAt = std::chrono::system_clock::now();
            rec.task.speed = 0.0;
            rec.task.eta.reset();
            tracker_.publishCompletion(rec.task);
            doneCv_.notify_all();
            spdlog::info("Cancelled {}", taskId);
            return true;
        case TaskStatus::Downloading:
            rec.control = Control::Cancel;
            return true;
        default:
            return false;
    }
}

bool DownloadEngine::pause(const std::string& taskId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return false;
    auto& rec = *it->second;

    switch (rec.task.status) {
        case TaskStatus::Pending:
            queue_.remove(taskId);
            transitionLocked(rec, TaskStatus::Paused);
            tracker_.publishProgress(rec.task);
            spdlog::info("Paused {} before it started", taskId);
            return true;
        case TaskStatus::Downloading: {
            // Cancel wins over pause.
            Control expected = Control::None;
            rec.control.compare_exchange_strong(expected, Control::Pause);
            return expected != Control::Cancel;
        }
        default:
            return false;
    }
}

bool DownloadEngine::resume(const std::string& taskId) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end())
            return false;
        auto& rec = *it->second;

        if (rec.task.status == TaskStatus::Downloading) {
            // Pause requested but the worker has not stopped yet: withdraw it.
            Control expected = Control::Pause;
            return rec.control.compare_exchange_strong(expected, Control::None);
        }
        if (rec.task.status != TaskStatus::Paused || shutdown_)
            return false;

        rec.control = Control::None;
        transitionLocked(rec, TaskStatus::Pending);
        queue_.add(rec.task);
        tracker_.publishProgress(rec.task);
    }
    wakeScheduler();
    spdlog::info("Resumed {}", taskId);
    return true;
}

size_t DownloadEngine::cancelAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [id, rec] : tasks_) {
            if (!isTerminal(rec->task.status))
                ids.push_back(id);
        }
    }
    size_t n = 0;
    for (const auto& id : ids) {
        if (cancel(id))
            ++n;
    }
    if (n > 0)
        spdlog::info("Cancelling {} tasks", n);
    return n;
}

void DownloadEngine::registerProgressCallback(ProgressCallback cb) {
    tracker_.addProgressCallback(std::move(cb));
}

void DownloadEngine::registerCompletionCallback(CompletionCallback cb) {
    tracker_.addCompletionCallback(std::move(cb));
}

bool DownloadEngine::waitAll(std::optional<std::chrono::milliseconds> timeout) {
    {
        std::unique_lock<std::mutex> lk(mutex_);
        auto done = [this] { return allTerminalLocked(); };
        if (timeout) {
            if (!doneCv_.wait_for(lk, *timeout, done)) {
                spdlog::warn("waitAll timed out after {} ms", timeout->count());
                return false;
            }
        } else {
            doneCv_.wait(lk, done);
        }
    }
    tracker_.flush();
    return true;
}

void DownloadEngine::shutdown(bool wait) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopped_)
            return;
        shutdown_ = true;
    }
    spdlog::info("DownloadEngine shutting down (wait={})", wait);

    if (wait) {
        std::unique_lock<std::mutex> lk(mutex_);
        doneCv_.wait(lk, [this] { return queue_.empty() && active_ == 0; });
    } else {
        cancelAll();
    }

    scheduler_.request_stop();
    schedCv_.notify_all();
    if (scheduler_.joinable())
        scheduler_.join();

    // Running jobs observe their cancel flag within one chunk or sleep slice.
    pool_.stop();
    tracker_.stop();

    std::lock_guard<std::mutex> lk(mutex_);
    stopped_ = true;
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

void DownloadEngine::wakeScheduler() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        wake_ = true;
    }
    schedCv_.notify_all();
}

void DownloadEngine::schedulerLoop(std::stop_token token) {
    std::unique_lock<std::mutex> lk(mutex_);
    while (!token.stop_requested()) {
        dispatchLocked();
        schedCv_.wait_for(lk, token, config_.schedulerTick, [this] { return wake_; });
        wake_ = false;
    }
}

void DownloadEngine::dispatchLocked() {
    while (active_ < config_.maxWorkers) {
        auto id = queue_.next();
        if (!id)
            return;
        auto it = tasks_.find(*id);
        if (it == tasks_.end())
            continue;
        RecordPtr rec = it->second;
        if (!transitionLocked(*rec, TaskStatus::Downloading))
            continue;

        rec->control = Control::None;
        if (!rec->task.startedAt)
            rec->task.startedAt = std::chrono::system_clock::now();
        ++active_;

        if (!pool_.enqueue_detached([this, rec] { runTask(rec); })) {
            --active_;
            rec->task.status = TaskStatus::Pending;
            queue_.add(rec->task);
            return;
        }
        tracker_.publishProgress(rec->task);
        spdlog::debug("Dispatched {} ({} active)", rec->task.id, active_);
    }
}

bool DownloadEngine::transitionLocked(TaskRecord& rec, TaskStatus to) {
    if (!canTransition(rec.task.status, to)) {
        spdlog::debug("Ignoring {} -> {} for {}", toString(rec.task.status), toString(to),
                      rec.task.id);
        return false;
    }
    rec.task.status = to;
    return true;
}

bool DownloadEngine::allTerminalLocked() const {
    return std::all_of(tasks_.begin(), tasks_.end(),
                       [](const auto& kv) { return isTerminal(kv.second->task.status); });
}

// ---------------------------------------------------------------------------
// Transfers
// ---------------------------------------------------------------------------

void DownloadEngine::runTask(const RecordPtr& rec) {
    // A throwing transfer still has to release its worker slot.
    Expected<void> result = Error{ErrorCode::Unknown, "transfer did not run"};
    try {
        result = transferWithRetry(*rec);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::Unknown, std::string("transfer aborted: ") + e.what()};
    } catch (...) {
        result = Error{ErrorCode::Unknown, "transfer aborted by unknown exception"};
    }
    finish(*rec, result);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        --active_;
        wake_ = true;
    }
    schedCv_.notify_all();
    doneCv_.notify_all();
}

void DownloadEngine::bumpRetry(TaskRecord& rec, int by) {
    std::lock_guard<std::mutex> lk(mutex_);
    rec.task.retryCount += by;
}

bool DownloadEngine::sleepInterruptibly(const TaskRecord& rec, std::chrono::milliseconds delay) {
    const auto deadline = clock_t::now() + delay;
    while (clock_t::now() < deadline) {
        if (rec.control.load() != Control::None)
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_t::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(kSleepSlice)));
    }
    return rec.control.load() == Control::None;
}

Error DownloadEngine::interruption(const TaskRecord& rec, const std::string& where) {
    if (rec.control.load() == Control::Pause)
        return Error{ErrorCode::Paused, "paused " + where};
    return Error{ErrorCode::Cancelled, "cancelled " + where};
}

Expected<void> DownloadEngine::transferWithRetry(TaskRecord& rec) {
    const std::string id = rec.task.id;
    int attempt = 0;
    for (;;) {
        if (rec.control.load() != Control::None)
            return interruption(rec, "before transfer");
        auto result = transferOnce(rec);
        if (result.ok())
            return result;

        const Error& err = result.error();
        if (err == ErrorCode::Paused || err == ErrorCode::Cancelled)
            return result;

        if (err.httpStatus == 416) {
            auto recovered = recoverFromRangeError(rec);
            if (!recovered.ok())
                return recovered.error();
            if (recovered.value())
                return Expected<void>{};
            bumpRetry(rec);
            continue;
        }

        if (err == ErrorCode::IncompleteTransfer) {
            if (rec.incompleteRetried)
                return result;
            rec.incompleteRetried = true;
            spdlog::warn("{}: {}; retrying once", id, err.message);
            bumpRetry(rec);
            continue;
        }

        if (!isTransient(err) || attempt >= config_.retryTimes)
            return result;

        auto delay = config_.retryDelay * (std::int64_t{1} << std::min(attempt, 20));
        delay = std::min(delay, config_.maxRetryDelay);
        ++attempt;
        bumpRetry(rec);
        spdlog::warn("{}: {} (attempt {}/{}), retrying in {} ms", id, err.message, attempt,
                     config_.retryTimes, delay.count());
        if (!sleepInterruptibly(rec, delay))
            return interruption(rec, "during backoff");
    }
}

Expected<bool> DownloadEngine::recoverFromRangeError(TaskRecord& rec) {
    std::string url;
    std::string path;
    std::vector<Header> headers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        url = rec.task.url;
        path = rec.task.filePath;
        headers = rec.headers;
    }
    const auto local = localSize(path);

    auto remoteInfo = queryRemote(rec, url, headers);
    if (!remoteInfo.ok())
        return remoteInfo.error();
    const auto remote = remoteInfo.value().size;

    if (remote && *remote == local) {
        spdlog::info("{}: local file already complete ({} bytes)", rec.task.id, local);
        std::lock_guard<std::mutex> lk(mutex_);
        rec.task.downloadedSize = local;
        rec.task.totalSize = local;
        return true;
    }

    if (rec.restartedAfter416) {
        return Error{ErrorCode::ApiError,
                     "Range not satisfiable for " + url + " after restarting from zero", 416};
    }
    rec.restartedAfter416 = true;
    spdlog::warn("{}: range rejected (local {} bytes, remote {}); restarting from zero",
                 rec.task.id, local, remote ? std::to_string(*remote) : "unknown");

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "Cannot remove " + path + " for restart: " + ec.message()};
    }
    std::lock_guard<std::mutex> lk(mutex_);
    rec.task.downloadedSize = 0;
    rec.task.totalSize = 0;
    return false;
}

Expected<DownloadEngine::RemoteInfo>
DownloadEngine::queryRemote(TaskRecord& rec, const std::string& url,
                            const std::vector<Header>& headers) {
    auto head = client_->request("HEAD", url, headers, {},
                                 [&rec] { return rec.control.load() != Control::None; });
    RemoteInfo info;
    if (!head.ok()) {
        if (head.error() == ErrorCode::Cancelled)
            return interruption(rec, "while waiting for HEAD");
        spdlog::debug("{}: HEAD {} failed: {}", rec.task.id, url, head.error().message);
        return info;
    }
    if (head.value().throttleRetries > 0)
        bumpRetry(rec, head.value().throttleRetries);
    info.size = head.value().contentLength();
    if (auto cd = head.value().header("Content-Disposition"))
        info.filename = parseContentDisposition(*cd);
    return info;
}

Expected<void> DownloadEngine::transferOnce(TaskRecord& rec) {
    DownloadTask snap;
    std::vector<Header> headers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        snap = rec.task;
        headers = rec.headers;
    }

    const fs::path dir = snap.outputPath;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::FilesystemError,
                     "Cannot create directory " + dir.string() + ": " + ec.message()};
    }

    // First attempt without a chosen name: ask the server for it, so a partial
    // file saved under its Content-Disposition name is resumed, not truncated.
    std::string name;
    std::optional<std::uint64_t> remoteSize;
    if (snap.filename) {
        name = *snap.filename;
    } else if (!snap.filePath.empty()) {
        name = fs::path(snap.filePath).filename().string();
    } else {
        auto info = queryRemote(rec, snap.url, headers);
        if (!info.ok())
            return info.error();
        name = info.value().filename.value_or(filenameFromUrl(snap.url));
        remoteSize = info.value().size;
    }

    fs::path path = dir / name;
    std::uint64_t offset = localSize(path);
    if (remoteSize && offset > 0 && offset == *remoteSize) {
        spdlog::info("{}: {} already complete ({} bytes)", snap.id, path.string(), offset);
        std::lock_guard<std::mutex> lk(mutex_);
        rec.task.filePath = path.string();
        rec.task.downloadedSize = offset;
        rec.task.totalSize = offset;
        return Expected<void>{};
    }
    if (offset > 0) {
        headers.push_back(Header{"Range", "bytes=" + std::to_string(offset) + "-"});
        spdlog::info("{}: resuming {} from byte {}", snap.id, path.string(), offset);
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        rec.task.filePath = path.string();
        rec.task.downloadedSize = offset;
        if (rec.task.totalSize > 0 && offset > rec.task.totalSize)
            rec.task.totalSize = 0;
    }

    std::ofstream out;
    std::uint64_t downloaded = offset;
    std::uint64_t total = 0;
    std::uint64_t sinceUpdate = 0;
    auto lastUpdate = clock_t::now();

    auto publish = [&](clock_t::time_point now) {
        const double elapsed = std::chrono::duration<double>(now - lastUpdate).count();
        DownloadTask copy;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto& t = rec.task;
            t.downloadedSize = downloaded;
            if (elapsed > 0.0)
                t.speed = static_cast<double>(sinceUpdate) / elapsed;
            if (t.speed > 0.0 && total > downloaded)
                t.eta = static_cast<std::uint64_t>(static_cast<double>(total - downloaded) /
                                                   t.speed);
            else
                t.eta.reset();
            copy = t;
        }
        tracker_.publishProgress(copy);
        sinceUpdate = 0;
        lastUpdate = now;
    };

    auto onResponse = [&](const net::HttpResponse& resp) -> Expected<void> {
        if (resp.throttleRetries > 0)
            bumpRetry(rec, resp.throttleRetries);

        if (offset == 0 && !snap.filename) {
            if (auto cd = resp.header("Content-Disposition")) {
                if (auto headerName = parseContentDisposition(*cd))
                    path = dir / *headerName;
            }
        }

        bool append = false;
        if (offset > 0 && resp.status == 206) {
            append = true;
        } else if (offset > 0) {
            spdlog::warn("{}: server ignored Range (HTTP {}); restarting from zero", snap.id,
                         resp.status);
            offset = 0;
        }
        downloaded = offset;

        auto length = resp.contentLength();
        total = length ? (append ? *length + offset : *length) : 0;

        out.open(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out) {
            return Error{ErrorCode::FilesystemError,
                         "Cannot open " + path.string() + ": " + std::strerror(errno)};
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            rec.task.filePath = path.string();
            rec.task.totalSize = total;
            rec.task.downloadedSize = downloaded;
        }
        lastUpdate = clock_t::now();
        return Expected<void>{};
    };

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        size_t pos = 0;
        while (pos < data.size()) {
            switch (rec.control.load()) {
                case Control::Cancel:
                    return Error{ErrorCode::Cancelled, "cancelled"};
                case Control::Pause:
                    return Error{ErrorCode::Paused, "paused"};
                case Control::None:
                    break;
            }
            const size_t n = std::min(config_.chunkSize, data.size() - pos);
            out.write(reinterpret_cast<const char*>(data.data() + pos),
                      static_cast<std::streamsize>(n));
            if (!out) {
                return Error{ErrorCode::FilesystemError,
                             "Write to " + path.string() + " failed: " + std::strerror(errno)};
            }
            pos += n;
            downloaded += n;
            sinceUpdate += n;

            const auto now = clock_t::now();
            if (now - lastUpdate >= config_.progressInterval)
                publish(now);
        }
        return Expected<void>{};
    };

    net::HttpRequest req;
    req.url = snap.url;
    req.headers = std::move(headers);
    req.timeout = client_->config().timeout;

    auto result = client_->stream(req, onResponse, sink,
                                  [&rec] { return rec.control.load() != Control::None; });
    // The client only knows "stop waiting"; a pause must not end the task.
    if (!result.ok() && result.error() == ErrorCode::Cancelled &&
        rec.control.load() == Control::Pause)
        result = Error{ErrorCode::Paused, "paused while rate limited"};

    if (out.is_open()) {
        out.flush();
        const bool flushed = static_cast<bool>(out);
        out.close();
        if (result.ok() && !flushed) {
            result = Error{ErrorCode::FilesystemError,
                           "Flush of " + path.string() + " failed: " + std::strerror(errno)};
        }
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        rec.task.downloadedSize = downloaded;
    }

    if (!result.ok())
        return result.error();
    if (sinceUpdate > 0)
        publish(clock_t::now());

    if (total > 0 && downloaded < total) {
        return Error{ErrorCode::IncompleteTransfer,
                     "stream ended at " + std::to_string(downloaded) + " of " +
                         std::to_string(total) + " bytes"};
    }
    return Expected<void>{};
}

void DownloadEngine::finish(TaskRecord& rec, const Expected<void>& result) {
    DownloadTask copy;
    bool terminal = false;
    bool requeued = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& t = rec.task;
        t.speed = 0.0;
        t.eta.reset();

        if (result.ok()) {
            transitionLocked(rec, TaskStatus::Completed);
            if (t.totalSize == 0 || t.totalSize < t.downloadedSize)
                t.totalSize = t.downloadedSize;
            t.completedAt = std::chrono::system_clock::now();
            t.error.reset();
            terminal = true;
        } else if (result.error() == ErrorCode::Paused) {
            transitionLocked(rec, TaskStatus::Paused);
            if (rec.control.load() == Control::None && !shutdown_) {
                // resume() arrived after the worker had already stopped
                transitionLocked(rec, TaskStatus::Pending);
                queue_.add(t);
                wake_ = true;
                requeued = true;
            }
        } else if (result.error() == ErrorCode::Cancelled) {
            transitionLocked(rec, TaskStatus::Cancelled);
            t.completedAt = std::chrono::system_clock::now();
            terminal = true;
        } else {
            transitionLocked(rec, TaskStatus::Failed);
            t.error = describe(result.error());
            t.completedAt = std::chrono::system_clock::now();
            terminal = true;
        }
        copy = t;
    }

    if (terminal) {
        tracker_.publishCompletion(copy);
    } else {
        tracker_.publishProgress(copy);
    }

    switch (copy.status) {
        case TaskStatus::Completed:
            spdlog::info("{}: completed {} ({} bytes)", copy.id, copy.filePath,
                         copy.downloadedSize);
            break;
        case TaskStatus::Failed:
            spdlog::error("{}: failed: {}", copy.id, copy.error.value_or(""));
            break;
        case TaskStatus::Cancelled:
            spdlog::info("{}: cancelled at {} bytes", copy.id, copy.downloadedSize);
            break;
        default:
            spdlog::info("{}: {} at {} bytes{}", copy.id, toString(copy.status),
                         copy.downloadedSize, requeued ? " (re-queued)" : "");
            break;
    }
}

} // namespace civdl::downloader
