#include <civdl/config/config_helpers.h>
#include <civdl/config/settings.h>
#include <civdl/core/string_utils.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <type_traits>

namespace civdl::config {

namespace {

std::optional<spdlog::level::level_enum> parse_level(const std::string& s) {
    const std::string v = toLower(trim(s));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

class Reader {
public:
    explicit Reader(const std::map<std::string, std::string>& values) : values_(values) {}

    const std::string* find(const std::string& key) const {
        auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    template <typename T> Expected<void> integer(const std::string& key, T& out) const {
        const auto* raw = find(key);
        if (!raw)
            return Expected<void>{};
        T value{};
        const char* first = raw->data();
        const char* last = raw->data() + raw->size();
        auto res = std::from_chars(first, last, value);
        bool negative = false;
        if constexpr (std::is_signed_v<T>)
            negative = value < 0;
        if (res.ec != std::errc() || res.ptr != last || negative)
            return invalid(key, *raw, "a non-negative integer");
        out = value;
        return Expected<void>{};
    }

    Expected<void> millis(const std::string& key, std::chrono::milliseconds& out) const {
        long long ms = out.count();
        auto r = integer(key, ms);
        if (!r.ok())
            return r;
        out = std::chrono::milliseconds(ms);
        return Expected<void>{};
    }

    Expected<void> boolean(const std::string& key, bool& out) const {
        const auto* raw = find(key);
        if (!raw)
            return Expected<void>{};
        const auto v = toLower(*raw);
        if (v == "true" || v == "1" || v == "yes" || v == "on") {
            out = true;
        } else if (v == "false" || v == "0" || v == "no" || v == "off") {
            out = false;
        } else {
            return invalid(key, *raw, "a boolean");
        }
        return Expected<void>{};
    }

    void string(const std::string& key, std::string& out) const {
        if (const auto* raw = find(key))
            out = *raw;
    }

    void optional_string(const std::string& key, std::optional<std::string>& out) const {
        const auto* raw = find(key);
        if (!raw)
            return;
        if (raw->empty())
            out.reset();
        else
            out = *raw;
    }

private:
    static Error invalid(const std::string& key, const std::string& raw, const char* what) {
        return Error{ErrorCode::InvalidArgument,
                     "Config key '" + key + "' = '" + raw + "' is not " + what};
    }

    const std::map<std::string, std::string>& values_;
};

} // namespace

Expected<Settings> settings_from_values(const std::map<std::string, std::string>& values) {
    Settings s;
    Reader r(values);

    r.string("api.base_url", s.api.baseUrl);
    r.optional_string("api.api_key", s.api.apiKey);
    r.optional_string("api.proxy", s.api.proxy);
    r.string("api.user_agent", s.api.userAgent);

    r.string("download.output_dir", s.download.outputDir);
    if (!s.download.outputDir.empty())
        s.download.outputDir = expand_tilde(s.download.outputDir).string();

    r.string("logging.level", s.logLevel);

    for (auto check : {
             r.millis("api.timeout_ms", s.api.timeout),
             r.millis("api.min_request_interval_ms", s.api.minRequestInterval),
             r.millis("api.throttle_delay_ms", s.api.throttleDelay),
             r.integer("api.max_throttle_retries", s.api.maxThrottleRetries),
             r.boolean("api.verify_tls", s.api.verifyTls),
             r.integer("download.max_workers", s.download.maxWorkers),
             r.integer("download.chunk_size", s.download.chunkSize),
             r.integer("download.retry_times", s.download.retryTimes),
             r.millis("download.retry_delay_ms", s.download.retryDelay),
             r.millis("download.max_retry_delay_ms", s.download.maxRetryDelay),
             r.millis("download.progress_interval_ms", s.download.progressInterval),
             r.millis("download.scheduler_tick_ms", s.download.schedulerTick),
         }) {
        if (!check.ok())
            return check.error();
    }

    if (s.download.maxWorkers == 0)
        return Error{ErrorCode::InvalidArgument, "download.max_workers must be at least 1"};
    if (s.download.chunkSize == 0)
        return Error{ErrorCode::InvalidArgument, "download.chunk_size must be at least 1"};
    return s;
}

Expected<Settings> load_settings(const std::filesystem::path& path) {
    const auto configPath = path.empty() ? get_config_path() : path;

    std::map<std::string, std::string> values;
    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        auto parsed = parse_config_file(configPath);
        if (!parsed.ok())
            return parsed.error();
        values = std::move(parsed).value();
        spdlog::debug("Loaded {} config values from {}", values.size(), configPath.string());
    } else {
        spdlog::debug("No config file at {}; using defaults", configPath.string());
    }

    auto settings = settings_from_values(values);
    if (!settings.ok())
        return settings;

    if (const char* key = std::getenv("CIVITAI_API_KEY"); key && *key)
        settings.value().api.apiKey = std::string(key);
    return settings;
}

bool configure_logging(const std::string& level) {
    auto lvl = parse_level(level);
    if (!lvl) {
        spdlog::warn("Unknown log level '{}'; keeping {}", level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return false;
    }
    spdlog::set_level(*lvl);
    return true;
}

} // namespace civdl::config
