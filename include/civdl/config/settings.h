#pragma once

#include <civdl/api/rate_limited_client.h>
#include <civdl/core/types.h>
#include <civdl/downloader/download_engine.h>

#include <filesystem>
#include <map>
#include <string>

namespace civdl::config {

struct Settings {
    api::ClientConfig api;
    downloader::DownloaderConfig download;
    std::string logLevel{"info"};
};

// Builds Settings from "section.key" values; missing keys keep their defaults.
Expected<Settings> settings_from_values(const std::map<std::string, std::string>& values);

/**
 * Loads settings from path (or get_config_path() when empty). A missing file
 * yields defaults. CIVITAI_API_KEY, when set, overrides api.api_key.
 * Unparsable numbers or booleans are reported as InvalidArgument.
 */
Expected<Settings> load_settings(const std::filesystem::path& path = {});

// trace|debug|info|warn|error|critical|off (case-insensitive) onto the default
// spdlog logger. Returns false, and leaves the level alone, for anything else.
bool configure_logging(const std::string& level);

} // namespace civdl::config
