#include <gtest/gtest.h>

#include <civdl/config/config_helpers.h>
#include <civdl/config/settings.h>

#include "../../common/temp_dir.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace civdl;
using namespace civdl::config;
using namespace std::chrono_literals;
using civdl::test::TempDir;

namespace {

// Sets (or unsets, for nullopt) an environment variable for the scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, std::optional<std::string> value) : name_(name) {
        if (const char* old = std::getenv(name))
            previous_ = old;
        if (value)
            ::setenv(name, value->c_str(), 1);
        else
            ::unsetenv(name);
    }
    ~ScopedEnv() {
        if (previous_)
            ::setenv(name_, previous_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

std::filesystem::path writeConfig(const TempDir& dir, const std::string& text) {
    auto p = dir.path() / "config.toml";
    std::ofstream(p) << text;
    return p;
}

} // namespace

TEST(ConfigParseTest, SectionsCommentsAndQuotes) {
    TempDir dir;
    auto path = writeConfig(dir, R"(# civdl settings
top = 1

[api]
base_url = "https://mirror.test/api/v1"   # trailing comment
api_key = 'abc#def'

[download]
  output_dir = ~/models
max_workers=5
)");

    auto parsed = parse_config_file(path);
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    const auto& v = parsed.value();
    EXPECT_EQ(v.at("top"), "1");
    EXPECT_EQ(v.at("api.base_url"), "https://mirror.test/api/v1");
    EXPECT_EQ(v.at("api.api_key"), "abc#def");
    EXPECT_EQ(v.at("download.output_dir"), "~/models");
    EXPECT_EQ(v.at("download.max_workers"), "5");
}

TEST(ConfigParseTest, MalformedLineReportsLocation) {
    TempDir dir;
    auto path = writeConfig(dir, "[api]\nbase_url = x\njust some words\n");

    auto parsed = parse_config_file(path);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(parsed.error().message.find(":3:"), std::string::npos);
}

TEST(ConfigParseTest, MissingFileIsFilesystemError) {
    TempDir dir;
    auto parsed = parse_config_file(dir.path() / "nope.toml");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, ErrorCode::FilesystemError);
}

TEST(ConfigPathTest, Precedence) {
    ScopedEnv home("HOME", "/home/tester");
    ScopedEnv xdg("XDG_CONFIG_HOME", std::nullopt);
    ScopedEnv explicitPath("CIVDL_CONFIG", std::nullopt);

    EXPECT_EQ(get_config_path(), std::filesystem::path("/home/tester/.config/civdl/config.toml"));
    {
        ScopedEnv x("XDG_CONFIG_HOME", "/xdg");
        EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/civdl/config.toml"));
        ScopedEnv c("CIVDL_CONFIG", "~/custom.toml");
        EXPECT_EQ(get_config_path(), std::filesystem::path("/home/tester/custom.toml"));
        EXPECT_EQ(get_config_path("/etc/civdl.toml"), std::filesystem::path("/etc/civdl.toml"));
    }
}

TEST(SettingsTest, MissingFileYieldsDefaults) {
    TempDir dir;
    ScopedEnv key("CIVITAI_API_KEY", std::nullopt);

    auto s = load_settings(dir.path() / "absent.toml");
    ASSERT_TRUE(s.ok()) << s.error().message;
    EXPECT_EQ(s.value().api.baseUrl, "https://civitai.com/api/v1");
    EXPECT_FALSE(s.value().api.apiKey.has_value());
    EXPECT_EQ(s.value().api.minRequestInterval, 1000ms);
    EXPECT_EQ(s.value().download.maxWorkers, 3u);
    EXPECT_EQ(s.value().download.chunkSize, 8192u);
    EXPECT_EQ(s.value().download.retryTimes, 3);
    EXPECT_EQ(s.value().logLevel, "info");
}

TEST(SettingsTest, ReadsEveryKnownKey) {
    TempDir dir;
    ScopedEnv key("CIVITAI_API_KEY", std::nullopt);
    auto path = writeConfig(dir, R"(
[api]
base_url = https://mirror.test/api/v1
api_key = from-file
timeout_ms = 15000
min_request_interval_ms = 250
throttle_delay_ms = 2000
max_throttle_retries = 2
verify_tls = false

[download]
output_dir = /data/models
max_workers = 6
chunk_size = 65536
retry_times = 4
retry_delay_ms = 100
max_retry_delay_ms = 800
progress_interval_ms = 250

[logging]
level = debug
)");

    auto s = load_settings(path);
    ASSERT_TRUE(s.ok()) << s.error().message;
    const auto& st = s.value();
    EXPECT_EQ(st.api.baseUrl, "https://mirror.test/api/v1");
    EXPECT_EQ(st.api.apiKey.value_or(""), "from-file");
    EXPECT_EQ(st.api.timeout, 15000ms);
    EXPECT_EQ(st.api.minRequestInterval, 250ms);
    EXPECT_EQ(st.api.throttleDelay, 2000ms);
    EXPECT_EQ(st.api.maxThrottleRetries, 2);
    EXPECT_FALSE(st.api.verifyTls);
    EXPECT_EQ(st.download.outputDir, "/data/models");
    EXPECT_EQ(st.download.maxWorkers, 6u);
    EXPECT_EQ(st.download.chunkSize, 65536u);
    EXPECT_EQ(st.download.retryTimes, 4);
    EXPECT_EQ(st.download.retryDelay, 100ms);
    EXPECT_EQ(st.download.maxRetryDelay, 800ms);
    EXPECT_EQ(st.download.progressInterval, 250ms);
    EXPECT_EQ(st.logLevel, "debug");
}

TEST(SettingsTest, EnvironmentApiKeyOverridesFile) {
    TempDir dir;
    ScopedEnv key("CIVITAI_API_KEY", "from-env");
    auto path = writeConfig(dir, "[api]\napi_key = from-file\n");

    auto s = load_settings(path);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().api.apiKey.value_or(""), "from-env");
}

TEST(SettingsTest, RejectsBadValues) {
    for (const auto& [key, value] : std::vector<std::pair<std::string, std::string>>{
             {"download.max_workers", "many"},
             {"download.max_workers", "0"},
             {"download.chunk_size", "-4"},
             {"download.retry_times", "2x"},
             {"api.verify_tls", "maybe"},
         }) {
        auto s = settings_from_values({{key, value}});
        ASSERT_FALSE(s.ok()) << key << "=" << value;
        EXPECT_EQ(s.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(SettingsTest, ExpandsTildeInOutputDir) {
    ScopedEnv home("HOME", "/home/tester");
    auto s = settings_from_values({{"download.output_dir", "~/models"}});
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().download.outputDir, "/home/tester/models");
}

TEST(LoggingTest, ConfigureLoggingLevels) {
    const auto before = spdlog::get_level();
    EXPECT_TRUE(configure_logging("DEBUG"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(configure_logging("warn"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_FALSE(configure_logging("loud"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    spdlog::set_level(before);
}
