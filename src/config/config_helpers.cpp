#include <civdl/config/config_helpers.h>
#include <civdl/core/string_utils.h>

#include <cstdlib>
#include <fstream>

namespace civdl::config {

std::string unquote(std::string_view raw) {
    std::string val = trim(raw);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

namespace {

// Drops a trailing '#' comment that is not inside quotes.
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return trim(std::string_view(v).substr(0, i));
        }
    }
    return v;
}

} // namespace

Expected<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FilesystemError,
                     "Cannot open config file " + config_path.string()};
    }

    std::map<std::string, std::string> values;
    std::string raw;
    std::string section;
    int lineNo = 0;

    while (std::getline(file, raw)) {
        ++lineNo;
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             config_path.string() + ":" + std::to_string(lineNo) +
                                 ": unterminated section header"};
            }
            section = trim(std::string_view(line).substr(1, end - 1));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": expected key = value"};
        }
        std::string k = trim(std::string_view(line).substr(0, eq));
        std::string v = strip_inline_comment(trim(std::string_view(line).substr(eq + 1)));
        values[section.empty() ? k : section + "." + k] = unquote(v);
    }

    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return expand_tilde(override_path);

    if (const char* env = std::getenv("CIVDL_CONFIG"); env && *env)
        return expand_tilde(env);

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "civdl" / "config.toml";
    }

    return configHome / "civdl" / "config.toml";
}

} // namespace civdl::config
