#pragma once

#include <civdl/core/types.h>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace civdl::config {

// Strips one pair of matching single or double quotes after trimming.
std::string unquote(std::string_view val);

// "~/x" -> "$HOME/x"; anything else is returned unchanged.
std::filesystem::path expand_tilde(const std::string& path);

// Reads a TOML-subset file ([section] headers, key = value lines, '#'
// comments) into a flat map keyed "section.key". Keys before the first
// section header are stored without a prefix.
Expected<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path);

// Config file location: override_path, else $CIVDL_CONFIG, else
// $XDG_CONFIG_HOME/civdl/config.toml, else ~/.config/civdl/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace civdl::config
