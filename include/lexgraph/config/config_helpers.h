#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace lexgraph::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    if (path.size() <= 2) {
        return std::filesystem::path(home);
    }
    return std::filesystem::path(home) / path.substr(2);
}

// Flattened view of a TOML-style file: "section.key" -> unquoted value.
using ConfigValues = std::map<std::string, std::string>;

// Parse every key of a TOML-style config file. Missing file yields an empty map.
ConfigValues parse_config_file(const std::filesystem::path& config_path);

// Get standard config path: override, then $LEXGRAPH_CONFIG, then
// $XDG_CONFIG_HOME/lexgraph/config.toml or ~/.config/lexgraph/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace lexgraph::config
