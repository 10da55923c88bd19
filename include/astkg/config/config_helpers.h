#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace astkg::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Flat view of a TOML-style file: "section.key" -> raw (unquoted) value.
// Keys outside any section are stored without a prefix.
using ConfigMap = std::map<std::string, std::string>;

// Parse the whole file once. A missing or unreadable file yields an empty map.
ConfigMap parse_config_file(const std::filesystem::path& config_path);

// Accepts `a, b` or `["a", "b"]`
std::vector<std::string> parse_string_list(const std::string& raw);

std::optional<double> parse_double(std::string_view s);
std::optional<long long> parse_integer(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Explicit override, else $ASTKG_CONFIG, else $XDG_CONFIG_HOME/astkg/config.toml
// or ~/.config/astkg/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace astkg::config
