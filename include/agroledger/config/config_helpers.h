#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace agroledger::config {

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

/// Non-empty environment value
inline std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v)
        return std::nullopt;
    return std::string(v);
}

// Parse a value from a TOML config file ("[section] key = value" or "section.key = value")
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

std::optional<int64_t> parse_config_int(const std::filesystem::path& config_path,
                                        const std::string& section, const std::string& key);

/// $AGROLEDGER_CONFIG, else $XDG_CONFIG_HOME/agroledger/config.toml or ~/.config/agroledger/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/agroledger or ~/.local/share/agroledger
std::filesystem::path get_data_dir();

} // namespace agroledger::config
