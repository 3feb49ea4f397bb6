#pragma once

#include <strata/storage/filesystem_context.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace strata::config {

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

// Tilde expansion for "~" and "~/..."; other forms are returned unchanged
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file. Accepts "[section] key = v" and "section.key = v".
// Returns "" when the file or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/strata or ~/.config/strata
std::filesystem::path get_config_dir();

// Get standard config path: override, then STRATA_CONFIG, then get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Settings resolved from config.toml and the environment
struct StrataConfig {
    std::filesystem::path configPath;
    // stores.yaml beside the config file unless [storage] registry says otherwise
    std::filesystem::path registryPath;
    storage::StorageOptions storage;
    // spdlog level name; STRATA_LOG_LEVEL wins over [logging] level
    std::string logLevel = "warn";
};

// A missing config file yields defaults
StrataConfig load_config(const std::string& override_path = "");

} // namespace strata::config
