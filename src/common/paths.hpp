#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

#ifndef CALMROOM_DATADIR
#define CALMROOM_DATADIR "/usr/share"
#endif

namespace calmroom {
namespace paths {

inline constexpr const char *kAppName = "calmroom";

namespace detail {

// $<xdg_var>/calmroom, else $HOME/<home_suffix>/calmroom, else ./<fallback>
inline std::string xdg_app_dir(const char* xdg_var, const char* home_suffix,
                               const char* fallback) {
    const char* xdg = getenv(xdg_var);
    if (xdg && *xdg) {
        return std::string(xdg) + "/" + kAppName;
    }
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/" + home_suffix + "/" + kAppName;
    }
    return std::string("./") + fallback;
}

} // namespace detail

inline std::string get_config_dir() {
    return detail::xdg_app_dir("XDG_CONFIG_HOME", ".config", "config");
}

inline std::string get_data_dir() {
    return detail::xdg_app_dir("XDG_DATA_HOME", ".local/share", "data");
}

inline std::string get_cache_dir() {
    return detail::xdg_app_dir("XDG_CACHE_HOME", ".cache", "cache");
}

// Read-only location of the tracks shipped with the application
inline std::string get_system_music_dir() {
    return std::string(CALMROOM_DATADIR) + "/" + kAppName + "/music";
}

// Search order for music: bundled, user data, user config
inline std::vector<std::filesystem::path> get_music_dirs() {
    return {
        get_system_music_dir(),
        get_data_dir() + "/music",
        get_config_dir() + "/music",
    };
}

inline std::string get_settings_path() {
    return get_config_dir() + "/settings.json";
}

inline std::string get_sessions_path() {
    return get_config_dir() + "/sessions.json";
}

inline std::string get_export_dir() {
    return get_data_dir() + "/exports";
}

// Ensure directory exists
inline void ensure_directory_exists(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    // Failure shows up later when the caller opens a file there
}

// Locate an executable on PATH, empty when missing
inline std::string find_executable(const std::string& name) {
    const char* path_env = getenv("PATH");
    if (!path_env) {
        return "";
    }
    std::string path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) {
            end = path_list.size();
        }
        std::string dir = path_list.substr(start, end - start);
        if (!dir.empty()) {
            std::filesystem::path candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate.string();
            }
        }
        start = end + 1;
    }
    return "";
}

} // namespace paths
} // namespace calmroom
