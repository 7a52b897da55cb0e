#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include "../core/config/settings.hpp"
#include "shell.hpp"

namespace calmroom {
namespace notifications {

// Global settings pointer - to be set by main()
inline const Settings* g_settings = nullptr;

// Until the UI is up, messages go to stderr instead of the desktop
inline bool g_desktop = false;

inline void init(const Settings* settings) {
    g_settings = settings;
    g_desktop = true;
}

inline void reset() {
    g_settings = nullptr;
    g_desktop = false;
}

inline void send(const std::string& message) {
    if (!g_desktop) {
        std::cerr << "[calmroom] " << message << std::endl;
        return;
    }

    if (g_settings != nullptr && !g_settings->get_notifications_enabled()) {
        return;
    }

    // notify-send is optional and may wait on D-Bus, so it never runs in
    // the foreground of the UI loop
    shell::run("notify-send \"Calming Room\" " + shell::quote(message) +
               " >/dev/null 2>&1 &");
}

inline void send_export_complete(const std::string& path) {
    send("Sessions exported: " + path);
}

inline void send_export_failed(const std::string& error) {
    send("Export failed: " + error);
}

inline void send_settings_failed(const std::string& error) {
    send("Could not save settings: " + error);
}

} // namespace notifications
} // namespace calmroom
