#pragma once

#include <yaml-cpp/yaml.h>
#include <chrono>
#include <string>

/**
 * @brief Process-level settings for the streaming store
 *
 * Loaded from YAML:
 *
 *   log_level: INFO
 *   storage:
 *     path: store.json
 *     autosave: true
 *   watcher:
 *     enabled: false
 *     interval_ms: 1000
 *   rate_guard:
 *     enabled: true
 *     window_ms: 750
 */
struct StoreSettings
{
    std::string log_level = "INFO";

    // Empty path keeps the store in memory
    std::string storage_path;
    bool storage_autosave = true;

    bool watcher_enabled = false;
    std::chrono::milliseconds watcher_interval{1000};

#ifdef NDEBUG
    bool rate_guard_enabled = false;
#else
    bool rate_guard_enabled = true;
#endif
    std::chrono::milliseconds rate_guard_window{750};
};

// Parses a YAML node; absent fields keep their defaults.
// Throws YAML::Exception on malformed values.
StoreSettings parseStoreSettings(const YAML::Node &node);

bool validateStoreSettings(const StoreSettings &settings);

// Returns defaults when the file is missing, unreadable or invalid.
StoreSettings loadStoreSettings(const std::string &file_path);

YAML::Node toYaml(const StoreSettings &settings);
