#include "store_settings.hpp"
#include "logging/logger.hpp"
#include <filesystem>

StoreSettings parseStoreSettings(const YAML::Node &node)
{
    StoreSettings settings;
    if (!node || node.IsNull())
    {
        return settings;
    }

    if (node["log_level"])
        settings.log_level = node["log_level"].as<std::string>();

    if (const auto storage = node["storage"])
    {
        if (storage["path"])
            settings.storage_path = storage["path"].as<std::string>();
        if (storage["autosave"])
            settings.storage_autosave = storage["autosave"].as<bool>();
    }

    if (const auto watcher = node["watcher"])
    {
        if (watcher["enabled"])
            settings.watcher_enabled = watcher["enabled"].as<bool>();
        if (watcher["interval_ms"])
            settings.watcher_interval = std::chrono::milliseconds(watcher["interval_ms"].as<int64_t>());
    }

    if (const auto guard = node["rate_guard"])
    {
        if (guard["enabled"])
            settings.rate_guard_enabled = guard["enabled"].as<bool>();
        if (guard["window_ms"])
            settings.rate_guard_window = std::chrono::milliseconds(guard["window_ms"].as<int64_t>());
    }

    return settings;
}

bool validateStoreSettings(const StoreSettings &settings)
{
    if (!Logger::isValidLevel(settings.log_level))
    {
        Logger::error("Invalid log level: " + settings.log_level);
        return false;
    }

    if (settings.watcher_enabled && settings.storage_path.empty())
    {
        Logger::error("File watcher requires storage.path");
        return false;
    }

    if (settings.watcher_interval.count() <= 0)
    {
        Logger::error("Invalid watcher interval: " + std::to_string(settings.watcher_interval.count()));
        return false;
    }

    if (settings.rate_guard_window.count() <= 0)
    {
        Logger::error("Invalid rate guard window: " + std::to_string(settings.rate_guard_window.count()));
        return false;
    }

    return true;
}

StoreSettings loadStoreSettings(const std::string &file_path)
{
    if (!std::filesystem::exists(file_path))
    {
        Logger::error("Settings file not found: " + file_path + ", using defaults");
        return StoreSettings{};
    }

    try
    {
        auto settings = parseStoreSettings(YAML::LoadFile(file_path));
        if (validateStoreSettings(settings))
        {
            Logger::info("Settings loaded from: " + file_path);
            return settings;
        }
        Logger::error("Invalid settings in file: " + file_path + ", using defaults");
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Error loading settings: " + std::string(e.what()));
    }

    return StoreSettings{};
}

YAML::Node toYaml(const StoreSettings &settings)
{
    YAML::Node node;
    node["log_level"] = settings.log_level;
    node["storage"]["path"] = settings.storage_path;
    node["storage"]["autosave"] = settings.storage_autosave;
    node["watcher"]["enabled"] = settings.watcher_enabled;
    node["watcher"]["interval_ms"] = static_cast<int64_t>(settings.watcher_interval.count());
    node["rate_guard"]["enabled"] = settings.rate_guard_enabled;
    node["rate_guard"]["window_ms"] = static_cast<int64_t>(settings.rate_guard_window.count());
    return node;
}
