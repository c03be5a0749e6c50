#include <gtest/gtest.h>
#include "store_settings.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>

class StoreSettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
        test_settings_path_ = (std::filesystem::temp_directory_path() / "streaming_store_settings.yaml").string();
    }

    void TearDown() override
    {
        if (std::filesystem::exists(test_settings_path_))
        {
            std::filesystem::remove(test_settings_path_);
        }
    }

    void writeSettings(const std::string &content)
    {
        std::ofstream out(test_settings_path_);
        out << content;
    }

    std::string test_settings_path_;
};

TEST_F(StoreSettingsTest, LoadsEveryField)
{
    writeSettings(R"(
log_level: DEBUG
storage:
  path: /tmp/store.json
  autosave: false
watcher:
  enabled: true
  interval_ms: 250
rate_guard:
  enabled: false
  window_ms: 500
)");

    auto settings = loadStoreSettings(test_settings_path_);
    EXPECT_EQ(settings.log_level, "DEBUG");
    EXPECT_EQ(settings.storage_path, "/tmp/store.json");
    EXPECT_FALSE(settings.storage_autosave);
    EXPECT_TRUE(settings.watcher_enabled);
    EXPECT_EQ(settings.watcher_interval, std::chrono::milliseconds(250));
    EXPECT_FALSE(settings.rate_guard_enabled);
    EXPECT_EQ(settings.rate_guard_window, std::chrono::milliseconds(500));
}

TEST_F(StoreSettingsTest, MissingFieldsKeepDefaults)
{
    writeSettings("log_level: WARN\n");

    auto settings = loadStoreSettings(test_settings_path_);
    StoreSettings defaults;
    EXPECT_EQ(settings.log_level, "WARN");
    EXPECT_EQ(settings.storage_path, defaults.storage_path);
    EXPECT_EQ(settings.storage_autosave, defaults.storage_autosave);
    EXPECT_EQ(settings.rate_guard_window, std::chrono::milliseconds(750));
}

TEST_F(StoreSettingsTest, MissingFileFallsBackToDefaults)
{
    auto settings = loadStoreSettings("/nonexistent/settings.yaml");
    EXPECT_EQ(settings.log_level, "INFO");
    EXPECT_TRUE(settings.storage_path.empty());
}

TEST_F(StoreSettingsTest, InvalidValuesFallBackToDefaults)
{
    writeSettings("log_level: CHATTY\n");
    EXPECT_EQ(loadStoreSettings(test_settings_path_).log_level, "INFO");

    writeSettings("rate_guard:\n  window_ms: not-a-number\n");
    EXPECT_EQ(loadStoreSettings(test_settings_path_).rate_guard_window, std::chrono::milliseconds(750));

    writeSettings("watcher:\n  enabled: true\n");
    EXPECT_FALSE(loadStoreSettings(test_settings_path_).watcher_enabled);
}

TEST_F(StoreSettingsTest, Validation)
{
    StoreSettings settings;
    EXPECT_TRUE(validateStoreSettings(settings));

    settings.watcher_interval = std::chrono::milliseconds(0);
    EXPECT_FALSE(validateStoreSettings(settings));

    settings = StoreSettings{};
    settings.rate_guard_window = std::chrono::milliseconds(-1);
    EXPECT_FALSE(validateStoreSettings(settings));
}

TEST_F(StoreSettingsTest, YamlRoundTrip)
{
    StoreSettings settings;
    settings.log_level = "ERROR";
    settings.storage_path = "data.json";
    settings.watcher_interval = std::chrono::milliseconds(42);

    auto parsed = parseStoreSettings(toYaml(settings));
    EXPECT_EQ(parsed.log_level, "ERROR");
    EXPECT_EQ(parsed.storage_path, "data.json");
    EXPECT_EQ(parsed.watcher_interval, std::chrono::milliseconds(42));
}
