#pragma once

#include "core/key_value_store.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief KeyValueStore persisted as a JSON document through Poco.
 *
 * Keys are JSON members; a '.' in a key is a path separator, so "a.b" lives
 * under {"a": {"b": ...}}. Keys with an empty segment are rejected, and a
 * key that holds nested keys cannot be overwritten or removed as a whole.
 * String lists are stored as JSON arrays.
 * Reads are typed: a value written with a different setter reads as absent.
 *
 * When bound to a file with autosave on, every mutation is written through
 * and reports the outcome of the save. A failed save leaves the store
 * unchanged.
 */
class PocoKeyValueStore : public KeyValueStore
{
public:
    PocoKeyValueStore();
    explicit PocoKeyValueStore(const std::string &path, bool autosave = true);
    ~PocoKeyValueStore() override = default;

    PocoKeyValueStore(const PocoKeyValueStore &) = delete;
    PocoKeyValueStore &operator=(const PocoKeyValueStore &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    bool reload();
    nlohmann::json getAll() const;

    const std::string &path() const { return path_; }
    bool autosave() const { return autosave_; }

    std::set<std::string> getKeys() const override;

    std::optional<bool> getBool(const std::string &key) const override;
    std::optional<int64_t> getInt(const std::string &key) const override;
    std::optional<double> getDouble(const std::string &key) const override;
    std::optional<std::string> getString(const std::string &key) const override;
    std::optional<std::vector<std::string>> getStringList(const std::string &key) const override;

    bool setBool(const std::string &key, bool value) override;
    bool setInt(const std::string &key, int64_t value) override;
    bool setDouble(const std::string &key, double value) override;
    bool setString(const std::string &key, const std::string &value) override;
    bool setStringList(const std::string &key, const std::vector<std::string> &values) override;

    bool remove(const std::string &key) override;
    bool clear() override;

private:
    nlohmann::json documentLocked() const;
    std::optional<nlohmann::json> findLocked(const std::string &key) const;
    bool saveLocked(const std::string &path) const;
    static bool writeConfig(const Poco::Util::JSONConfiguration &cfg, const std::string &path);

    // Builds the candidate config and saves it when autosave applies; cfg_ is
    // replaced only if both succeed
    bool commitLocked(const nlohmann::json &document);
    bool writeLocked(const std::string &key, nlohmann::json value);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
    std::string path_;
    bool autosave_;
};
