#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Synchronous, typed key-value storage contract.
 *
 * Getters return std::nullopt when no value of the requested type is stored
 * under the key; they never throw for a missing key. Mutations report their
 * outcome as a boolean and do not throw for I/O failures.
 */
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    // All keys that currently hold a value (possibly empty)
    virtual std::set<std::string> getKeys() const = 0;

    // Typed getters
    virtual std::optional<bool> getBool(const std::string &key) const = 0;
    virtual std::optional<int64_t> getInt(const std::string &key) const = 0;
    virtual std::optional<double> getDouble(const std::string &key) const = 0;
    virtual std::optional<std::string> getString(const std::string &key) const = 0;
    virtual std::optional<std::vector<std::string>> getStringList(const std::string &key) const = 0;

    // Typed setters
    virtual bool setBool(const std::string &key, bool value) = 0;
    virtual bool setInt(const std::string &key, int64_t value) = 0;
    virtual bool setDouble(const std::string &key, double value) = 0;
    virtual bool setString(const std::string &key, const std::string &value) = 0;
    virtual bool setStringList(const std::string &key, const std::vector<std::string> &values) = 0;

    // Removal
    virtual bool remove(const std::string &key) = 0;
    virtual bool clear() = 0;
};
