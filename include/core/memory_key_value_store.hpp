#pragma once

#include "core/key_value_store.hpp"
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief In-process KeyValueStore backed by a map of typed primitives.
 *
 * Values keep the primitive type they were written with; reading a key with
 * a different getter yields std::nullopt.
 */
class MemoryKeyValueStore : public KeyValueStore
{
public:
    using Primitive = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

    MemoryKeyValueStore() = default;
    explicit MemoryKeyValueStore(std::map<std::string, Primitive> initial);
    ~MemoryKeyValueStore() override = default;

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
    template <typename T>
    std::optional<T> getAs(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        if (const T *value = std::get_if<T>(&it->second))
            return *value;
        return std::nullopt;
    }

    bool put(const std::string &key, Primitive value);

    mutable std::mutex mutex_;
    std::map<std::string, Primitive> entries_;
};
