#include "core/memory_key_value_store.hpp"
#include "logging/logger.hpp"

MemoryKeyValueStore::MemoryKeyValueStore(std::map<std::string, Primitive> initial)
    : entries_(std::move(initial))
{
}

std::set<std::string> MemoryKeyValueStore::getKeys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> keys;
    for (const auto &entry : entries_)
    {
        keys.insert(entry.first);
    }
    return keys;
}

std::optional<bool> MemoryKeyValueStore::getBool(const std::string &key) const
{
    return getAs<bool>(key);
}

std::optional<int64_t> MemoryKeyValueStore::getInt(const std::string &key) const
{
    return getAs<int64_t>(key);
}

std::optional<double> MemoryKeyValueStore::getDouble(const std::string &key) const
{
    return getAs<double>(key);
}

std::optional<std::string> MemoryKeyValueStore::getString(const std::string &key) const
{
    return getAs<std::string>(key);
}

std::optional<std::vector<std::string>> MemoryKeyValueStore::getStringList(const std::string &key) const
{
    return getAs<std::vector<std::string>>(key);
}

bool MemoryKeyValueStore::setBool(const std::string &key, bool value)
{
    return put(key, value);
}

bool MemoryKeyValueStore::setInt(const std::string &key, int64_t value)
{
    return put(key, value);
}

bool MemoryKeyValueStore::setDouble(const std::string &key, double value)
{
    return put(key, value);
}

bool MemoryKeyValueStore::setString(const std::string &key, const std::string &value)
{
    return put(key, value);
}

bool MemoryKeyValueStore::setStringList(const std::string &key, const std::vector<std::string> &values)
{
    return put(key, values);
}

bool MemoryKeyValueStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    return true;
}

bool MemoryKeyValueStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    Logger::debug("MemoryKeyValueStore: clearing " + std::to_string(entries_.size()) + " entries");
    entries_.clear();
    return true;
}

bool MemoryKeyValueStore::put(const std::string &key, Primitive value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(value);
    return true;
}
