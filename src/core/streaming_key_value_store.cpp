#include "core/streaming_key_value_store.hpp"
#include "logging/logger.hpp"

StreamingKeyValueStore::StreamingKeyValueStore(std::shared_ptr<KeyValueStore> store)
    : store_(std::move(store)), bus_(std::make_shared<ChangeBus>())
{
    if (!store_)
        throw PreconditionError("StreamingKeyValueStore requires a backing store");
}

StreamingKeyValueStore::~StreamingKeyValueStore()
{
    bus_->close();
}

StoredValue<std::set<std::string>> StreamingKeyValueStore::getKeys() const
{
    return StoredValue<std::set<std::string>>(store_, std::nullopt, std::set<std::string>(),
                                              KeySetAdapter::instance(), bus_);
}

StoredValue<bool> StreamingKeyValueStore::getBool(const std::string &key, bool defaults_to) const
{
    return getCustomValue<bool>(key, defaults_to, BoolAdapter::instance());
}

StoredValue<int64_t> StreamingKeyValueStore::getInt(const std::string &key, int64_t defaults_to) const
{
    return getCustomValue<int64_t>(key, defaults_to, IntAdapter::instance());
}

StoredValue<double> StreamingKeyValueStore::getDouble(const std::string &key, double defaults_to) const
{
    return getCustomValue<double>(key, defaults_to, DoubleAdapter::instance());
}

StoredValue<std::string> StreamingKeyValueStore::getString(const std::string &key, const std::string &defaults_to) const
{
    return getCustomValue<std::string>(key, defaults_to, StringAdapter::instance());
}

StoredValue<std::vector<std::string>> StreamingKeyValueStore::getStringList(
    const std::string &key, const std::vector<std::string> &defaults_to) const
{
    return getCustomValue<std::vector<std::string>>(key, defaults_to, StringListAdapter::instance());
}

bool StreamingKeyValueStore::setBool(const std::string &key, bool value)
{
    return setCustomValue<bool>(key, value, BoolAdapter::instance());
}

bool StreamingKeyValueStore::setInt(const std::string &key, int64_t value)
{
    return setCustomValue<int64_t>(key, value, IntAdapter::instance());
}

bool StreamingKeyValueStore::setDouble(const std::string &key, double value)
{
    return setCustomValue<double>(key, value, DoubleAdapter::instance());
}

bool StreamingKeyValueStore::setString(const std::string &key, const std::string &value)
{
    return setCustomValue<std::string>(key, value, StringAdapter::instance());
}

bool StreamingKeyValueStore::setStringList(const std::string &key, const std::vector<std::string> &values)
{
    return setCustomValue<std::vector<std::string>>(key, values, StringListAdapter::instance());
}

bool StreamingKeyValueStore::remove(const std::string &key)
{
    requireKey(key);
    return publishIfSuccessful(key, store_->remove(key));
}

bool StreamingKeyValueStore::clear()
{
    // Captured first: after clear() the store has no keys left to report
    const std::set<std::string> keys = store_->getKeys();
    if (!store_->clear())
    {
        Logger::warn("StreamingKeyValueStore: backing store failed to clear");
        return false;
    }

    Logger::debug("StreamingKeyValueStore: cleared " + std::to_string(keys.size()) + " keys");
    for (const auto &key : keys)
    {
        bus_->publish(key);
    }
    return true;
}

void StreamingKeyValueStore::notifyExternalChange(const std::vector<std::string> &keys)
{
    for (const auto &key : keys)
    {
        if (key.empty())
        {
            Logger::warn("StreamingKeyValueStore: ignoring empty key in external change");
            continue;
        }
        bus_->publish(key);
    }
}

void StreamingKeyValueStore::close()
{
    bus_->close();
}

void StreamingKeyValueStore::requireKey(const std::string &key)
{
    if (key.empty())
        throw PreconditionError("Key must not be empty");
}

bool StreamingKeyValueStore::publishIfSuccessful(const std::string &key, bool success)
{
    if (!success)
    {
        Logger::warn("StreamingKeyValueStore: backing store rejected change to key " + key);
        return false;
    }
    bus_->publish(key);
    return true;
}
