#pragma once

#include "core/change_bus.hpp"
#include "core/key_value_store.hpp"
#include "core/primitive_adapters.hpp"
#include "core/store_errors.hpp"
#include "core/stored_value.hpp"
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Reactive layer over a KeyValueStore.
 *
 * Owns the ChangeBus of one store session. Every getXYZ() returns a
 * StoredValue that replays the current value and follows later changes;
 * every mutation made through this class (or through the StoredValues it
 * hands out) is published on the bus.
 *
 * Create one instance per backing store. Separate instances over the same
 * store do not see each other's changes; StoreSession provides the shared one.
 */
class StreamingKeyValueStore
{
public:
    explicit StreamingKeyValueStore(std::shared_ptr<KeyValueStore> store);
    ~StreamingKeyValueStore();

    StreamingKeyValueStore(const StreamingKeyValueStore &) = delete;
    StreamingKeyValueStore &operator=(const StreamingKeyValueStore &) = delete;

    // Aggregate view of every key currently holding a value
    StoredValue<std::set<std::string>> getKeys() const;

    // Typed views
    StoredValue<bool> getBool(const std::string &key, bool defaults_to) const;
    StoredValue<int64_t> getInt(const std::string &key, int64_t defaults_to) const;
    StoredValue<double> getDouble(const std::string &key, double defaults_to) const;
    StoredValue<std::string> getString(const std::string &key, const std::string &defaults_to) const;
    StoredValue<std::vector<std::string>> getStringList(const std::string &key,
                                                        const std::vector<std::string> &defaults_to) const;

    template <typename T>
    StoredValue<T> getCustomValue(const std::string &key,
                                  T defaults_to,
                                  std::shared_ptr<const ValueAdapter<T>> adapter) const
    {
        requireKey(key);
        return StoredValue<T>(store_, key, std::move(defaults_to), std::move(adapter), bus_);
    }

    // Typed setters; each publishes the key when the write succeeds
    bool setBool(const std::string &key, bool value);
    bool setInt(const std::string &key, int64_t value);
    bool setDouble(const std::string &key, double value);
    bool setString(const std::string &key, const std::string &value);
    bool setStringList(const std::string &key, const std::vector<std::string> &values);

    template <typename T>
    bool setCustomValue(const std::string &key, const T &value, std::shared_ptr<const ValueAdapter<T>> adapter)
    {
        requireKey(key);
        if (!adapter)
            throw PreconditionError("setCustomValue() requires a value adapter");
        return publishIfSuccessful(key, adapter->write(*store_, key, value));
    }

    /**
     * @brief Remove the value stored under key
     * @return true if the store removed it; subscribers then see their default
     */
    bool remove(const std::string &key);

    /**
     * @brief Remove every entry
     *
     * The key set is captured before clearing so that each previously
     * existing key can be published once the store has been cleared.
     */
    bool clear();

    // Publish keys modified behind this layer's back (e.g. a reloaded file)
    void notifyExternalChange(const std::vector<std::string> &keys);

    // Complete every subscription; later publications are dropped
    void close();

    std::shared_ptr<ChangeBus> changeBus() const { return bus_; }
    std::shared_ptr<KeyValueStore> backingStore() const { return store_; }

private:
    static void requireKey(const std::string &key);
    bool publishIfSuccessful(const std::string &key, bool success);

    std::shared_ptr<KeyValueStore> store_;
    std::shared_ptr<ChangeBus> bus_;
};
