#pragma once

#include "core/change_bus.hpp"
#include "core/key_value_store.hpp"
#include "core/store_errors.hpp"
#include "core/subscription.hpp"
#include "core/subscription_rate_guard.hpp"
#include "core/value_adapter.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

/**
 * @brief What makes two StoredValues "the same value": key, value type and
 * adapter encoding. Object identity plays no part.
 */
struct StoredValueIdentity
{
    std::optional<std::string> key;
    std::type_index type;
    std::string representation;

    bool operator==(const StoredValueIdentity &other) const
    {
        return key == other.key && type == other.type && representation == other.representation;
    }

    bool operator!=(const StoredValueIdentity &other) const { return !(*this == other); }
};

// Rate guard label used for the aggregate key view
inline const std::string kAggregateKeyLabel = "<all keys>";

/**
 * @brief Reactive handle on the value stored under one key.
 *
 * A StoredValue is a cheap, copyable handle. Reading is synchronous through
 * currentValue(). Every subscription first receives the current value, then a
 * freshly read value each time the key is published on the ChangeBus. When
 * nothing is stored, the default value stands in.
 *
 * A StoredValue without a key is the aggregate view: it follows every change
 * on the bus and cannot be written.
 */
template <typename T>
class StoredValue : public ValueStream<T>
{
public:
    StoredValue(std::shared_ptr<KeyValueStore> store,
                std::optional<std::string> key,
                T default_value,
                std::shared_ptr<const ValueAdapter<T>> adapter,
                std::shared_ptr<ChangeBus> bus)
        : store_(std::move(store)),
          key_(std::move(key)),
          default_value_(std::move(default_value)),
          adapter_(std::move(adapter)),
          bus_(std::move(bus))
    {
        if (!store_)
            throw PreconditionError("StoredValue requires a backing store");
        if (!adapter_)
            throw PreconditionError("StoredValue requires a value adapter");
        if (!bus_)
            throw PreconditionError("StoredValue requires a change bus");
        if (key_ && key_->empty())
            throw PreconditionError("StoredValue key must not be empty");
    }

    const std::optional<std::string> &key() const { return key_; }
    bool isAggregate() const { return !key_.has_value(); }
    const T &defaultValue() const { return default_value_; }

    StoredValueIdentity identity() const
    {
        return StoredValueIdentity{key_, std::type_index(typeid(T)), adapter_->representation()};
    }

    bool operator==(const StoredValue &other) const { return identity() == other.identity(); }
    bool operator!=(const StoredValue &other) const { return !(*this == other); }

    /**
     * @brief Read the stored value synchronously
     * @return the stored value, or the default value when nothing is stored
     * @throws AdapterDecodeError if the stored primitive cannot be decoded
     */
    T currentValue() const override
    {
        return readValue(*store_, key_, default_value_, *adapter_);
    }

    /**
     * @brief Emit the current value, then a re-read value on every change
     * @param observer receives values, read errors, and completion when the
     * bus closes
     */
    std::shared_ptr<Subscription> subscribe(StreamObserver<T> observer) const override
    {
        SubscriptionRateGuard::getInstance().recordSubscription(key_ ? *key_ : kAggregateKeyLabel);

        auto shared_observer = std::make_shared<StreamObserver<T>>(std::move(observer));
        emitCurrent(*store_, key_, default_value_, *adapter_, *shared_observer);

        // The listener holds everything it needs except the bus itself
        ChangeBus::Listener listener;
        listener.on_change = [store = store_, key = key_, default_value = default_value_, adapter = adapter_,
                              shared_observer](const std::string &changed_key)
        {
            if (key && changed_key != *key)
                return;
            emitCurrent(*store, key, default_value, *adapter, *shared_observer);
        };
        listener.on_close = [shared_observer]()
        {
            shared_observer->done();
        };
        return bus_->listen(std::move(listener));
    }

    std::shared_ptr<Subscription> subscribe(std::function<void(const T &)> on_next) const
    {
        StreamObserver<T> observer;
        observer.on_next = std::move(on_next);
        return subscribe(std::move(observer));
    }

    /**
     * @brief Store value and notify every subscriber of this key
     * @return false if the store rejected the write; nothing is published then
     * @throws PreconditionError on the aggregate view
     */
    bool set(const T &value) const
    {
        if (!key_)
            throw PreconditionError("set() is not supported on the aggregate key view");

        bool success = adapter_->write(*store_, *key_, value);
        if (!success)
        {
            Logger::warn("StoredValue: store rejected write for key " + *key_);
            return false;
        }
        bus_->publish(*key_);
        return true;
    }

    /**
     * @brief Remove the stored value; subscribers fall back to the default
     * @throws PreconditionError on the aggregate view
     */
    bool clear() const
    {
        if (!key_)
            throw PreconditionError("clear() is not supported on the aggregate key view");

        bool success = store_->remove(*key_);
        if (!success)
        {
            Logger::warn("StoredValue: store failed to remove key " + *key_);
            return false;
        }
        bus_->publish(*key_);
        return true;
    }

private:
    static T readValue(const KeyValueStore &store,
                       const std::optional<std::string> &key,
                       const T &default_value,
                       const ValueAdapter<T> &adapter)
    {
        std::optional<T> stored = adapter.read(store, key ? *key : std::string());
        if (stored)
            return std::move(*stored);
        return default_value;
    }

    static void emitCurrent(const KeyValueStore &store,
                            const std::optional<std::string> &key,
                            const T &default_value,
                            const ValueAdapter<T> &adapter,
                            const StreamObserver<T> &observer)
    {
        std::optional<T> value;
        try
        {
            value = readValue(store, key, default_value, adapter);
        }
        catch (const std::exception &)
        {
            observer.error(std::current_exception());
            return;
        }
        observer.next(*value);
    }

    std::shared_ptr<KeyValueStore> store_;
    std::optional<std::string> key_;
    T default_value_;
    std::shared_ptr<const ValueAdapter<T>> adapter_;
    std::shared_ptr<ChangeBus> bus_;
};
