#include "core/primitive_adapters.hpp"
#include "core/store_errors.hpp"
#include <stdexcept>

std::shared_ptr<const BoolAdapter> BoolAdapter::instance()
{
    static const std::shared_ptr<const BoolAdapter> adapter = std::make_shared<BoolAdapter>();
    return adapter;
}

std::optional<bool> BoolAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    return store.getBool(key);
}

bool BoolAdapter::write(KeyValueStore &store, const std::string &key, const bool &value) const
{
    return store.setBool(key, value);
}

std::shared_ptr<const IntAdapter> IntAdapter::instance()
{
    static const std::shared_ptr<const IntAdapter> adapter = std::make_shared<IntAdapter>();
    return adapter;
}

std::optional<int64_t> IntAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    return store.getInt(key);
}

bool IntAdapter::write(KeyValueStore &store, const std::string &key, const int64_t &value) const
{
    return store.setInt(key, value);
}

std::shared_ptr<const DoubleAdapter> DoubleAdapter::instance()
{
    static const std::shared_ptr<const DoubleAdapter> adapter = std::make_shared<DoubleAdapter>();
    return adapter;
}

std::optional<double> DoubleAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    return store.getDouble(key);
}

bool DoubleAdapter::write(KeyValueStore &store, const std::string &key, const double &value) const
{
    return store.setDouble(key, value);
}

std::shared_ptr<const StringAdapter> StringAdapter::instance()
{
    static const std::shared_ptr<const StringAdapter> adapter = std::make_shared<StringAdapter>();
    return adapter;
}

std::optional<std::string> StringAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    return store.getString(key);
}

bool StringAdapter::write(KeyValueStore &store, const std::string &key, const std::string &value) const
{
    return store.setString(key, value);
}

std::shared_ptr<const StringListAdapter> StringListAdapter::instance()
{
    static const std::shared_ptr<const StringListAdapter> adapter = std::make_shared<StringListAdapter>();
    return adapter;
}

std::optional<std::vector<std::string>> StringListAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    return store.getStringList(key);
}

bool StringListAdapter::write(KeyValueStore &store, const std::string &key, const std::vector<std::string> &values) const
{
    return store.setStringList(key, values);
}

std::shared_ptr<const DateTimeAdapter> DateTimeAdapter::instance()
{
    static const std::shared_ptr<const DateTimeAdapter> adapter = std::make_shared<DateTimeAdapter>();
    return adapter;
}

std::optional<DateTimeAdapter::TimePoint> DateTimeAdapter::read(const KeyValueStore &store, const std::string &key) const
{
    auto raw = store.getString(key);
    if (!raw)
        return std::nullopt;

    try
    {
        size_t consumed = 0;
        long long millis = std::stoll(*raw, &consumed);
        if (consumed != raw->size())
        {
            throw AdapterDecodeError(key, "trailing characters in timestamp '" + *raw + "'");
        }
        return TimePoint(std::chrono::milliseconds(millis));
    }
    catch (const std::invalid_argument &)
    {
        throw AdapterDecodeError(key, "timestamp '" + *raw + "' is not a number");
    }
    catch (const std::out_of_range &)
    {
        throw AdapterDecodeError(key, "timestamp '" + *raw + "' is out of range");
    }
}

bool DateTimeAdapter::write(KeyValueStore &store, const std::string &key, const TimePoint &value) const
{
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    return store.setString(key, std::to_string(millis));
}

std::shared_ptr<const KeySetAdapter> KeySetAdapter::instance()
{
    static const std::shared_ptr<const KeySetAdapter> adapter = std::make_shared<KeySetAdapter>();
    return adapter;
}

std::optional<std::set<std::string>> KeySetAdapter::read(const KeyValueStore &store, const std::string &) const
{
    return store.getKeys();
}

bool KeySetAdapter::write(KeyValueStore &, const std::string &, const std::set<std::string> &) const
{
    throw PreconditionError("Writing the key set is not supported");
}
