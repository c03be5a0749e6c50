#pragma once

#include "core/value_adapter.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

class BoolAdapter : public ValueAdapter<bool>
{
public:
    static std::shared_ptr<const BoolAdapter> instance();

    std::optional<bool> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const bool &value) const override;
    std::string representation() const override { return "bool"; }
};

class IntAdapter : public ValueAdapter<int64_t>
{
public:
    static std::shared_ptr<const IntAdapter> instance();

    std::optional<int64_t> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const int64_t &value) const override;
    std::string representation() const override { return "int"; }
};

class DoubleAdapter : public ValueAdapter<double>
{
public:
    static std::shared_ptr<const DoubleAdapter> instance();

    std::optional<double> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const double &value) const override;
    std::string representation() const override { return "double"; }
};

class StringAdapter : public ValueAdapter<std::string>
{
public:
    static std::shared_ptr<const StringAdapter> instance();

    std::optional<std::string> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const std::string &value) const override;
    std::string representation() const override { return "string"; }
};

class StringListAdapter : public ValueAdapter<std::vector<std::string>>
{
public:
    static std::shared_ptr<const StringListAdapter> instance();

    std::optional<std::vector<std::string>> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const std::vector<std::string> &values) const override;
    std::string representation() const override { return "string_list"; }
};

/**
 * @brief Stores a point in time as a string of UTC milliseconds since epoch.
 */
class DateTimeAdapter : public ValueAdapter<std::chrono::system_clock::time_point>
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static std::shared_ptr<const DateTimeAdapter> instance();

    std::optional<TimePoint> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const TimePoint &value) const override;
    std::string representation() const override { return "datetime_ms"; }
};

/**
 * @brief Reads the set of all keys currently held by the store.
 *
 * Used by the aggregate key view; writing through it is a precondition
 * violation.
 */
class KeySetAdapter : public ValueAdapter<std::set<std::string>>
{
public:
    static std::shared_ptr<const KeySetAdapter> instance();

    std::optional<std::set<std::string>> read(const KeyValueStore &store, const std::string &key) const override;
    bool write(KeyValueStore &store, const std::string &key, const std::set<std::string> &value) const override;
    std::string representation() const override { return "key_set"; }
};
