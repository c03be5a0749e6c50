#pragma once

#include "core/memory_key_value_store.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

/**
 * @brief In-memory store with injectable failures and call counters
 *
 * fail_writes makes every mutation report failure without changing state.
 * Keys in failing_reads throw std::runtime_error from every getter.
 * afterNextRead runs a one-shot action once a read of the key has returned
 * its value, standing in for a concurrent writer.
 */
class FakeKeyValueStore : public KeyValueStore
{
public:
    std::atomic<bool> fail_writes{false};

    void failReadsFor(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_reads_.insert(key);
    }

    void restoreReadsFor(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_reads_.erase(key);
    }

    void afterNextRead(const std::string &key, std::function<void()> action)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        after_read_[key] = std::move(action);
    }

    int readCount(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reads_.find(key);
        return it == reads_.end() ? 0 : it->second;
    }

    int writeCount() const { return writes_.load(); }

    std::set<std::string> getKeys() const override { return inner_.getKeys(); }

    std::optional<bool> getBool(const std::string &key) const override
    {
        checkRead(key);
        auto value = inner_.getBool(key);
        finishRead(key);
        return value;
    }

    std::optional<int64_t> getInt(const std::string &key) const override
    {
        checkRead(key);
        auto value = inner_.getInt(key);
        finishRead(key);
        return value;
    }

    std::optional<double> getDouble(const std::string &key) const override
    {
        checkRead(key);
        auto value = inner_.getDouble(key);
        finishRead(key);
        return value;
    }

    std::optional<std::string> getString(const std::string &key) const override
    {
        checkRead(key);
        auto value = inner_.getString(key);
        finishRead(key);
        return value;
    }

    std::optional<std::vector<std::string>> getStringList(const std::string &key) const override
    {
        checkRead(key);
        auto value = inner_.getStringList(key);
        finishRead(key);
        return value;
    }

    bool setBool(const std::string &key, bool value) override
    {
        return checkWrite() && inner_.setBool(key, value);
    }

    bool setInt(const std::string &key, int64_t value) override
    {
        return checkWrite() && inner_.setInt(key, value);
    }

    bool setDouble(const std::string &key, double value) override
    {
        return checkWrite() && inner_.setDouble(key, value);
    }

    bool setString(const std::string &key, const std::string &value) override
    {
        return checkWrite() && inner_.setString(key, value);
    }

    bool setStringList(const std::string &key, const std::vector<std::string> &values) override
    {
        return checkWrite() && inner_.setStringList(key, values);
    }

    bool remove(const std::string &key) override
    {
        return checkWrite() && inner_.remove(key);
    }

    bool clear() override
    {
        return checkWrite() && inner_.clear();
    }

private:
    void checkRead(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reads_[key];
        if (failing_reads_.count(key) > 0)
            throw std::runtime_error("read failed for " + key);
    }

    void finishRead(const std::string &key) const
    {
        std::function<void()> action;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = after_read_.find(key);
            if (it == after_read_.end())
                return;
            action = std::move(it->second);
            after_read_.erase(it);
        }
        action();
    }

    bool checkWrite()
    {
        ++writes_;
        return !fail_writes.load();
    }

    MemoryKeyValueStore inner_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, int> reads_;
    std::set<std::string> failing_reads_;
    mutable std::map<std::string, std::function<void()>> after_read_;
    std::atomic<int> writes_{0};
};
