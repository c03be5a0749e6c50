#pragma once

#include "core/streaming_key_value_store.hpp"
#include "core/subscription.hpp"
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Keeps the logger level in sync with a string value in the store
 */
class LogLevelBinding
{
public:
    explicit LogLevelBinding(const StreamingKeyValueStore &store,
                             const std::string &key = "log_level",
                             const std::string &default_level = "INFO");
    ~LogLevelBinding();

    LogLevelBinding(const LogLevelBinding &) = delete;
    LogLevelBinding &operator=(const LogLevelBinding &) = delete;

    // Level most recently applied to the logger
    std::string appliedLevel() const;

private:
    /**
     * @brief Apply a level read from the store
     * @param level New level name; unknown names are rejected and the
     * current level is kept
     */
    void onLevelChange(const std::string &level);

    mutable std::mutex mutex_;
    std::string applied_level_;
    std::shared_ptr<Subscription> subscription_;
};
