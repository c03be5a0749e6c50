#include "core/log_level_binding.hpp"
#include "core/distinct_values.hpp"
#include "logging/logger.hpp"

LogLevelBinding::LogLevelBinding(const StreamingKeyValueStore &store,
                                 const std::string &key,
                                 const std::string &default_level)
{
    auto level = store.getString(key, default_level);

    // The distinct stream is seeded with this read, so the initial level is applied here
    auto initial = level.currentValue();
    onLevelChange(initial);

    StreamObserver<std::string> observer;
    observer.on_next = [this](const std::string &new_level)
    {
        onLevelChange(new_level);
    };
    observer.on_error = [key](std::exception_ptr error)
    {
        Logger::error("LogLevelBinding: error reading " + key + ": " + describeException(error));
    };
    subscription_ = distinct(level).subscribe(std::move(observer), initial);
}

LogLevelBinding::~LogLevelBinding()
{
    if (subscription_)
    {
        subscription_->cancel();
    }
}

std::string LogLevelBinding::appliedLevel() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_level_;
}

void LogLevelBinding::onLevelChange(const std::string &level)
{
    if (!Logger::isValidLevel(level))
    {
        Logger::warn("LogLevelBinding: ignoring invalid log level: " + level);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (applied_level_ == level)
            return;
        applied_level_ = level;
    }

    Logger::info("LogLevelBinding: log level configuration change detected to: " + level);
    Logger::setLevel(level);
}
