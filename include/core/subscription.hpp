#pragma once

#include "core/store_errors.hpp"
#include "logging/logger.hpp"
#include <exception>
#include <functional>
#include <memory>

/**
 * @brief Handle to a live stream subscription.
 *
 * Cancelling is final and idempotent. Pausing drops the events that arrive
 * while paused; nothing is buffered for resume().
 */
class Subscription
{
public:
    virtual ~Subscription() = default;

    virtual void cancel() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;

    virtual bool isPaused() const = 0;
    virtual bool isCancelled() const = 0;
};

/**
 * @brief Callbacks receiving the values, error and completion of a stream.
 *
 * Every callback is optional. An error without an on_error handler is logged.
 */
template <typename T>
struct StreamObserver
{
    std::function<void(const T &)> on_next;
    std::function<void(std::exception_ptr)> on_error;
    std::function<void()> on_done;

    void next(const T &value) const
    {
        if (on_next)
            on_next(value);
    }

    void error(std::exception_ptr error) const
    {
        if (on_error)
        {
            on_error(error);
            return;
        }
        Logger::error("Unhandled stream error: " + describeException(error));
    }

    void done() const
    {
        if (on_done)
            on_done();
    }
};

/**
 * @brief A readable, subscribable stream of T.
 *
 * StoredValue and DistinctValues implement it; CombineLatest consumes it.
 */
template <typename T>
class ValueStream
{
public:
    virtual ~ValueStream() = default;

    virtual T currentValue() const = 0;
    virtual std::shared_ptr<Subscription> subscribe(StreamObserver<T> observer) const = 0;
};
