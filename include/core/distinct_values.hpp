#pragma once

#include "core/stored_value.hpp"
#include "core/subscription.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief Forwards a value only if it differs from the last value forwarded
 * to the same subscription.
 *
 * Each subscription keeps its own last value, seeded with the upstream value
 * at subscribe time; the upstream replay of that value is therefore
 * swallowed. Values are compared with operator==.
 */
template <typename T>
class DistinctValues : public ValueStream<T>
{
public:
    explicit DistinctValues(std::shared_ptr<const ValueStream<T>> upstream)
        : upstream_(std::move(upstream))
    {
        if (!upstream_)
            throw PreconditionError("DistinctValues requires an upstream stream");
    }

    explicit DistinctValues(const StoredValue<T> &value)
        : DistinctValues(std::make_shared<StoredValue<T>>(value)) {}

    T currentValue() const override
    {
        return upstream_->currentValue();
    }

    std::shared_ptr<Subscription> subscribe(StreamObserver<T> observer) const override
    {
        std::optional<T> seed;
        try
        {
            seed = upstream_->currentValue();
        }
        catch (const std::exception &e)
        {
            // Left unseeded; the upstream replay reports the read error
            Logger::debug("DistinctValues: could not seed last value: " + std::string(e.what()));
        }
        return subscribe(std::move(observer), std::move(seed));
    }

    /**
     * @brief Subscribe with a caller-supplied last value
     *
     * Callers that already read the upstream value pass it here so that a
     * change landing between their read and the subscription is delivered.
     * An empty seed forwards the upstream replay unconditionally.
     */
    std::shared_ptr<Subscription> subscribe(StreamObserver<T> observer, std::optional<T> seed) const
    {
        auto state = std::make_shared<State>();
        state->last = std::move(seed);

        auto shared_observer = std::make_shared<StreamObserver<T>>(std::move(observer));
        StreamObserver<T> filtered;
        filtered.on_next = [state, shared_observer](const T &value)
        {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->last && *state->last == value)
                    return;
                state->last = value;
            }
            shared_observer->next(value);
        };
        filtered.on_error = [shared_observer](std::exception_ptr error)
        {
            shared_observer->error(error);
        };
        filtered.on_done = [shared_observer]()
        {
            shared_observer->done();
        };

        auto upstream_subscription = upstream_->subscribe(std::move(filtered));
        return std::make_shared<DistinctSubscription>(state, std::move(upstream_subscription));
    }

    std::shared_ptr<Subscription> subscribe(std::function<void(const T &)> on_next) const
    {
        StreamObserver<T> observer;
        observer.on_next = std::move(on_next);
        return subscribe(std::move(observer));
    }

private:
    struct State
    {
        std::mutex mutex;
        std::optional<T> last;
    };

    class DistinctSubscription : public Subscription
    {
    public:
        DistinctSubscription(std::shared_ptr<State> state, std::shared_ptr<Subscription> upstream)
            : state_(std::move(state)), upstream_(std::move(upstream)) {}

        void cancel() override
        {
            upstream_->cancel();
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->last.reset();
        }

        void pause() override { upstream_->pause(); }
        void resume() override { upstream_->resume(); }

        bool isPaused() const override { return upstream_->isPaused(); }
        bool isCancelled() const override { return upstream_->isCancelled(); }

    private:
        std::shared_ptr<State> state_;
        std::shared_ptr<Subscription> upstream_;
    };

    std::shared_ptr<const ValueStream<T>> upstream_;
};

template <typename T>
DistinctValues<T> distinct(const StoredValue<T> &value)
{
    return DistinctValues<T>(value);
}
