#pragma once

#include "core/distinct_values.hpp"
#include "core/stored_value.hpp"
#include "core/subscription.hpp"
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <typeinfo>
#include <vector>

/**
 * @brief Ordered values of every CombineLatest input at one point in time.
 */
class CombinedSnapshot
{
public:
    CombinedSnapshot() = default;
    explicit CombinedSnapshot(std::vector<std::any> values) : values_(std::move(values)) {}

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::any &at(size_t index) const { return values_.at(index); }

    // Typed access; throws std::bad_any_cast on a type mismatch
    template <typename T>
    const T &get(size_t index) const
    {
        const T *value = std::any_cast<T>(&values_.at(index));
        if (!value)
            throw std::bad_any_cast();
        return *value;
    }

    // True once the input at index has produced a value
    bool has(size_t index) const { return values_.at(index).has_value(); }

private:
    std::vector<std::any> values_;
};

/**
 * @brief Type-erased CombineLatest input built from a StoredValue of any T.
 *
 * Subscriptions made through it are deduplicated with DistinctValues,
 * seeded with the value the caller already read.
 */
class CombinedInput
{
public:
    template <typename T>
    CombinedInput(const StoredValue<T> &value)
        : identity_(value.identity()),
          read_([value]() -> std::any
                { return value.currentValue(); }),
          subscribe_([value](StreamObserver<std::any> observer, const std::any &seed)
                     {
                         StreamObserver<T> typed;
                         typed.on_next = [next = observer.on_next](const T &v)
                         {
                             if (next)
                                 next(std::any(v));
                         };
                         typed.on_error = observer.on_error;
                         typed.on_done = observer.on_done;
                         std::optional<T> last;
                         if (const T *seeded = std::any_cast<T>(&seed))
                             last = *seeded;
                         return DistinctValues<T>(value).subscribe(std::move(typed), std::move(last));
                     })
    {
    }

    const StoredValueIdentity &identity() const { return identity_; }

    std::any read() const { return read_(); }

    // seed is the value already read for this input; empty if the read failed
    std::shared_ptr<Subscription> subscribe(StreamObserver<std::any> observer, const std::any &seed) const
    {
        return subscribe_(std::move(observer), seed);
    }

private:
    StoredValueIdentity identity_;
    std::function<std::any()> read_;
    std::function<std::shared_ptr<Subscription>(StreamObserver<std::any>, const std::any &)> subscribe_;
};

enum class CombineErrorMode
{
    CancelOnError, // An input error cancels every input and ends the stream
    Continue       // An input error is forwarded; all inputs keep running
};

/**
 * @brief Combine-latest aggregation of several StoredValues.
 *
 * Construction reads every input synchronously, hands the resulting snapshot
 * to the observer, and only then subscribes to the inputs. Each distinct
 * upstream value replaces its slot and emits a fresh snapshot.
 *
 * The stream completes when every input has completed; with no inputs it
 * completes right after the initial (empty) snapshot.
 */
class CombineLatest : public Subscription
{
public:
    CombineLatest(std::vector<CombinedInput> inputs,
                  StreamObserver<CombinedSnapshot> observer,
                  CombineErrorMode mode = CombineErrorMode::CancelOnError);
    ~CombineLatest() override;

    CombineLatest(const CombineLatest &) = delete;
    CombineLatest &operator=(const CombineLatest &) = delete;

    /**
     * @brief Switch to a new input list
     *
     * An equal list (same length, pairwise equal identities) keeps the live
     * subscriptions. Anything else tears every subscription down and rebuilds
     * from fresh synchronous reads, exactly like construction.
     *
     * @return true if the subscriptions were rebuilt
     */
    bool updateInputs(std::vector<CombinedInput> inputs);

    CombinedSnapshot snapshot() const;
    bool isDone() const;
    size_t inputCount() const;

    void cancel() override;
    void pause() override;
    void resume() override;
    bool isPaused() const override;
    bool isCancelled() const override;

private:
    struct State
    {
        mutable std::mutex mutex;
        StreamObserver<CombinedSnapshot> observer;
        CombineErrorMode mode{CombineErrorMode::CancelOnError};

        std::vector<CombinedInput> inputs;
        std::vector<std::any> values;
        std::vector<bool> done;
        std::vector<std::shared_ptr<Subscription>> subscriptions;

        uint64_t generation{0};
        bool paused{false};
        bool disposed{false}; // cancelled by the owner
        bool halted{false};   // cancelled by an input error
        bool completed{false};
    };

    static void build(const std::shared_ptr<State> &state, std::vector<CombinedInput> inputs);
    static std::vector<std::shared_ptr<Subscription>> detachAll(State &state);

    static void onNext(const std::weak_ptr<State> &weak, uint64_t generation, size_t index, const std::any &value);
    static void onError(const std::weak_ptr<State> &weak, uint64_t generation, std::exception_ptr error);
    static void onDone(const std::weak_ptr<State> &weak, uint64_t generation, size_t index);

    std::shared_ptr<State> state_;
};
