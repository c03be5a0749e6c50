#include "core/combine_latest.hpp"
#include "logging/logger.hpp"

CombineLatest::CombineLatest(std::vector<CombinedInput> inputs,
                             StreamObserver<CombinedSnapshot> observer,
                             CombineErrorMode mode)
    : state_(std::make_shared<State>())
{
    state_->observer = std::move(observer);
    state_->mode = mode;
    build(state_, std::move(inputs));
}

CombineLatest::~CombineLatest()
{
    cancel();
}

bool CombineLatest::updateInputs(std::vector<CombinedInput> inputs)
{
    std::vector<std::shared_ptr<Subscription>> stale;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->disposed)
        {
            Logger::debug("CombineLatest: ignoring input update after cancel");
            return false;
        }

        bool same = inputs.size() == state_->inputs.size();
        for (size_t i = 0; same && i < inputs.size(); ++i)
        {
            same = inputs[i].identity() == state_->inputs[i].identity();
        }
        if (same)
            return false;

        stale = detachAll(*state_);
        state_->generation++;
    }

    for (const auto &subscription : stale)
    {
        subscription->cancel();
    }

    Logger::debug("CombineLatest: inputs changed, rebuilding " + std::to_string(inputs.size()) + " subscriptions");
    build(state_, std::move(inputs));
    return true;
}

CombinedSnapshot CombineLatest::snapshot() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return CombinedSnapshot(state_->values);
}

bool CombineLatest::isDone() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->completed;
}

size_t CombineLatest::inputCount() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->inputs.size();
}

void CombineLatest::cancel()
{
    std::vector<std::shared_ptr<Subscription>> stale;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->disposed)
            return;
        state_->disposed = true;
        state_->generation++;
        stale = detachAll(*state_);
    }

    for (const auto &subscription : stale)
    {
        subscription->cancel();
    }
}

void CombineLatest::pause()
{
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->disposed || state_->paused)
            return;
        state_->paused = true;
        targets = state_->subscriptions;
    }

    for (const auto &subscription : targets)
    {
        subscription->pause();
    }
}

void CombineLatest::resume()
{
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->disposed || !state_->paused)
            return;
        state_->paused = false;
        targets = state_->subscriptions;
    }

    for (const auto &subscription : targets)
    {
        subscription->resume();
    }
}

bool CombineLatest::isPaused() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->paused;
}

bool CombineLatest::isCancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->disposed || state_->halted;
}

void CombineLatest::build(const std::shared_ptr<State> &state, std::vector<CombinedInput> inputs)
{
    // Every initial value is read before any input is subscribed
    std::vector<std::any> initial;
    initial.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        try
        {
            initial.push_back(inputs[i].read());
        }
        catch (const std::exception &e)
        {
            // The slot stays empty; the subscription replay reports the error
            Logger::debug("CombineLatest: initial read failed for input " + std::to_string(i) + ": " + e.what());
            initial.emplace_back();
        }
    }

    uint64_t generation;
    bool paused;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->inputs = inputs;
        state->values = initial;
        state->done.assign(inputs.size(), false);
        state->halted = false;
        state->completed = inputs.empty();
        generation = state->generation;
        paused = state->paused;
    }

    state->observer.next(CombinedSnapshot(initial));

    if (inputs.empty())
    {
        state->observer.done();
        return;
    }

    std::weak_ptr<State> weak = state;
    std::vector<std::shared_ptr<Subscription>> created;
    created.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->generation != generation || state->halted)
                break;
        }

        StreamObserver<std::any> observer;
        observer.on_next = [weak, generation, i](const std::any &value)
        {
            onNext(weak, generation, i, value);
        };
        observer.on_error = [weak, generation](std::exception_ptr error)
        {
            onError(weak, generation, error);
        };
        observer.on_done = [weak, generation, i]()
        {
            onDone(weak, generation, i);
        };

        auto subscription = inputs[i].subscribe(std::move(observer), initial[i]);
        if (paused)
        {
            subscription->pause();
        }
        created.push_back(std::move(subscription));
    }

    bool keep;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        keep = state->generation == generation && !state->halted;
        if (keep)
        {
            state->subscriptions = created;
        }
    }

    if (!keep)
    {
        for (const auto &subscription : created)
        {
            subscription->cancel();
        }
    }
}

std::vector<std::shared_ptr<Subscription>> CombineLatest::detachAll(State &state)
{
    std::vector<std::shared_ptr<Subscription>> detached;
    detached.swap(state.subscriptions);
    return detached;
}

void CombineLatest::onNext(const std::weak_ptr<State> &weak, uint64_t generation, size_t index, const std::any &value)
{
    auto state = weak.lock();
    if (!state)
        return;

    CombinedSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->generation != generation || state->disposed || state->halted)
            return;
        state->values[index] = value;
        snapshot = CombinedSnapshot(state->values);
    }
    state->observer.next(snapshot);
}

void CombineLatest::onError(const std::weak_ptr<State> &weak, uint64_t generation, std::exception_ptr error)
{
    auto state = weak.lock();
    if (!state)
        return;

    std::vector<std::shared_ptr<Subscription>> siblings;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->generation != generation || state->disposed || state->halted)
            return;
        if (state->mode == CombineErrorMode::CancelOnError)
        {
            state->halted = true;
            siblings = detachAll(*state);
        }
    }

    if (!siblings.empty())
    {
        Logger::warn("CombineLatest: input failed, cancelling " + std::to_string(siblings.size()) +
                     " subscriptions: " + describeException(error));
    }
    for (const auto &subscription : siblings)
    {
        subscription->cancel();
    }
    state->observer.error(error);
}

void CombineLatest::onDone(const std::weak_ptr<State> &weak, uint64_t generation, size_t index)
{
    auto state = weak.lock();
    if (!state)
        return;

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->generation != generation || state->disposed || state->halted || state->completed)
            return;
        state->done[index] = true;
        for (bool input_done : state->done)
        {
            if (!input_done)
                return;
        }
        state->completed = true;
    }
    state->observer.done();
}
