#include "core/change_bus.hpp"
#include "logging/logger.hpp"
#include <algorithm>

class ChangeBus::Attachment : public Subscription
{
public:
    Attachment(std::weak_ptr<ChangeBus> bus, std::shared_ptr<Entry> entry)
        : bus_(std::move(bus)), entry_(std::move(entry)) {}

    ~Attachment() override = default;

    void cancel() override
    {
        if (!entry_->active.exchange(false))
            return;
        if (auto bus = bus_.lock())
        {
            bus->detach(entry_->id);
        }
    }

    void pause() override { entry_->paused.store(true); }
    void resume() override { entry_->paused.store(false); }

    bool isPaused() const override { return entry_->paused.load(); }
    bool isCancelled() const override { return !entry_->active.load(); }

private:
    std::weak_ptr<ChangeBus> bus_;
    std::shared_ptr<Entry> entry_;
};

std::shared_ptr<Subscription> ChangeBus::listen(Listener listener)
{
    auto entry = std::make_shared<Entry>();
    entry->listener = std::move(listener);

    bool already_closed = false;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        entry->id = next_id_++;
        if (closed_)
        {
            already_closed = true;
            entry->active.store(false);
        }
        else
        {
            entries_.push_back(entry);
        }
    }

    if (already_closed && entry->listener.on_close)
    {
        entry->listener.on_close();
    }

    return std::make_shared<Attachment>(weak_from_this(), entry);
}

void ChangeBus::publish(const std::string &key)
{
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    if (isClosed())
    {
        Logger::debug("ChangeBus: dropping change for key " + key + " on a closed bus");
        return;
    }

    pending_.push_back(key);
    if (dispatching_)
    {
        // Re-entrant publish from a listener; the outer frame drains it
        return;
    }

    struct DispatchScope
    {
        ChangeBus &bus;
        explicit DispatchScope(ChangeBus &b) : bus(b) { bus.dispatching_ = true; }
        ~DispatchScope()
        {
            bus.dispatching_ = false;
            bus.pending_.clear();
        }
    } scope(*this);

    while (!pending_.empty())
    {
        std::string next = std::move(pending_.front());
        pending_.pop_front();
        deliver(next);
    }
}

void ChangeBus::close()
{
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    std::vector<std::shared_ptr<Entry>> closing;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        if (closed_)
            return;
        closed_ = true;
        closing.swap(entries_);
    }

    Logger::debug("ChangeBus: closing with " + std::to_string(closing.size()) + " listeners");
    for (const auto &entry : closing)
    {
        if (!entry->active.exchange(false))
            continue;
        if (!entry->listener.on_close)
            continue;
        try
        {
            entry->listener.on_close();
        }
        catch (const std::exception &e)
        {
            Logger::error("ChangeBus: listener failed on close: " + std::string(e.what()));
        }
        catch (...)
        {
            Logger::error("ChangeBus: listener failed on close with a non-standard exception");
        }
    }
}

bool ChangeBus::isClosed() const
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return closed_;
}

size_t ChangeBus::listenerCount() const
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return entries_.size();
}

void ChangeBus::detach(uint64_t id)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [id](const std::shared_ptr<Entry> &entry)
                       { return entry->id == id; }),
        entries_.end());
}

void ChangeBus::deliver(const std::string &key)
{
    for (const auto &entry : snapshotEntries())
    {
        // Re-checked per entry: an earlier listener may have cancelled a later one
        if (!entry->active.load() || entry->paused.load())
            continue;
        if (!entry->listener.on_change)
            continue;
        try
        {
            entry->listener.on_change(key);
        }
        catch (const std::exception &e)
        {
            Logger::error("ChangeBus: listener failed for key " + key + ": " + e.what());
        }
        catch (...)
        {
            Logger::error("ChangeBus: listener failed for key " + key + " with a non-standard exception");
        }
    }
}

std::vector<std::shared_ptr<ChangeBus::Entry>> ChangeBus::snapshotEntries() const
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return entries_;
}
