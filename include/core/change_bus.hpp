#pragma once

#include "core/subscription.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Broadcast channel of changed keys, one per store session.
 *
 * Any thread may publish. Dispatch is synchronous and serialized: every
 * listener sees events in publish order. A publish issued by a listener while
 * an event is being dispatched is queued behind it and delivered once the
 * current event has reached every listener.
 *
 * Always create through std::make_shared; attachments keep a weak reference.
 */
class ChangeBus : public std::enable_shared_from_this<ChangeBus>
{
public:
    struct Listener
    {
        std::function<void(const std::string &)> on_change;
        std::function<void()> on_close;
    };

    ChangeBus() = default;
    ~ChangeBus() = default;
    ChangeBus(const ChangeBus &) = delete;
    ChangeBus &operator=(const ChangeBus &) = delete;

    // Attach a listener; the returned handle pauses, resumes and detaches it
    std::shared_ptr<Subscription> listen(Listener listener);

    void publish(const std::string &key);

    // Complete every listener and reject further publications
    void close();

    bool isClosed() const;
    size_t listenerCount() const;

private:
    struct Entry
    {
        uint64_t id;
        Listener listener;
        std::atomic<bool> paused{false};
        std::atomic<bool> active{true};
    };

    class Attachment;

    void detach(uint64_t id);
    void deliver(const std::string &key);
    std::vector<std::shared_ptr<Entry>> snapshotEntries() const;

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<Entry>> entries_;
    uint64_t next_id_{1};
    bool closed_{false};

    // Serializes dispatch across publishers; recursive so listeners may publish
    std::recursive_mutex dispatch_mutex_;
    std::deque<std::string> pending_;
    bool dispatching_{false};
};
