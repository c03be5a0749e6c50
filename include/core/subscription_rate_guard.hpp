#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

/**
 * @brief Debug instrumentation flagging keys that are subscribed to
 * suspiciously often.
 *
 * The usual cause is building a fresh StoredValue (and subscribing to it) on
 * every render pass instead of keeping one around, which refetches the value
 * from storage each time.
 *
 * The guard keeps the last four subscription timestamps per key. When the
 * fourth one lands less than window() after the first, a diagnostic is sent
 * to the handler. The subscription itself always proceeds.
 */
class SubscriptionRateGuard
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    struct Diagnostic
    {
        std::string key;
        size_t subscription_count;      // Subscriptions seen for the key so far
        std::chrono::milliseconds elapsed; // Time spanned by the last four
        std::string message;
    };

    using DiagnosticHandler = std::function<void(const Diagnostic &)>;

    static constexpr size_t kTrackedSubscriptions = 4;
    static constexpr std::chrono::milliseconds kDefaultWindow{750};

    static SubscriptionRateGuard &getInstance();

    /**
     * @brief Log a subscription for key
     * @return true if a diagnostic was raised
     */
    bool recordSubscription(const std::string &key);

    void setEnabled(bool enabled);
    bool isEnabled() const;

    void setWindow(std::chrono::milliseconds window);
    std::chrono::milliseconds window() const;

    void setClock(Clock clock);
    void setDiagnosticHandler(DiagnosticHandler handler);

    // Drop the log and restore every default
    void resetForTesting();

private:
    SubscriptionRateGuard();
    ~SubscriptionRateGuard() = default;
    SubscriptionRateGuard(const SubscriptionRateGuard &) = delete;
    SubscriptionRateGuard &operator=(const SubscriptionRateGuard &) = delete;

    struct KeyLog
    {
        std::deque<TimePoint> recent;
        size_t total{0};
    };

    static void logDiagnostic(const Diagnostic &diagnostic);

    mutable std::mutex mutex_;
    std::map<std::string, KeyLog> logs_;
    bool enabled_;
    std::chrono::milliseconds window_{kDefaultWindow};
    Clock clock_;
    DiagnosticHandler handler_;
};
