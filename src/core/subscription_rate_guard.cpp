#include "core/subscription_rate_guard.hpp"
#include "logging/logger.hpp"

namespace
{
#ifdef NDEBUG
    constexpr bool kEnabledByDefault = false;
#else
    constexpr bool kEnabledByDefault = true;
#endif
}

SubscriptionRateGuard &SubscriptionRateGuard::getInstance()
{
    static SubscriptionRateGuard instance;
    return instance;
}

SubscriptionRateGuard::SubscriptionRateGuard()
    : enabled_(kEnabledByDefault),
      clock_([]()
             { return std::chrono::steady_clock::now(); }),
      handler_(&SubscriptionRateGuard::logDiagnostic)
{
}

bool SubscriptionRateGuard::recordSubscription(const std::string &key)
{
    Diagnostic diagnostic;
    DiagnosticHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_)
            return false;

        const TimePoint now = clock_();
        KeyLog &log = logs_[key];
        log.recent.push_back(now);
        log.total++;
        if (log.recent.size() > kTrackedSubscriptions)
        {
            log.recent.pop_front();
        }

        if (log.recent.size() < kTrackedSubscriptions)
            return false;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - log.recent.front());
        if (elapsed >= window_)
            return false;

        diagnostic.key = key;
        diagnostic.subscription_count = log.total;
        diagnostic.elapsed = elapsed;
        diagnostic.message = "Subscribed to a StoredValue with key \"" + key + "\" " +
                             std::to_string(kTrackedSubscriptions) + " times within " +
                             std::to_string(elapsed.count()) + "ms. This usually means a new StoredValue is "
                             "created and subscribed on every update cycle; keep the StoredValue returned by "
                             "the store and subscribe to it once.";
        handler = handler_;
    }

    if (handler)
    {
        try
        {
            handler(diagnostic);
        }
        catch (const std::exception &e)
        {
            Logger::error("SubscriptionRateGuard: diagnostic handler failed: " + std::string(e.what()));
        }
    }
    return true;
}

void SubscriptionRateGuard::setEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool SubscriptionRateGuard::isEnabled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void SubscriptionRateGuard::setWindow(std::chrono::milliseconds window)
{
    std::lock_guard<std::mutex> lock(mutex_);
    window_ = window;
}

std::chrono::milliseconds SubscriptionRateGuard::window() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return window_;
}

void SubscriptionRateGuard::setClock(Clock clock)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (clock)
    {
        clock_ = std::move(clock);
    }
    else
    {
        clock_ = []()
        { return std::chrono::steady_clock::now(); };
    }
}

void SubscriptionRateGuard::setDiagnosticHandler(DiagnosticHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = handler ? std::move(handler) : DiagnosticHandler(&SubscriptionRateGuard::logDiagnostic);
}

void SubscriptionRateGuard::resetForTesting()
{
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.clear();
    enabled_ = kEnabledByDefault;
    window_ = kDefaultWindow;
    clock_ = []()
    { return std::chrono::steady_clock::now(); };
    handler_ = &SubscriptionRateGuard::logDiagnostic;
}

void SubscriptionRateGuard::logDiagnostic(const Diagnostic &diagnostic)
{
    Logger::warn("SubscriptionRateGuard: " + diagnostic.message);
}
