#include "test_base.hpp"
#include "core/memory_key_value_store.hpp"
#include "core/primitive_adapters.hpp"
#include "core/stored_value.hpp"
#include <set>
#include <stdexcept>
#include <vector>

class SubscriptionRateGuardTest : public TestBase
{
protected:
    using Diagnostic = SubscriptionRateGuard::Diagnostic;

    void SetUp() override
    {
        TestBase::SetUp();
        auto &guard = SubscriptionRateGuard::getInstance();
        guard.setEnabled(true);
        guard.setClock([this]()
                       { return now_; });
        guard.setDiagnosticHandler([this](const Diagnostic &diagnostic)
                                   { diagnostics_.push_back(diagnostic); });
    }

    void advance(int ms) { now_ += std::chrono::milliseconds(ms); }

    SubscriptionRateGuard::TimePoint now_{};
    std::vector<Diagnostic> diagnostics_;
};

TEST_F(SubscriptionRateGuardTest, FourQuickSubscriptionsRaiseDiagnostic)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    for (int i = 0; i < 3; ++i)
    {
        EXPECT_FALSE(guard.recordSubscription("hot"));
        advance(100);
    }
    EXPECT_TRUE(guard.recordSubscription("hot"));

    ASSERT_EQ(diagnostics_.size(), 1u);
    EXPECT_EQ(diagnostics_[0].key, "hot");
    EXPECT_EQ(diagnostics_[0].subscription_count, 4u);
    EXPECT_EQ(diagnostics_[0].elapsed, std::chrono::milliseconds(300));
    EXPECT_FALSE(diagnostics_[0].message.empty());
}

TEST_F(SubscriptionRateGuardTest, SpacedSubscriptionsRaiseNothing)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    for (int i = 0; i < 8; ++i)
    {
        EXPECT_FALSE(guard.recordSubscription("calm"));
        advance(250);
    }
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(SubscriptionRateGuardTest, WindowIsTrackedPerKey)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    guard.recordSubscription("a");
    guard.recordSubscription("b");
    guard.recordSubscription("a");
    guard.recordSubscription("b");

    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(SubscriptionRateGuardTest, OnlyTheLastFourCount)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    guard.recordSubscription("k");
    advance(1000);
    guard.recordSubscription("k");
    guard.recordSubscription("k");
    guard.recordSubscription("k");
    EXPECT_TRUE(diagnostics_.empty());

    // The oldest of the last four is now inside the window
    guard.recordSubscription("k");
    EXPECT_EQ(diagnostics_.size(), 1u);
}

TEST_F(SubscriptionRateGuardTest, DisabledGuardRecordsNothing)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    guard.setEnabled(false);
    for (int i = 0; i < 5; ++i)
        EXPECT_FALSE(guard.recordSubscription("k"));

    EXPECT_FALSE(guard.isEnabled());
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(SubscriptionRateGuardTest, ConfigurableWindow)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    guard.setWindow(std::chrono::milliseconds(100));
    EXPECT_EQ(guard.window(), std::chrono::milliseconds(100));

    for (int i = 0; i < 4; ++i)
    {
        guard.recordSubscription("k");
        advance(50);
    }
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(SubscriptionRateGuardTest, ThrowingHandlerDoesNotBreakSubscribe)
{
    auto &guard = SubscriptionRateGuard::getInstance();
    guard.setDiagnosticHandler([](const Diagnostic &)
                               { throw std::runtime_error("handler failure"); });

    auto store = std::make_shared<MemoryKeyValueStore>();
    auto bus = std::make_shared<ChangeBus>();
    StoredValue<bool> value(store, std::string("flag"), false, BoolAdapter::instance(), bus);

    std::vector<std::shared_ptr<Subscription>> subscriptions;
    for (int i = 0; i < 4; ++i)
        EXPECT_NO_THROW(subscriptions.push_back(value.subscribe([](const bool &) {})));

    EXPECT_EQ(bus->listenerCount(), 4u);
}

TEST_F(SubscriptionRateGuardTest, StoredValueSubscriptionsAreRecorded)
{
    auto store = std::make_shared<MemoryKeyValueStore>();
    auto bus = std::make_shared<ChangeBus>();
    StoredValue<bool> value(store, std::string("flag"), false, BoolAdapter::instance(), bus);
    StoredValue<std::set<std::string>> keys(store, std::nullopt, {}, KeySetAdapter::instance(), bus);

    std::vector<std::shared_ptr<Subscription>> subscriptions;
    for (int i = 0; i < 4; ++i)
    {
        subscriptions.push_back(value.subscribe([](const bool &) {}));
        subscriptions.push_back(keys.subscribe([](const std::set<std::string> &) {}));
    }

    ASSERT_EQ(diagnostics_.size(), 2u);
    EXPECT_EQ(diagnostics_[0].key, "flag");
    EXPECT_EQ(diagnostics_[1].key, kAggregateKeyLabel);
}
