#include <gtest/gtest.h>
#include "core/change_bus.hpp"
#include "core/store_errors.hpp"
#include "logging/logger.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

class ChangeBusTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
        bus_ = std::make_shared<ChangeBus>();
    }

    ChangeBus::Listener recorder(std::vector<std::string> &seen)
    {
        ChangeBus::Listener listener;
        listener.on_change = [&seen](const std::string &key)
        { seen.push_back(key); };
        return listener;
    }

    std::shared_ptr<ChangeBus> bus_;
};

TEST_F(ChangeBusTest, DeliversToEveryListener)
{
    std::vector<std::string> first, second;
    auto a = bus_->listen(recorder(first));
    auto b = bus_->listen(recorder(second));

    bus_->publish("x");
    bus_->publish("y");

    EXPECT_EQ(first, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(second, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(bus_->listenerCount(), 2u);
}

TEST_F(ChangeBusTest, CancelStopsDeliveryAndIsIdempotent)
{
    std::vector<std::string> seen;
    auto subscription = bus_->listen(recorder(seen));

    bus_->publish("x");
    subscription->cancel();
    subscription->cancel();
    bus_->publish("y");

    EXPECT_EQ(seen, std::vector<std::string>{"x"});
    EXPECT_TRUE(subscription->isCancelled());
    EXPECT_EQ(bus_->listenerCount(), 0u);
}

TEST_F(ChangeBusTest, PausedListenerMissesEvents)
{
    std::vector<std::string> seen;
    auto subscription = bus_->listen(recorder(seen));

    subscription->pause();
    EXPECT_TRUE(subscription->isPaused());
    bus_->publish("dropped");
    subscription->resume();
    bus_->publish("kept");

    EXPECT_EQ(seen, std::vector<std::string>{"kept"});
}

TEST_F(ChangeBusTest, ReentrantPublishIsQueuedInOrder)
{
    std::vector<std::string> seen;
    ChangeBus::Listener first;
    first.on_change = [this, &seen](const std::string &key)
    {
        seen.push_back("first:" + key);
        if (key == "a")
            bus_->publish("b");
    };
    ChangeBus::Listener second;
    second.on_change = [&seen](const std::string &key)
    { seen.push_back("second:" + key); };

    auto s1 = bus_->listen(std::move(first));
    auto s2 = bus_->listen(std::move(second));
    bus_->publish("a");

    // "b" is delivered only after every listener has seen "a"
    EXPECT_EQ(seen, (std::vector<std::string>{"first:a", "second:a", "first:b", "second:b"}));
}

TEST_F(ChangeBusTest, ThrowingListenerDoesNotStopOthers)
{
    std::vector<std::string> seen;
    ChangeBus::Listener failing;
    failing.on_change = [](const std::string &)
    { throw std::runtime_error("listener failure"); };

    auto s1 = bus_->listen(std::move(failing));
    auto s2 = bus_->listen(recorder(seen));

    EXPECT_NO_THROW(bus_->publish("x"));
    EXPECT_EQ(seen, std::vector<std::string>{"x"});
}

TEST_F(ChangeBusTest, NonStandardThrowIsLoggedAndSkipped)
{
    std::vector<std::string> seen;
    ChangeBus::Listener failing;
    failing.on_change = [](const std::string &)
    { throw 42; };
    failing.on_close = []()
    { throw "close failure"; };

    auto s1 = bus_->listen(std::move(failing));
    auto s2 = bus_->listen(recorder(seen));

    EXPECT_NO_THROW(bus_->publish("x"));
    EXPECT_EQ(seen, std::vector<std::string>{"x"});
    EXPECT_NO_THROW(bus_->close());
    EXPECT_EQ(describeException(std::make_exception_ptr(42)), "unknown exception");
}

TEST_F(ChangeBusTest, CloseCompletesListeners)
{
    int closed = 0;
    ChangeBus::Listener listener;
    listener.on_close = [&closed]()
    { ++closed; };
    auto subscription = bus_->listen(listener);

    bus_->close();
    bus_->close();
    EXPECT_TRUE(bus_->isClosed());
    EXPECT_EQ(closed, 1);

    // Publishing after close is a no-op
    EXPECT_NO_THROW(bus_->publish("x"));

    // Late listeners complete immediately
    auto late = bus_->listen(listener);
    EXPECT_EQ(closed, 2);
}

TEST_F(ChangeBusTest, SubscriptionOutlivesBus)
{
    std::vector<std::string> seen;
    auto subscription = bus_->listen(recorder(seen));
    bus_.reset();

    EXPECT_NO_THROW(subscription->cancel());
}
