#include "test_base.hpp"
#include "core/log_level_binding.hpp"
#include "core/memory_key_value_store.hpp"
#include "fake_key_value_store.hpp"

class LogLevelBindingTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<StreamingKeyValueStore>(std::make_shared<MemoryKeyValueStore>());
    }

    void TearDown() override
    {
        Logger::init("DEBUG");
        TestBase::TearDown();
    }

    spdlog::level::level_enum currentLevel() const
    {
        return spdlog::get("streaming_store")->level();
    }

    std::unique_ptr<StreamingKeyValueStore> store_;
};

TEST_F(LogLevelBindingTest, AppliesStoredLevelImmediately)
{
    store_->setString("log_level", "WARN");
    LogLevelBinding binding(*store_);

    EXPECT_EQ(binding.appliedLevel(), "WARN");
    EXPECT_EQ(currentLevel(), spdlog::level::warn);
}

TEST_F(LogLevelBindingTest, FallsBackToDefaultLevel)
{
    LogLevelBinding binding(*store_, "log_level", "ERROR");

    EXPECT_EQ(binding.appliedLevel(), "ERROR");
    EXPECT_EQ(currentLevel(), spdlog::level::err);
}

TEST_F(LogLevelBindingTest, FollowsStoreChanges)
{
    LogLevelBinding binding(*store_, "log_level", "INFO");

    store_->setString("log_level", "TRACE");
    EXPECT_EQ(binding.appliedLevel(), "TRACE");
    EXPECT_EQ(currentLevel(), spdlog::level::trace);

    store_->remove("log_level");
    EXPECT_EQ(binding.appliedLevel(), "INFO");
    EXPECT_EQ(currentLevel(), spdlog::level::info);
}

TEST_F(LogLevelBindingTest, ChangeRacingTheInitialReadIsApplied)
{
    auto backing = std::make_shared<FakeKeyValueStore>();
    backing->setString("log_level", "WARN");
    StreamingKeyValueStore store(backing);
    backing->afterNextRead("log_level", [backing]()
                           { backing->setString("log_level", "ERROR"); });

    LogLevelBinding binding(store);

    EXPECT_EQ(binding.appliedLevel(), "ERROR");
    EXPECT_EQ(currentLevel(), spdlog::level::err);
}

TEST_F(LogLevelBindingTest, InvalidLevelIsIgnored)
{
    LogLevelBinding binding(*store_, "log_level", "WARN");

    store_->setString("log_level", "LOUD");

    EXPECT_EQ(binding.appliedLevel(), "WARN");
    EXPECT_EQ(currentLevel(), spdlog::level::warn);
}

TEST_F(LogLevelBindingTest, DestroyedBindingStopsFollowing)
{
    {
        LogLevelBinding binding(*store_, "log_level", "WARN");
    }
    store_->setString("log_level", "TRACE");

    EXPECT_EQ(currentLevel(), spdlog::level::warn);
}
