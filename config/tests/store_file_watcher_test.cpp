#include <gtest/gtest.h>
#include "store_file_watcher.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

class StoreFileWatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
        test_store_path_ = (std::filesystem::temp_directory_path() / "streaming_store_watched.json").string();
        writeStoreFile(R"({"name": "alice", "count": 1, "stale": true})");

        backend_ = std::make_shared<PocoKeyValueStore>(test_store_path_);
        store_ = std::make_shared<StreamingKeyValueStore>(backend_);
    }

    void TearDown() override
    {
        store_.reset();
        backend_.reset();
        if (std::filesystem::exists(test_store_path_))
        {
            std::filesystem::remove(test_store_path_);
        }
    }

    void writeStoreFile(const std::string &content)
    {
        std::ofstream out(test_store_path_);
        out << content;
    }

    // Filesystem timestamps can be coarse; push the mtime forward explicitly
    void touchForward()
    {
        auto t = std::filesystem::last_write_time(test_store_path_);
        std::filesystem::last_write_time(test_store_path_, t + std::chrono::seconds(2));
    }

    std::string test_store_path_;
    std::shared_ptr<PocoKeyValueStore> backend_;
    std::shared_ptr<StreamingKeyValueStore> store_;
};

TEST_F(StoreFileWatcherTest, UnchangedFilePublishesNothing)
{
    StoreFileWatcher watcher(backend_, store_);
    EXPECT_TRUE(watcher.checkNow().empty());
}

TEST_F(StoreFileWatcherTest, ReloadPublishesChangedKeysOnly)
{
    StoreFileWatcher watcher(backend_, store_);

    std::vector<std::string> names;
    auto subscription = store_->getString("name", "").subscribe([&names](const std::string &v)
                                                                { names.push_back(v); });

    writeStoreFile(R"({"name": "bob", "count": 1, "added": "x"})");
    touchForward();

    auto changed = watcher.checkNow();
    std::sort(changed.begin(), changed.end());

    EXPECT_EQ(changed, (std::vector<std::string>{"added", "name", "stale"}));
    EXPECT_EQ(names, (std::vector<std::string>{"alice", "bob"}));

    // Same mtime again: nothing to do
    EXPECT_TRUE(watcher.checkNow().empty());
}

TEST_F(StoreFileWatcherTest, MalformedFileIsIgnoredUntilFixed)
{
    StoreFileWatcher watcher(backend_, store_);

    writeStoreFile("{ broken");
    touchForward();
    EXPECT_TRUE(watcher.checkNow().empty());
    EXPECT_EQ(backend_->getString("name"), std::string("alice"));

    writeStoreFile(R"({"name": "carol", "count": 1, "stale": true})");
    touchForward();
    touchForward();
    EXPECT_EQ(watcher.checkNow(), std::vector<std::string>{"name"});
}

TEST_F(StoreFileWatcherTest, BackgroundThreadDeliversChanges)
{
    std::atomic<int> updates{0};
    auto subscription = store_->getInt("count", 0).subscribe([&updates](const int64_t &v)
                                                             {
        if (v == 2)
            ++updates; });

    StoreFileWatcher watcher(backend_, store_, std::chrono::milliseconds(20));
    EXPECT_TRUE(watcher.start());
    EXPECT_FALSE(watcher.start());
    EXPECT_TRUE(watcher.isRunning());

    writeStoreFile(R"({"name": "alice", "count": 2, "stale": true})");
    touchForward();

    for (int i = 0; i < 100 && updates.load() == 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
    EXPECT_EQ(updates.load(), 1);
}

TEST_F(StoreFileWatcherTest, RequiresFileBackedStore)
{
    auto in_memory = std::make_shared<PocoKeyValueStore>();

    EXPECT_THROW(StoreFileWatcher(in_memory, store_), PreconditionError);
    EXPECT_THROW(StoreFileWatcher(nullptr, store_), PreconditionError);
    EXPECT_THROW(StoreFileWatcher(backend_, store_, std::chrono::milliseconds(0)), PreconditionError);
}
