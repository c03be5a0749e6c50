#pragma once

#include "poco_key_value_store.hpp"
#include "core/streaming_key_value_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Reloads a PocoKeyValueStore when its file changes on disk
 *
 * Polls the file's modification time. After a reload, every key whose value
 * was added, removed or changed is published through
 * StreamingKeyValueStore::notifyExternalChange, so subscribers observe edits
 * made by other processes.
 */
class StoreFileWatcher
{
public:
    StoreFileWatcher(std::shared_ptr<PocoKeyValueStore> backend,
                     std::shared_ptr<StreamingKeyValueStore> store,
                     std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~StoreFileWatcher();

    StoreFileWatcher(const StoreFileWatcher &) = delete;
    StoreFileWatcher &operator=(const StoreFileWatcher &) = delete;

    bool start();
    void stop();
    bool isRunning() const { return watching_.load(); }

    // One poll cycle; returns the keys that were published
    std::vector<std::string> checkNow();

private:
    void run();

    std::shared_ptr<PocoKeyValueStore> backend_;
    std::shared_ptr<StreamingKeyValueStore> store_;
    std::chrono::milliseconds interval_;

    std::mutex check_mutex_;
    std::filesystem::file_time_type last_write_time_{};
    bool has_write_time_ = false;

    std::atomic<bool> watching_{false};
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread watcher_thread_;
};
