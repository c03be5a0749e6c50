#include "store_file_watcher.hpp"
#include "core/store_errors.hpp"
#include "logging/logger.hpp"
#include <map>

namespace
{
    using Snapshot = std::map<std::string, nlohmann::json>;

    void flatten(const nlohmann::json &node, const std::string &prefix, Snapshot &out)
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            const std::string path = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it.value().is_object())
                flatten(it.value(), path, out);
            else
                out[path] = it.value();
        }
    }

    Snapshot snapshotOf(const PocoKeyValueStore &backend)
    {
        Snapshot snapshot;
        auto document = backend.getAll();
        if (document.is_object())
            flatten(document, "", snapshot);
        return snapshot;
    }

    std::vector<std::string> changedKeys(const Snapshot &before, const Snapshot &after)
    {
        std::vector<std::string> keys;
        for (const auto &[key, value] : before)
        {
            auto it = after.find(key);
            if (it == after.end() || it->second != value)
                keys.push_back(key);
        }
        for (const auto &[key, value] : after)
        {
            if (before.find(key) == before.end())
                keys.push_back(key);
        }
        return keys;
    }
}

StoreFileWatcher::StoreFileWatcher(std::shared_ptr<PocoKeyValueStore> backend,
                                   std::shared_ptr<StreamingKeyValueStore> store,
                                   std::chrono::milliseconds interval)
    : backend_(std::move(backend)), store_(std::move(store)), interval_(interval)
{
    if (!backend_ || !store_)
        throw PreconditionError("StoreFileWatcher requires a backend and a streaming store");
    if (backend_->path().empty())
        throw PreconditionError("StoreFileWatcher requires a file-backed store");
    if (interval_.count() <= 0)
        throw PreconditionError("StoreFileWatcher interval must be positive");

    std::error_code ec;
    auto current = std::filesystem::last_write_time(backend_->path(), ec);
    if (!ec)
    {
        last_write_time_ = current;
        has_write_time_ = true;
    }
}

StoreFileWatcher::~StoreFileWatcher()
{
    stop();
}

bool StoreFileWatcher::start()
{
    if (watching_.exchange(true))
        return false;

    watcher_thread_ = std::thread([this]()
                                  { run(); });
    return true;
}

void StoreFileWatcher::stop()
{
    if (!watching_.exchange(false))
        return;

    wake_.notify_all();
    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

std::vector<std::string> StoreFileWatcher::checkNow()
{
    std::lock_guard<std::mutex> lock(check_mutex_);

    std::error_code ec;
    auto current = std::filesystem::last_write_time(backend_->path(), ec);
    if (ec)
    {
        Logger::debug("Store file not readable: " + backend_->path() + " (" + ec.message() + ")");
        return {};
    }

    if (has_write_time_ && current == last_write_time_)
        return {};

    Logger::info("Detected change in store file. Reloading...");
    auto before = snapshotOf(*backend_);
    if (!backend_->reload())
    {
        Logger::warn("Ignored store file change, reload failed");
        return {};
    }
    last_write_time_ = current;
    has_write_time_ = true;

    auto keys = changedKeys(before, snapshotOf(*backend_));
    if (!keys.empty())
    {
        Logger::debug("Store file reload changed " + std::to_string(keys.size()) + " key(s)");
        store_->notifyExternalChange(keys);
    }
    return keys;
}

void StoreFileWatcher::run()
{
    Logger::info("Starting store file watcher for: " + backend_->path());
    while (watching_.load())
    {
        try
        {
            checkNow();
        }
        catch (const std::exception &e)
        {
            Logger::warn(std::string("Store watcher error: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_for(lock, interval_, [this]()
                       { return !watching_.load(); });
    }
    Logger::info("Store file watcher stopped");
}
