#include "core/store_session.hpp"
#include "core/memory_key_value_store.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <stdexcept>

std::mutex StoreSession::mutex_;
StoreSession::StoreFactory StoreSession::factory_ = &StoreSession::openDefaultStore;
StoreSession::SessionFuture StoreSession::future_;

bool StoreSession::setStoreFactory(StoreFactory factory)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (future_.valid())
    {
        Logger::warn("StoreSession: store factory changed after initialization started; ignoring");
        return false;
    }
    factory_ = factory ? std::move(factory) : StoreFactory(&StoreSession::openDefaultStore);
    return true;
}

StoreSession::SessionFuture StoreSession::instance()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!future_.valid())
    {
        Logger::info("StoreSession: initializing store session");
        StoreFactory factory = factory_;
        future_ = std::async(std::launch::async, [factory]()
                             {
                                 auto store = factory();
                                 if (!store)
                                 {
                                     throw std::runtime_error("Store factory returned no backing store");
                                 }
                                 Logger::info("StoreSession: backing store ready");
                                 return std::make_shared<StreamingKeyValueStore>(std::move(store));
                             })
                      .share();
    }
    return future_;
}

std::shared_ptr<StreamingKeyValueStore> StoreSession::get()
{
    return instance().get();
}

bool StoreSession::isInitialized()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return future_.valid() &&
           future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void StoreSession::resetForTesting()
{
    SessionFuture previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = future_;
        future_ = SessionFuture();
        factory_ = &StoreSession::openDefaultStore;
    }

    if (!previous.valid())
        return;

    try
    {
        previous.get()->close();
    }
    catch (const std::exception &e)
    {
        Logger::debug("StoreSession: discarded failed session: " + std::string(e.what()));
    }
}

std::shared_ptr<KeyValueStore> StoreSession::openDefaultStore()
{
    return std::make_shared<MemoryKeyValueStore>();
}
