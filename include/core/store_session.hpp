#pragma once

#include "core/key_value_store.hpp"
#include "core/streaming_key_value_store.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>

/**
 * @brief Process-wide StreamingKeyValueStore, created on first use.
 *
 * The first call to instance() starts opening the backing store on a worker
 * thread; every caller, including concurrent ones, shares that single
 * initialization future. The session is never reset implicitly.
 */
class StoreSession
{
public:
    using StoreFactory = std::function<std::shared_ptr<KeyValueStore>()>;
    using SessionFuture = std::shared_future<std::shared_ptr<StreamingKeyValueStore>>;

    /**
     * @brief Choose how the backing store is opened
     * @return false if initialization already started; the factory is ignored then
     */
    static bool setStoreFactory(StoreFactory factory);

    static SessionFuture instance();

    // Blocks until the session is ready; rethrows an initialization failure
    static std::shared_ptr<StreamingKeyValueStore> get();

    static bool isInitialized();

    // Close the current session and forget it. Test teardown only.
    static void resetForTesting();

private:
    static std::shared_ptr<KeyValueStore> openDefaultStore();

    static std::mutex mutex_;
    static StoreFactory factory_;
    static SessionFuture future_;
};
