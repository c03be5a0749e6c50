#include <iostream>
#include "core/combine_latest.hpp"
#include "core/streaming_key_value_store.hpp"
#include "poco_key_value_store.hpp"

/**
 * Example demonstrating a persisted, observable store
 *
 * This example shows how to:
 * 1. Open a JSON file as the backing store
 * 2. Follow a single key as it changes
 * 3. Combine several keys into one stream of snapshots
 * 4. Watch the key listing itself
 */

int main()
{
    std::cout << "=== Store Persistence Example ===\n\n";

    Logger::init("WARN");
    auto backend = std::make_shared<PocoKeyValueStore>("example_store.json");
    StreamingKeyValueStore store(backend);

    // Example 1: follow one key
    std::cout << "1. Following \"user.name\"...\n";
    auto name = store.getString("user.name", "anonymous");
    auto name_subscription = name.subscribe([](const std::string &value)
                                            { std::cout << "   name -> " << value << "\n"; });

    store.setString("user.name", "alice");
    name.set("bob");
    std::cout << "\n";

    // Example 2: combine several keys
    std::cout << "2. Combining name and visit count...\n";
    auto visits = store.getInt("user.visits", 0);

    StreamObserver<CombinedSnapshot> observer;
    observer.on_next = [](const CombinedSnapshot &snapshot)
    {
        std::cout << "   snapshot: " << snapshot.get<std::string>(0)
                  << ", visits=" << snapshot.get<int64_t>(1) << "\n";
    };
    CombineLatest combined({name, visits}, observer);

    visits.set(1);
    visits.set(1); // identical repeat, no snapshot
    visits.set(2);
    std::cout << "\n";

    // Example 3: the key listing
    std::cout << "3. Watching the key listing...\n";
    auto keys_subscription = store.getKeys().subscribe([](const std::set<std::string> &keys)
                                                       { std::cout << "   " << keys.size() << " key(s)\n"; });

    store.setBool("user.verified", true);
    store.remove("user.verified");
    std::cout << "\n";

    std::cout << "Stored document: " << backend->getAll().dump() << "\n";
    std::cout << "=== Example completed ===\n";
    return 0;
}
