#include "core/combine_latest.hpp"
#include "core/distinct_values.hpp"
#include "core/log_level_binding.hpp"
#include "core/memory_key_value_store.hpp"
#include "core/store_session.hpp"
#include "core/subscription_rate_guard.hpp"
#include "logging/logger.hpp"
#include "poco_key_value_store.hpp"
#include "store_file_watcher.hpp"
#include "store_settings.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
    volatile sig_atomic_t g_stop_requested = 0;

    void handleSignal(int)
    {
        g_stop_requested = 1;
    }

    const std::string kUnset = "(unset)";

    /**
     * Renders whatever primitive is stored under a key as text, so watch and
     * get work without knowing the key's type.
     */
    class DisplayAdapter : public ValueAdapter<std::string>
    {
    public:
        std::optional<std::string> read(const KeyValueStore &store, const std::string &key) const override
        {
            if (auto value = store.getBool(key))
                return std::string(*value ? "true" : "false");
            if (auto value = store.getInt(key))
                return std::to_string(*value);
            if (auto value = store.getDouble(key))
            {
                std::ostringstream out;
                out << *value;
                return out.str();
            }
            if (auto value = store.getString(key))
                return "\"" + *value + "\"";
            if (auto values = store.getStringList(key))
                return joinList(*values);
            return std::nullopt;
        }

        bool write(KeyValueStore &, const std::string &key, const std::string &) const override
        {
            Logger::error("Display values are read-only: " + key);
            return false;
        }

        std::string representation() const override { return "display"; }

        static std::string joinList(const std::vector<std::string> &values)
        {
            std::string out = "[";
            for (size_t i = 0; i < values.size(); ++i)
            {
                if (i > 0)
                    out += ", ";
                out += "\"" + values[i] + "\"";
            }
            return out + "]";
        }
    };

    void printUsage(const char *program)
    {
        std::cout << "Streaming Store - reactive key-value store tool" << std::endl;
        std::cout << "Usage: " << program << " [options] <command> [args]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --settings <file>   YAML settings file" << std::endl;
        std::cout << "  --store <file>      JSON store file (overrides storage.path)" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  get <key>                       Print the value stored under key" << std::endl;
        std::cout << "  set <key> <value> [--type T]    T is bool, int, double, string (default) or list" << std::endl;
        std::cout << "  remove <key>                    Remove key" << std::endl;
        std::cout << "  keys                            List all keys" << std::endl;
        std::cout << "  clear                           Remove every key" << std::endl;
        std::cout << "  watch [keys...]                 Print changes until interrupted" << std::endl;
    }

    std::vector<std::string> splitList(const std::string &value)
    {
        std::vector<std::string> items;
        if (value.empty())
            return items;

        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ','))
            items.push_back(item);
        return items;
    }

    bool setTyped(StreamingKeyValueStore &store, const std::string &key, const std::string &value,
                  const std::string &type)
    {
        if (type == "string")
            return store.setString(key, value);
        if (type == "bool")
        {
            if (value == "true" || value == "1")
                return store.setBool(key, true);
            if (value == "false" || value == "0")
                return store.setBool(key, false);
            throw std::invalid_argument("not a boolean: " + value);
        }
        if (type == "int")
        {
            size_t consumed = 0;
            int64_t parsed = std::stoll(value, &consumed);
            if (consumed != value.size())
                throw std::invalid_argument("not an integer: " + value);
            return store.setInt(key, parsed);
        }
        if (type == "double")
        {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed != value.size())
                throw std::invalid_argument("not a number: " + value);
            return store.setDouble(key, parsed);
        }
        if (type == "list")
            return store.setStringList(key, splitList(value));

        throw std::invalid_argument("unknown type: " + type);
    }

    StoredValue<std::string> displayValue(const StreamingKeyValueStore &store, const std::string &key)
    {
        static const std::shared_ptr<const DisplayAdapter> adapter = std::make_shared<DisplayAdapter>();
        return store.getCustomValue<std::string>(key, kUnset, adapter);
    }

    int watch(StreamingKeyValueStore &store, const std::vector<std::string> &keys)
    {
        std::shared_ptr<Subscription> subscription;

        if (keys.empty())
        {
            auto print = [](const std::set<std::string> &all)
            {
                std::cout << "keys:";
                for (const auto &key : all)
                    std::cout << " " << key;
                std::cout << std::endl;
            };

            // The distinct stream is seeded with this read, so it is printed here
            auto view = store.getKeys();
            auto current = view.currentValue();
            print(current);

            StreamObserver<std::set<std::string>> observer;
            observer.on_next = print;
            subscription = distinct(view).subscribe(std::move(observer), current);
        }
        else
        {
            std::vector<CombinedInput> inputs;
            for (const auto &key : keys)
                inputs.emplace_back(displayValue(store, key));

            StreamObserver<CombinedSnapshot> observer;
            observer.on_next = [keys](const CombinedSnapshot &snapshot)
            {
                std::string line;
                for (size_t i = 0; i < snapshot.size(); ++i)
                {
                    if (i > 0)
                        line += "  ";
                    line += keys[i] + "=" + (snapshot.has(i) ? snapshot.get<std::string>(i) : kUnset);
                }
                std::cout << line << std::endl;
            };
            observer.on_error = [](std::exception_ptr error)
            {
                std::cerr << "watch error: " << describeException(error) << std::endl;
            };
            subscription = std::make_shared<CombineLatest>(std::move(inputs), std::move(observer));
        }

        while (!g_stop_requested)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        subscription->cancel();
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string settings_path;
    std::string store_path_override;
    std::string value_type = "string";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--settings" || arg == "--store" || arg == "--type") && i + 1 < argc)
        {
            std::string value = argv[++i];
            if (arg == "--settings")
                settings_path = value;
            else if (arg == "--store")
                store_path_override = value;
            else
                value_type = value;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init("INFO");
    StoreSettings settings = settings_path.empty() ? StoreSettings{} : loadStoreSettings(settings_path);
    if (!store_path_override.empty())
        settings.storage_path = store_path_override;
    Logger::init(settings.log_level);

    auto &rate_guard = SubscriptionRateGuard::getInstance();
    rate_guard.setEnabled(settings.rate_guard_enabled);
    rate_guard.setWindow(settings.rate_guard_window);

    std::shared_ptr<PocoKeyValueStore> file_store;
    if (!settings.storage_path.empty())
        file_store = std::make_shared<PocoKeyValueStore>(settings.storage_path, settings.storage_autosave);
    else
        Logger::warn("No storage path configured, changes will not be persisted");

    StoreSession::setStoreFactory([file_store]() -> std::shared_ptr<KeyValueStore>
                                  {
        if (file_store)
            return file_store;
        return std::make_shared<MemoryKeyValueStore>(); });

    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    try
    {
        auto store = StoreSession::get();
        LogLevelBinding log_level_binding(*store, "log_level", settings.log_level);

        bool ok = true;
        if (command == "get" && args.size() == 1)
        {
            std::cout << displayValue(*store, args[0]).currentValue() << std::endl;
        }
        else if (command == "set" && args.size() == 2)
        {
            ok = setTyped(*store, args[0], args[1], value_type);
        }
        else if (command == "remove" && args.size() == 1)
        {
            ok = store->remove(args[0]);
        }
        else if (command == "keys" && args.empty())
        {
            for (const auto &key : store->getKeys().currentValue())
                std::cout << key << std::endl;
        }
        else if (command == "clear" && args.empty())
        {
            ok = store->clear();
        }
        else if (command == "watch")
        {
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);

            std::unique_ptr<StoreFileWatcher> watcher;
            if (file_store)
            {
                watcher = std::make_unique<StoreFileWatcher>(file_store, store, settings.watcher_interval);
                watcher->start();
            }
            return watch(*store, args);
        }
        else
        {
            std::cerr << "Error: invalid command or arguments: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (ok && file_store && !settings.storage_autosave)
            ok = file_store->save(settings.storage_path);

        if (!ok)
        {
            std::cerr << "Error: " << command << " failed" << std::endl;
            return 1;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Command " + command + " failed: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
