#pragma once

#include "core/value_adapter.hpp"
#include "logging/logger.hpp"
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Stores an enum by name.
 *
 * Names come from the table given at construction. A stored name that is not
 * in the table reads as absent, so the StoredValue falls back to its default.
 */
template <typename T>
class EnumAdapter : public ValueAdapter<T>
{
public:
    using NameTable = std::vector<std::pair<T, std::string>>;

    explicit EnumAdapter(NameTable names) : names_(std::move(names)) {}

    std::optional<T> read(const KeyValueStore &store, const std::string &key) const override
    {
        auto raw = store.getString(key);
        if (!raw)
            return std::nullopt;

        for (const auto &entry : names_)
        {
            if (entry.second == *raw)
                return entry.first;
        }
        Logger::debug("EnumAdapter: unknown name '" + *raw + "' stored under key " + key);
        return std::nullopt;
    }

    bool write(KeyValueStore &store, const std::string &key, const T &value) const override
    {
        for (const auto &entry : names_)
        {
            if (entry.first == value)
                return store.setString(key, entry.second);
        }
        Logger::error("EnumAdapter: value has no registered name, refusing to write key " + key);
        return false;
    }

    std::string representation() const override { return "enum_name"; }

private:
    NameTable names_;
};
