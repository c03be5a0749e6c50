#pragma once

#include "core/key_value_store.hpp"
#include <optional>
#include <string>

/**
 * @brief Translates a typed value to and from the primitive representation
 * held by a KeyValueStore.
 *
 * @tparam T the value type exposed to callers
 */
template <typename T>
class ValueAdapter
{
public:
    virtual ~ValueAdapter() = default;

    /**
     * @brief Read the value stored under key
     * @return std::nullopt when nothing is stored
     */
    virtual std::optional<T> read(const KeyValueStore &store, const std::string &key) const = 0;

    /**
     * @brief Write value under key
     * @return true if the store accepted the write
     */
    virtual bool write(KeyValueStore &store, const std::string &key, const T &value) const = 0;

    /**
     * @brief Name of the primitive encoding used by this adapter.
     *
     * Two adapters for the same T that encode differently must return
     * different names; StoredValue equality relies on it.
     */
    virtual std::string representation() const = 0;
};
