#pragma once

#include "core/store_errors.hpp"
#include "core/value_adapter.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <utility>

/**
 * @brief Stores any T as a JSON document in a string entry.
 *
 * The serializer turns a T into a JSON value; the deserializer revives it.
 * Use withDefaultCodec() for types that already provide nlohmann to_json /
 * from_json overloads.
 */
template <typename T>
class JsonAdapter : public ValueAdapter<T>
{
public:
    using Serializer = std::function<nlohmann::json(const T &)>;
    using Deserializer = std::function<T(const nlohmann::json &)>;

    JsonAdapter(Serializer serializer, Deserializer deserializer)
        : serializer_(std::move(serializer)), deserializer_(std::move(deserializer))
    {
        if (!serializer_ || !deserializer_)
        {
            throw PreconditionError("JsonAdapter requires both a serializer and a deserializer");
        }
    }

    static std::shared_ptr<const JsonAdapter<T>> withDefaultCodec()
    {
        return std::make_shared<JsonAdapter<T>>(
            [](const T &value)
            { return nlohmann::json(value); },
            [](const nlohmann::json &json)
            { return json.get<T>(); });
    }

    std::optional<T> read(const KeyValueStore &store, const std::string &key) const override
    {
        auto raw = store.getString(key);
        if (!raw)
            return std::nullopt;

        try
        {
            return deserializer_(nlohmann::json::parse(*raw));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw AdapterDecodeError(key, e.what());
        }
    }

    bool write(KeyValueStore &store, const std::string &key, const T &value) const override
    {
        return store.setString(key, serializer_(value).dump());
    }

    std::string representation() const override { return "json"; }

private:
    Serializer serializer_;
    Deserializer deserializer_;
};
