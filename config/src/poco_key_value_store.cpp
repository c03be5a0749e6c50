#include "poco_key_value_store.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    // Empty when the key has an empty segment ("", "a.", ".a", "a..b")
    std::vector<std::string> splitKey(const std::string &key)
    {
        std::vector<std::string> tokens;
        if (key.empty() || key.back() == '.')
        {
            return tokens;
        }

        std::stringstream ss(key);
        std::string token;

        while (std::getline(ss, token, '.'))
        {
            if (token.empty())
            {
                return {};
            }
            tokens.push_back(token);
        }

        return tokens;
    }

    void collectKeys(const nlohmann::json &node, const std::string &prefix, std::set<std::string> &keys)
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            const std::string path = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it.value().is_object())
            {
                collectKeys(it.value(), path, keys);
            }
            else
            {
                keys.insert(path);
            }
        }
    }
}

PocoKeyValueStore::PocoKeyValueStore()
    : autosave_(false)
{
    cfg_ = new JSONConfiguration();
}

PocoKeyValueStore::PocoKeyValueStore(const std::string &path, bool autosave)
    : path_(path), autosave_(autosave)
{
    cfg_ = new JSONConfiguration();
    if (std::filesystem::exists(path_))
    {
        if (!load(path_))
        {
            Logger::warn("PocoKeyValueStore: starting empty, could not load " + path_);
        }
    }
    else
    {
        Logger::info("PocoKeyValueStore: " + path_ + " does not exist yet, starting empty");
    }
}

bool PocoKeyValueStore::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        Logger::error("PocoKeyValueStore: cannot open " + path);
        return false;
    }

    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);

        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoKeyValueStore: failed to parse " + path + ": " + e.displayText());
        return false;
    }

    Logger::debug("PocoKeyValueStore: loaded " + path);
    return true;
}

bool PocoKeyValueStore::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked(path);
}

bool PocoKeyValueStore::reload()
{
    if (path_.empty())
    {
        return false;
    }
    return load(path_);
}

nlohmann::json PocoKeyValueStore::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return documentLocked();
}

std::set<std::string> PocoKeyValueStore::getKeys() const
{
    std::set<std::string> keys;
    std::lock_guard<std::mutex> lock(mutex_);
    collectKeys(documentLocked(), "", keys);
    return keys;
}

std::optional<bool> PocoKeyValueStore::getBool(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = findLocked(key);
    if (!value || !value->is_boolean())
    {
        return std::nullopt;
    }
    return value->get<bool>();
}

std::optional<int64_t> PocoKeyValueStore::getInt(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = findLocked(key);
    if (!value || !value->is_number_integer())
    {
        return std::nullopt;
    }
    return value->get<int64_t>();
}

std::optional<double> PocoKeyValueStore::getDouble(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = findLocked(key);
    // Whole doubles are written without a fraction, so any number qualifies
    if (!value || !value->is_number())
    {
        return std::nullopt;
    }
    return value->get<double>();
}

std::optional<std::string> PocoKeyValueStore::getString(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = findLocked(key);
    if (!value || !value->is_string())
    {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<std::vector<std::string>> PocoKeyValueStore::getStringList(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = findLocked(key);
    if (!value || !value->is_array())
    {
        return std::nullopt;
    }

    std::vector<std::string> result;
    for (const auto &item : *value)
    {
        if (!item.is_string())
        {
            return std::nullopt;
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

bool PocoKeyValueStore::setBool(const std::string &key, bool value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(key, value);
}

bool PocoKeyValueStore::setInt(const std::string &key, int64_t value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(key, value);
}

bool PocoKeyValueStore::setDouble(const std::string &key, double value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(key, value);
}

bool PocoKeyValueStore::setString(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(key, value);
}

bool PocoKeyValueStore::setStringList(const std::string &key, const std::vector<std::string> &values)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(key, nlohmann::json(values));
}

bool PocoKeyValueStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto parts = splitKey(key);
    if (parts.empty())
    {
        Logger::error("PocoKeyValueStore: refusing to remove malformed key '" + key + "'");
        return false;
    }

    auto document = documentLocked();
    nlohmann::json *current = &document;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        auto it = current->find(parts[i]);
        if (it == current->end() || !it->is_object())
        {
            return true; // nothing stored under this key
        }
        current = &*it;
    }

    auto target = current->find(parts.back());
    if (target == current->end())
    {
        return true;
    }
    if (target->is_object() && !target->empty())
    {
        Logger::error("PocoKeyValueStore: cannot remove " + key + ", it holds nested keys");
        return false;
    }

    current->erase(target);
    return commitLocked(document);
}

bool PocoKeyValueStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!commitLocked(nlohmann::json::object()))
    {
        return false;
    }
    Logger::debug("PocoKeyValueStore: cleared all keys");
    return true;
}

nlohmann::json PocoKeyValueStore::documentLocked() const
{
    std::stringstream ss;
    cfg_->save(ss);

    const auto text = ss.str();
    if (text.empty())
    {
        return nlohmann::json::object();
    }

    try
    {
        return nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("PocoKeyValueStore: stored document is not valid JSON: " + std::string(e.what()));
        return nlohmann::json::object();
    }
}

std::optional<nlohmann::json> PocoKeyValueStore::findLocked(const std::string &key) const
{
    auto parts = splitKey(key);
    if (parts.empty())
    {
        return std::nullopt;
    }

    auto document = documentLocked();
    const nlohmann::json *current = &document;

    for (const auto &part : parts)
    {
        if (!current->is_object())
        {
            return std::nullopt;
        }
        auto it = current->find(part);
        if (it == current->end())
        {
            return std::nullopt;
        }
        current = &*it;
    }

    return *current;
}

bool PocoKeyValueStore::saveLocked(const std::string &path) const
{
    return writeConfig(*cfg_, path);
}

bool PocoKeyValueStore::writeConfig(const JSONConfiguration &cfg, const std::string &path)
{
    std::ofstream out(path);
    if (!out)
    {
        Logger::error("PocoKeyValueStore: cannot write " + path);
        return false;
    }

    try
    {
        cfg.save(out);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoKeyValueStore: failed to save " + path + ": " + e.displayText());
        return false;
    }

    return static_cast<bool>(out);
}

bool PocoKeyValueStore::commitLocked(const nlohmann::json &document)
{
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        std::istringstream in(document.dump());
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoKeyValueStore: failed to apply update: " + e.displayText());
        return false;
    }

    if (autosave_ && !path_.empty() && !writeConfig(*tmp, path_))
    {
        return false;
    }

    cfg_ = tmp;
    return true;
}

bool PocoKeyValueStore::writeLocked(const std::string &key, nlohmann::json value)
{
    auto parts = splitKey(key);
    if (parts.empty())
    {
        Logger::error("PocoKeyValueStore: refusing to write malformed key '" + key + "'");
        return false;
    }

    auto document = documentLocked();
    nlohmann::json *current = &document;
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        nlohmann::json &child = (*current)[parts[i]];
        if (child.is_null())
        {
            child = nlohmann::json::object();
        }
        else if (!child.is_object())
        {
            Logger::error("PocoKeyValueStore: cannot write " + key + ", " + parts[i] + " holds a value");
            return false;
        }
        current = &child;
    }

    auto target = current->find(parts.back());
    if (target != current->end() && target->is_object() && !target->empty())
    {
        Logger::error("PocoKeyValueStore: cannot write " + key + ", it holds nested keys");
        return false;
    }

    (*current)[parts.back()] = std::move(value);
    return commitLocked(document);
}
