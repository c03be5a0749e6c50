#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised synchronously, before any store or bus access, when a caller
 * breaks an API precondition (mutating the aggregate key view, passing a null
 * adapter, using an empty key).
 */
class PreconditionError : public std::logic_error
{
public:
    explicit PreconditionError(const std::string &message)
        : std::logic_error(message) {}
};

/**
 * @brief Raised by an adapter when a stored primitive cannot be decoded into
 * the requested type.
 */
class AdapterDecodeError : public std::runtime_error
{
public:
    AdapterDecodeError(const std::string &key, const std::string &reason)
        : std::runtime_error("Failed to decode value for key '" + key + "': " + reason),
          key_(key) {}

    const std::string &key() const { return key_; }

private:
    std::string key_;
};

#include <exception>

/**
 * @brief Render an exception_ptr as a log-friendly message
 */
inline std::string describeException(const std::exception_ptr &error)
{
    if (!error)
        return "no error";
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (const std::string &message)
    {
        return message;
    }
    catch (const char *message)
    {
        return message;
    }
    catch (...)
    {
        return "unknown exception";
    }
}
