#pragma once
#include "mcphub/types.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace mcphub
{

/// Tag carried by every failure surfaced to callers of the registry
enum class ErrorKind
{
    Unknown,
    UnknownServer,
    Disabled,
    Validation,
    Spawn,
    Timeout,
    NotConnected,
    Transport,
    Remote,
    Cancelled
};

inline std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnknownServer:
        return "UnknownServer";
    case ErrorKind::Disabled:
        return "Disabled";
    case ErrorKind::Validation:
        return "Validation";
    case ErrorKind::Spawn:
        return "SpawnError";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::NotConnected:
        return "NotConnected";
    case ErrorKind::Transport:
        return "TransportError";
    case ErrorKind::Remote:
        return "RemoteError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::Unknown:
        break;
    }
    return "Unknown";
}

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;

    virtual ErrorKind kind() const noexcept
    {
        return ErrorKind::Unknown;
    }
};

struct ValidationError : public Error
{
    using Error::Error;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Validation;
    }
};

/// Unknown or disabled server; never retried
struct ConfigError : public Error
{
    using Error::Error;
};

struct UnknownServerError : public ConfigError
{
    using ConfigError::ConfigError;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::UnknownServer;
    }
};

struct DisabledServerError : public ConfigError
{
    using ConfigError::ConfigError;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Disabled;
    }
};

/// The child process could not be launched
class SpawnError : public Error
{
  public:
    SpawnError(const std::string& message, std::string command)
        : Error(message), command_(std::move(command))
    {
    }

    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Spawn;
    }

    const std::string& command() const
    {
        return command_;
    }

  private:
    std::string command_;
};

struct TimeoutError : public Error
{
    using Error::Error;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Timeout;
    }
};

/// Stream closed unexpectedly or a malformed frame arrived; the connection is gone
struct TransportError : public Error
{
    using Error::Error;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Transport;
    }
};

struct NotConnectedError : public Error
{
    using Error::Error;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::NotConnected;
    }
};

struct CancelledError : public Error
{
    using Error::Error;
    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Cancelled;
    }
};

/// JSON-RPC error object returned by the server. The connection stays usable.
class RemoteError : public Error
{
  public:
    RemoteError(int code, const std::string& message, Json data = nullptr)
        : Error(message), code_(code), data_(std::move(data))
    {
    }

    ErrorKind kind() const noexcept override
    {
        return ErrorKind::Remote;
    }

    int code() const
    {
        return code_;
    }

    const Json& data() const
    {
        return data_;
    }

  private:
    int code_;
    Json data_;
};

inline ErrorKind error_kind(const std::exception& e)
{
    if (auto* err = dynamic_cast<const Error*>(&e))
        return err->kind();
    return ErrorKind::Unknown;
}

} // namespace mcphub
