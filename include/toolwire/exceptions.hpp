#pragma once
#include "toolwire/types.hpp"

#include <stdexcept>
#include <string>

namespace toolwire
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Closed set of transport failure causes raised by the client.
enum class TransportErrorKind
{
    SpawnFailed,       ///< Child process could not be started
    NotConnected,      ///< Operation issued before connect() or after disconnect()
    BrokenPipe,        ///< Writing to the child failed
    Closed,            ///< Child closed its output before answering
    Timeout,           ///< No answer within the request deadline
    MalformedResponse, ///< Unparsable JSON, wrong envelope or mismatched id
    ProcessExited      ///< Child exited while a request was outstanding
};

inline const char* to_string(TransportErrorKind kind)
{
    switch (kind)
    {
    case TransportErrorKind::SpawnFailed:
        return "spawn_failed";
    case TransportErrorKind::NotConnected:
        return "not_connected";
    case TransportErrorKind::BrokenPipe:
        return "broken_pipe";
    case TransportErrorKind::Closed:
        return "closed";
    case TransportErrorKind::Timeout:
        return "timeout";
    case TransportErrorKind::MalformedResponse:
        return "malformed_response";
    case TransportErrorKind::ProcessExited:
        return "process_exited";
    }
    return "unknown";
}

struct TransportError : public Error
{
    TransportError(TransportErrorKind kind, const std::string& message)
        : Error(message), kind_(kind)
    {
    }

    TransportErrorKind kind() const
    {
        return kind_;
    }

  private:
    TransportErrorKind kind_;
};

/// A well-formed JSON-RPC error payload returned by the peer.
struct ProtocolError : public Error
{
    ProtocolError(int code, const std::string& message, Json data = nullptr)
        : Error(message), code_(code), data_(std::move(data))
    {
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

} // namespace toolwire
