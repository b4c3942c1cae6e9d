// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file errors.hpp
/// @brief Exception types and error events surfaced by a session

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace claudecode
{

// =============================================================================
// Exceptions
// =============================================================================

/// Base class for SDK errors that are not transport failures
class ClaudeSdkError : public std::runtime_error
{
  public:
    explicit ClaudeSdkError(const std::string& message) : std::runtime_error(message) {}
};

/// The agent process is not connected, or the connection broke
class CliConnectionError : public ClaudeSdkError
{
  public:
    explicit CliConnectionError(const std::string& message) : ClaudeSdkError(message) {}

    CliConnectionError(const std::string& message, const std::string& cause)
        : ClaudeSdkError(message + ": " + cause)
    {
    }
};

/// A line from the agent process could not be decoded as a JSON object
class JsonDecodeError : public ClaudeSdkError
{
  public:
    JsonDecodeError(const std::string& message, std::string line)
        : ClaudeSdkError(message + " (line: " + line + ")"), line_(std::move(line))
    {
    }

    const std::string& line() const
    {
        return line_;
    }

  private:
    std::string line_;
};

/// The far side answered an outbound control request with an error response
class ControlRequestError : public ClaudeSdkError
{
  public:
    ControlRequestError(std::string request_id, const std::string& message)
        : ClaudeSdkError(message), request_id_(std::move(request_id))
    {
    }

    const std::string& request_id() const
    {
        return request_id_;
    }

  private:
    std::string request_id_;
};

/// No control response arrived before the deadline
class ControlTimeoutError : public ControlRequestError
{
  public:
    explicit ControlTimeoutError(std::string request_id)
        : ControlRequestError(request_id, "Control request timed out: " + request_id)
    {
    }
};

// =============================================================================
// Error events
// =============================================================================

/// Classification of failures delivered through the error sink
enum class ErrorKind
{
    /// Transport unavailable or broken; terminates the session
    Connection,
    /// Malformed line; skipped
    Decode,
    /// Unknown request kind or missing callback id
    Dispatch,
    /// A consumer-supplied callback failed
    Callback,
    /// Response without a matching request, or a reused request id
    Protocol,
};

inline const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Connection:
        return "connection";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::Dispatch:
        return "dispatch";
    case ErrorKind::Callback:
        return "callback";
    case ErrorKind::Protocol:
        return "protocol";
    }
    return "unknown";
}

/// A non-fatal (or terminal, for Connection) failure observed by the read loop
struct ErrorEvent
{
    ErrorKind kind = ErrorKind::Decode;
    std::string message;
    /// The offending input line, when the error came from one
    std::optional<std::string> raw_line;
};

} // namespace claudecode
