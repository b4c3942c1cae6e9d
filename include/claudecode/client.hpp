// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file client.hpp
/// @brief Client: consumer-facing facade over a control-protocol session

#include <chrono>
#include <claudecode/control.hpp>
#include <claudecode/errors.hpp>
#include <claudecode/session.hpp>
#include <claudecode/transport.hpp>
#include <claudecode/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace claudecode
{

// =============================================================================
// Message Builder Helpers (for unit testing message JSON shape)
// =============================================================================

/// Build the line sent for a user prompt:
/// `{"type":"user","message":{"role":"user","content":...},"parent_tool_use_id":null,"session_id":...}`
ordered_json build_user_message(const std::string& prompt, const std::string& session_id = "default");

// =============================================================================
// Client - Main client class
// =============================================================================

/// Client for an agent process reached over a line-delimited JSON transport
///
/// Spawning the agent is the caller's job; the client is handed the transport
/// connected to it.
///
/// Errors never hold up the message stream: when nobody drains them the oldest
/// ones are dropped, so a consumer may read messages only.
///
/// Example usage:
/// @code
/// SessionOptions opts;
/// opts.can_use_tool = [](const std::string& tool, const json&, const ToolPermissionContext&)
///     -> PermissionResult { return PermissionResultAllow{}; };
///
/// Client client(opts);
/// client.connect(std::make_unique<PipeTransport>(from_agent_fd, to_agent_fd));
/// client.send_message("Hello!");
/// for (const auto& message : client.receive_response())
///     std::cout << message.dump() << std::endl;
/// while (auto error = client.receive_error_for(std::chrono::milliseconds(0)))
///     std::cerr << error->message << std::endl;
/// client.close();
/// @endcode
class Client
{
  public:
    explicit Client(SessionOptions options = {});

    /// Destructor - closes the session if connected
    ~Client();

    // Non-copyable, non-movable (owns unique resources)
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    // =========================================================================
    // Connection Management
    // =========================================================================

    /// Start a session over `transport`
    /// @throws CliConnectionError if already connected
    /// @throws ControlRequestError if the initialize handshake fails
    void connect(std::unique_ptr<ITransport> transport);

    /// Close the session. Safe to call when not connected and repeatedly.
    void close();

    /// True while connected and the agent stream is open
    bool is_connected() const;

    /// Reply to the initialize handshake, if one was performed
    std::optional<json> server_info() const;

    // =========================================================================
    // Sending
    // =========================================================================

    /// Send a user prompt
    /// @throws CliConnectionError if not connected
    void send_message(const std::string& prompt, const std::string& session_id = "default");

    /// Send an arbitrary JSON object as one line
    /// @throws CliConnectionError if not connected
    /// @throws std::invalid_argument if `message` is not an object
    void send_raw_message(const json& message);

    /// Interrupt the current turn
    /// @return The id of the interrupt control request
    /// @throws CliConnectionError if not connected
    std::string interrupt();

    /// Change the agent's permission mode and wait for the acknowledgement
    /// @throws CliConnectionError if not connected
    /// @throws ControlRequestError if the agent rejects the change or does not answer in time
    void set_permission_mode(PermissionMode mode);

    // =========================================================================
    // Receiving
    // =========================================================================

    /// Next conversation message; blocks until one arrives
    /// @return std::nullopt when not connected or once the session has ended
    std::optional<json> receive_message();

    /// Like receive_message(), but gives up after `timeout`
    std::optional<json> receive_message_for(std::chrono::milliseconds timeout);

    /// Next error event; blocks until one arrives
    /// @return std::nullopt when not connected or once the session has ended
    std::optional<ErrorEvent> receive_error();

    /// Like receive_error(), but gives up after `timeout` (zero polls)
    std::optional<ErrorEvent> receive_error_for(std::chrono::milliseconds timeout);

    /// Collect the messages of one turn, up to and including the `result` message
    /// @return Fewer messages and no result if the session ends first; empty when not connected
    std::vector<json> receive_response();

  private:
    std::shared_ptr<Session> session() const;
    std::shared_ptr<Session> connected_session() const;

    SessionOptions options_;
    mutable std::mutex mutex_;
    std::shared_ptr<Session> session_;
};

// =============================================================================
// One-shot Query
// =============================================================================

/// Everything one prompt produced
struct QueryResult
{
    /// Messages up to and including `result`
    std::vector<json> messages;
    /// Errors reported while the turn ran
    std::vector<ErrorEvent> errors;
};

/// Run a single prompt over `transport` and close the session afterwards
///
/// @throws CliConnectionError / ControlRequestError as Client::connect() does
QueryResult query(std::unique_ptr<ITransport> transport, const std::string& prompt, SessionOptions options = {});

} // namespace claudecode
