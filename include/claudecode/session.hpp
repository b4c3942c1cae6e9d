// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session.hpp
/// @brief Session: one control-protocol connection to an agent process

#include <atomic>
#include <chrono>
#include <claudecode/callback_registry.hpp>
#include <claudecode/control.hpp>
#include <claudecode/dispatcher.hpp>
#include <claudecode/errors.hpp>
#include <claudecode/sink.hpp>
#include <claudecode/transport.hpp>
#include <claudecode/types.hpp>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace claudecode
{

// =============================================================================
// Session - control-protocol multiplexer over one transport
// =============================================================================

/// Owns the line stream to an agent process and multiplexes it
///
/// A background read loop decodes one JSON object per line and routes it:
/// - `control_request` lines are handled by the ControlDispatcher on their own
///   task, so a slow callback never delays later lines;
/// - `control_response` lines complete the matching outbound request;
/// - everything else is queued on the message sink in arrival order.
///
/// Malformed lines, unmatched responses and transport failure are queued on
/// the error sink. When the stream ends both sinks are closed.
///
/// Example usage:
/// @code
/// auto session = std::make_unique<Session>(std::move(transport), options);
/// session->start();
/// while (auto message = session->receive_message())
///     handle(*message);
/// session->close();
/// @endcode
///
/// Callbacks must not call close() on the session that invoked them.
class Session
{
  public:
    /// Create a session over `transport` (takes ownership)
    /// @throws std::invalid_argument if transport is null
    Session(std::unique_ptr<ITransport> transport, SessionOptions options = {});

    ~Session();

    // Non-copyable, non-movable (due to mutex/thread)
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Seal the callback registry and start the read loop.
    /// With `SessionOptions::initialize` set, also performs the initialize
    /// handshake and waits for its reply.
    /// @throws CliConnectionError if the session was already started or closed
    /// @throws ControlRequestError if the initialize handshake fails
    void start();

    /// Stop the read loop, close the transport and both sinks, wait for
    /// in-flight callbacks and fail pending requests. Idempotent.
    void close();

    /// True while the read loop is running
    bool is_running() const
    {
        return running_;
    }

    bool is_closed() const
    {
        return closed_;
    }

    /// Registry of callbacks; mutable only until start()
    CallbackRegistry& registry()
    {
        return registry_;
    }

    const SessionOptions& options() const
    {
        return options_;
    }

    /// Reply to the initialize handshake, if one was performed
    const std::optional<json>& initialize_result() const
    {
        return initialize_result_;
    }

    // =========================================================================
    // Consumer side
    // =========================================================================

    /// Next conversation message; blocks while none is queued
    /// @return std::nullopt once the session has ended and the sink is drained
    std::optional<json> receive_message()
    {
        return messages_.pop();
    }

    /// Next error event; blocks while none is queued
    /// @return std::nullopt once the session has ended and the sink is drained
    std::optional<ErrorEvent> receive_error()
    {
        return errors_.pop();
    }

    BoundedQueue<json>& messages()
    {
        return messages_;
    }

    BoundedQueue<ErrorEvent>& errors()
    {
        return errors_;
    }

    // =========================================================================
    // Outbound
    // =========================================================================

    /// Write one already-serialized JSON object as a line
    /// @throws CliConnectionError if the session is not running or the write fails
    void send_line(const std::string& line);

    /// Send a control request without waiting for its reply
    /// @return The request id that was written
    /// @throws CliConnectionError if the session is not running or the write fails
    std::string send_control_request(ControlRequestKind kind, const json& payload = json::object());

    /// Send a control request and obtain its reply
    /// @param timeout Overrides `SessionOptions::control_timeout`; zero waits forever
    /// @return Future resolved with the `response` object of a success reply.
    ///         Fails with ControlRequestError on an error reply, ControlTimeoutError
    ///         on timeout, and ConnectionClosedError when the session ends first.
    /// @throws CliConnectionError if the session is not running or the write fails
    std::future<json> request(
        ControlRequestKind kind,
        const json& payload = json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// Ask the agent to interrupt the current turn (fire-and-forget)
    /// @return The request id that was written
    std::string interrupt()
    {
        return send_control_request(ControlRequestKind::Interrupt);
    }

    /// Change the agent's permission mode
    std::future<json> set_permission_mode(PermissionMode mode)
    {
        return request(ControlRequestKind::SetPermissionMode, json{{"mode", mode}});
    }

    /// Number of outbound requests awaiting a reply
    size_t pending_request_count() const
    {
        return pending_.size();
    }

  private:
    void read_loop();
    void timeout_loop();
    void handle_line(const std::string& line);
    void handle_response(const json& message, const std::string& line);
    void spawn_dispatch(json message);
    void run_dispatch(const json& message, const std::string& request_id);
    void reap_finished_tasks();
    void wait_for_tasks();
    void finish_read_loop();
    void report_error(ErrorKind kind, std::string message, std::optional<std::string> raw_line = std::nullopt);
    void write_line(const std::string& line);
    void wake_timeout_thread();
    void ensure_running() const;

    SessionOptions options_;
    std::unique_ptr<ITransport> transport_;
    LineFramer framer_;
    CallbackRegistry registry_;
    ControlDispatcher dispatcher_;
    BoundedQueue<json> messages_;
    BoundedQueue<ErrorEvent> errors_;
    RequestIdGenerator request_ids_;
    PendingControlRequests pending_;
    std::optional<json> initialize_result_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> closed_{false};

    std::mutex write_mutex_;
    std::thread read_thread_;

    // Deadline tracking for outbound requests
    std::thread timeout_thread_;
    std::mutex timeout_mutex_;
    std::condition_variable timeout_cv_;
    bool stop_timeouts_ = false;

    // In-flight dispatcher tasks
    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
    std::set<std::string> inflight_ids_;
};

} // namespace claudecode
