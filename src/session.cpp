// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <claudecode/log.hpp>
#include <claudecode/session.hpp>
#include <spdlog/spdlog.h>

namespace claudecode
{

// =============================================================================
// Helper functions
// =============================================================================

static ITransport& require_transport(const std::unique_ptr<ITransport>& transport)
{
    if (!transport)
        throw std::invalid_argument("Session requires a transport");
    return *transport;
}

static std::chrono::milliseconds acknowledgement_timeout(const SessionOptions& options)
{
    constexpr std::chrono::milliseconds kDefault{60000};
    return options.acknowledgement_timeout.count() > 0 ? options.acknowledgement_timeout : kDefault;
}

static std::string request_id_of(const json& message)
{
    auto it = message.find("request_id");
    if (it == message.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

// =============================================================================
// Session Implementation
// =============================================================================

Session::Session(std::unique_ptr<ITransport> transport, SessionOptions options)
    : options_(std::move(options)), transport_(std::move(transport)),
      framer_(require_transport(transport_), options_.max_line_size), registry_(options_),
      dispatcher_(registry_), messages_(options_.message_queue_capacity),
      errors_(options_.error_queue_capacity)
{
    if (options_.log_level)
        log::set_level(*options_.log_level);
}

Session::~Session()
{
    close();
}

void Session::start()
{
    if (closed_)
        throw CliConnectionError("Session is closed");
    if (started_.exchange(true))
        throw CliConnectionError("Session already started");

    // The registry is read-only from here on, before any dispatch can happen
    registry_.seal();

    running_ = true;
    read_thread_ = std::thread([this] { read_loop(); });
    timeout_thread_ = std::thread([this] { timeout_loop(); });

    log::logger()->debug(
        "session started ({} hook callbacks, permission callback {})",
        registry_.hook_count(),
        registry_.permission_callback() ? "set" : "unset"
    );

    if (options_.initialize)
    {
        json hooks = registry_.hook_count() > 0 ? registry_.hooks_config() : json(nullptr);
        initialize_result_ = request(ControlRequestKind::Initialize, json{{"hooks", hooks}}).get();
        log::logger()->debug("initialize handshake complete");
    }
}

void Session::close()
{
    if (closed_.exchange(true))
        return;

    cancelled_ = true;

    // Close transport to unblock the read loop
    try
    {
        transport_->close();
    }
    catch (const std::exception& e)
    {
        log::logger()->warn("error closing transport: {}", e.what());
    }

    // Wake consumers and a read loop blocked on a full sink
    messages_.close();
    errors_.close();

    if (read_thread_.joinable())
        read_thread_.join();

    {
        std::lock_guard<std::mutex> lock(timeout_mutex_);
        stop_timeouts_ = true;
    }
    timeout_cv_.notify_all();
    if (timeout_thread_.joinable())
        timeout_thread_.join();

    wait_for_tasks();

    running_ = false;
    pending_.fail_all(std::make_exception_ptr(ConnectionClosedError("Session closed")));

    log::logger()->debug("session closed");
}

// =============================================================================
// Read loop
// =============================================================================

void Session::read_loop()
{
    while (!cancelled_)
    {
        std::optional<std::string> line;
        try
        {
            line = framer_.read_line();
        }
        catch (const LineTooLongError& e)
        {
            report_error(ErrorKind::Decode, e.what(), e.prefix());
            continue;
        }
        catch (const std::exception& e)
        {
            if (!cancelled_)
                report_error(ErrorKind::Connection, std::string("Failed to read from agent: ") + e.what());
            break;
        }

        if (!line)
        {
            if (!cancelled_)
                log::logger()->info("agent closed the stream");
            break;
        }

        handle_line(*line);
    }

    finish_read_loop();
}

void Session::finish_read_loop()
{
    running_ = false;
    pending_.fail_all(std::make_exception_ptr(ConnectionClosedError("Connection closed")));
    messages_.close();
    errors_.close();
}

void Session::handle_line(const std::string& line)
{
    if (line.find_first_not_of(" \t\r\n") == std::string::npos)
        return;

    json message;
    try
    {
        message = decode_envelope(line);
    }
    catch (const JsonDecodeError& e)
    {
        report_error(ErrorKind::Decode, e.what(), e.line());
        return;
    }

    std::string type = envelope_type(message);
    if (type == message_type::kControlRequest)
    {
        spawn_dispatch(std::move(message));
    }
    else if (type == message_type::kControlResponse)
    {
        handle_response(message, line);
    }
    else if (!messages_.push(std::move(message)))
    {
        log::logger()->debug("message sink closed, dropping '{}' message", type);
    }
}

void Session::handle_response(const json& message, const std::string& line)
{
    ControlResponse response;
    try
    {
        response = ControlResponse::from_json(message);
    }
    catch (const json::exception& e)
    {
        report_error(ErrorKind::Protocol, std::string("Malformed control response: ") + e.what(), line);
        return;
    }

    if (!pending_.resolve(response))
        report_error(
            ErrorKind::Protocol, "Control response for unknown request id: " + response.request_id, line
        );
}

void Session::report_error(ErrorKind kind, std::string message, std::optional<std::string> raw_line)
{
    switch (kind)
    {
    case ErrorKind::Connection:
        log::logger()->error("{} error: {}", to_string(kind), message);
        break;
    case ErrorKind::Decode:
    case ErrorKind::Protocol:
        log::logger()->warn("{} error: {}", to_string(kind), message);
        break;
    case ErrorKind::Dispatch:
    case ErrorKind::Callback:
        log::logger()->debug("{} error: {}", to_string(kind), message);
        break;
    }

    // Never blocks: a consumer that only drains messages must not stall the read loop
    if (auto dropped = errors_.push_evicting(ErrorEvent{kind, std::move(message), std::move(raw_line)}))
        log::logger()->debug("error sink full or closed, dropping {} error: {}", to_string(dropped->kind), dropped->message);
}

// =============================================================================
// Inbound control requests
// =============================================================================

void Session::spawn_dispatch(json message)
{
    std::string request_id = request_id_of(message);
    if (cancelled_)
    {
        log::logger()->debug("session closing, not dispatching control request {}", request_id);
        return;
    }

    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        reap_finished_tasks();

        if (!request_id.empty() && !inflight_ids_.insert(request_id).second)
        {
            duplicate = true;
        }
        else
        {
            tasks_.push_back(std::async(
                std::launch::async,
                [this, message = std::move(message), request_id] { run_dispatch(message, request_id); }
            ));
        }
    }

    if (duplicate)
        report_error(ErrorKind::Protocol, "Control request id reused while in flight: " + request_id);
}

void Session::run_dispatch(const json& message, const std::string& request_id)
{
    ControlResponse response = dispatcher_.dispatch(message);
    try
    {
        write_line(response.to_json().dump());
    }
    catch (const std::exception& e)
    {
        log::logger()->debug("could not deliver response to {}: {}", request_id, e.what());
    }

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    inflight_ids_.erase(request_id);
}

void Session::reap_finished_tasks()
{
    for (auto it = tasks_.begin(); it != tasks_.end();)
    {
        if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        {
            ++it;
            continue;
        }
        try
        {
            it->get();
        }
        catch (const std::exception& e)
        {
            log::logger()->error("control request task failed: {}", e.what());
        }
        catch (...)
        {
            log::logger()->error("control request task failed with a non-standard exception");
        }
        it = tasks_.erase(it);
    }
}

void Session::wait_for_tasks()
{
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }

    for (auto& task : tasks)
    {
        try
        {
            task.get();
        }
        catch (const std::exception& e)
        {
            log::logger()->error("control request task failed: {}", e.what());
        }
        catch (...)
        {
            log::logger()->error("control request task failed with a non-standard exception");
        }
    }
}

// =============================================================================
// Outbound control requests
// =============================================================================

void Session::ensure_running() const
{
    if (!running_)
        throw CliConnectionError("Session is not running");
}

void Session::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        framer_.write_line(line);
    }
    catch (const TransportError& e)
    {
        throw CliConnectionError("Failed to write to agent", e.what());
    }
}

void Session::send_line(const std::string& line)
{
    ensure_running();
    write_line(line);
}

std::string Session::send_control_request(ControlRequestKind kind, const json& payload)
{
    // The slot absorbs the eventual reply; nobody waits on it
    auto request_id = request_ids_.next();
    auto reply = pending_.add(request_id, acknowledgement_timeout(options_));
    static_cast<void>(reply);
    wake_timeout_thread();

    try
    {
        ensure_running();
        write_line(ControlRequest::make(request_id, kind, payload).to_json().dump());
    }
    catch (const std::exception&)
    {
        pending_.remove(request_id);
        throw;
    }

    log::logger()->debug("sent control request {} ({})", request_id, to_string(kind));
    return request_id;
}

std::future<json> Session::request(
    ControlRequestKind kind, const json& payload, std::optional<std::chrono::milliseconds> timeout
)
{
    ensure_running();

    auto request_id = request_ids_.next();
    auto future = pending_.add(request_id, timeout.value_or(options_.control_timeout));

    wake_timeout_thread();

    // The read loop may have ended before the slot was registered
    if (!running_)
    {
        pending_.fail(request_id, std::make_exception_ptr(ConnectionClosedError("Connection closed")));
        return future;
    }

    try
    {
        write_line(ControlRequest::make(request_id, kind, payload).to_json().dump());
    }
    catch (const std::exception&)
    {
        pending_.remove(request_id);
        throw;
    }

    log::logger()->debug("sent control request {} ({})", request_id, to_string(kind));
    return future;
}

/// Make the timeout thread re-read the earliest deadline
void Session::wake_timeout_thread()
{
    {
        std::lock_guard<std::mutex> lock(timeout_mutex_);
    }
    timeout_cv_.notify_all();
}

void Session::timeout_loop()
{
    std::unique_lock<std::mutex> lock(timeout_mutex_);
    while (!stop_timeouts_)
    {
        auto next_deadline = pending_.expire(PendingControlRequests::clock::now());
        if (next_deadline == PendingControlRequests::clock::time_point::max())
            timeout_cv_.wait(lock);
        else
            timeout_cv_.wait_until(lock, next_deadline);
    }
}

} // namespace claudecode
