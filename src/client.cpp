// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <claudecode/client.hpp>
#include <claudecode/log.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace claudecode
{

// =============================================================================
// Message Builder Helpers
// =============================================================================

ordered_json build_user_message(const std::string& prompt, const std::string& session_id)
{
    ordered_json message = ordered_json::object();
    message["role"] = "user";
    message["content"] = prompt;

    ordered_json line = ordered_json::object();
    line["type"] = message_type::kUser;
    line["message"] = std::move(message);
    line["parent_tool_use_id"] = nullptr;
    line["session_id"] = session_id;
    return line;
}

// =============================================================================
// Client Implementation
// =============================================================================

Client::Client(SessionOptions options) : options_(std::move(options)) {}

Client::~Client()
{
    close();
}

void Client::connect(std::unique_ptr<ITransport> transport)
{
    std::shared_ptr<Session> session;
    std::shared_ptr<Session> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->is_running())
            throw CliConnectionError("Already connected");
        session = std::make_shared<Session>(std::move(transport), options_);
        previous = std::exchange(session_, session);
    }

    // A previous session whose stream ended still owns its threads
    if (previous)
        previous->close();

    try
    {
        session->start();
    }
    catch (const std::exception& e)
    {
        log::logger()->error("failed to start session: {}", e.what());
        session->close();
        throw;
    }
}

void Client::close()
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_);
    }
    if (session)
        session->close();
}

bool Client::is_connected() const
{
    auto current = session();
    return current && current->is_running();
}

std::optional<json> Client::server_info() const
{
    auto current = session();
    if (!current)
        return std::nullopt;
    return current->initialize_result();
}

std::shared_ptr<Session> Client::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::shared_ptr<Session> Client::connected_session() const
{
    auto current = session();
    if (!current || !current->is_running())
        throw CliConnectionError("Not connected. Call connect() first");
    return current;
}

void Client::send_message(const std::string& prompt, const std::string& session_id)
{
    connected_session()->send_line(build_user_message(prompt, session_id).dump());
}

void Client::send_raw_message(const json& message)
{
    if (!message.is_object())
        throw std::invalid_argument("Raw message must be a JSON object");
    connected_session()->send_line(message.dump());
}

std::string Client::interrupt()
{
    return connected_session()->interrupt();
}

void Client::set_permission_mode(PermissionMode mode)
{
    connected_session()->set_permission_mode(mode).get();
}

std::optional<json> Client::receive_message()
{
    auto current = session();
    if (!current)
        return std::nullopt;
    return current->receive_message();
}

std::optional<json> Client::receive_message_for(std::chrono::milliseconds timeout)
{
    auto current = session();
    if (!current)
        return std::nullopt;
    return current->messages().pop_for(timeout);
}

std::optional<ErrorEvent> Client::receive_error()
{
    auto current = session();
    if (!current)
        return std::nullopt;
    return current->receive_error();
}

std::optional<ErrorEvent> Client::receive_error_for(std::chrono::milliseconds timeout)
{
    auto current = session();
    if (!current)
        return std::nullopt;
    return current->errors().pop_for(timeout);
}

std::vector<json> Client::receive_response()
{
    std::vector<json> messages;
    while (auto message = receive_message())
    {
        bool done = envelope_type(*message) == message_type::kResult;
        messages.push_back(std::move(*message));
        if (done)
            break;
    }
    return messages;
}

// =============================================================================
// One-shot Query
// =============================================================================

QueryResult query(std::unique_ptr<ITransport> transport, const std::string& prompt, SessionOptions options)
{
    Client client(std::move(options));
    client.connect(std::move(transport));
    client.send_message(prompt);

    QueryResult result;
    result.messages = client.receive_response();

    // Errors are reported before the message that follows them, so by now every
    // error of the turn is already queued
    while (auto error = client.receive_error_for(std::chrono::milliseconds(0)))
        result.errors.push_back(std::move(*error));

    if (result.messages.empty() || envelope_type(result.messages.back()) != message_type::kResult)
        log::logger()->warn("agent stream ended before a result message");

    client.close();
    return result;
}

} // namespace claudecode
