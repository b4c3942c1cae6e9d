// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file control.hpp
/// @brief Control protocol messages, request ids and pending-response tracking

#include <atomic>
#include <chrono>
#include <claudecode/errors.hpp>
#include <claudecode/types.hpp>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace claudecode
{

/// Insertion-ordered JSON, used for envelopes written to the wire
using ordered_json = nlohmann::ordered_json;

// =============================================================================
// Line decoding
// =============================================================================

/// Decode one input line into an envelope
/// @throws JsonDecodeError if the line is not valid JSON or not a JSON object
inline json decode_envelope(const std::string& line)
{
    json envelope;
    try
    {
        envelope = json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        throw JsonDecodeError(std::string("Failed to decode JSON: ") + e.what(), line);
    }
    if (!envelope.is_object())
        throw JsonDecodeError("Expected a JSON object", line);
    return envelope;
}

/// Value of the `type` discriminator, or "" when absent
inline std::string envelope_type(const json& envelope)
{
    auto it = envelope.find("type");
    if (it == envelope.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

// =============================================================================
// Control Request Kinds
// =============================================================================

/// Control request subtypes
enum class ControlRequestKind
{
    Unknown,
    Interrupt,
    CanUseTool,
    HookCallback,
    McpMessage,
    Initialize,
    SetPermissionMode,
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ControlRequestKind,
    {
        {ControlRequestKind::Unknown, nullptr},
        {ControlRequestKind::Interrupt, "interrupt"},
        {ControlRequestKind::CanUseTool, "can_use_tool"},
        {ControlRequestKind::HookCallback, "hook_callback"},
        {ControlRequestKind::McpMessage, "mcp_message"},
        {ControlRequestKind::Initialize, "initialize"},
        {ControlRequestKind::SetPermissionMode, "set_permission_mode"},
    }
)

/// Wire subtype of a request kind ("unknown" for Unknown)
inline std::string to_string(ControlRequestKind kind)
{
    if (kind == ControlRequestKind::Unknown)
        return "unknown";
    return json(kind).get<std::string>();
}

// =============================================================================
// Control Request
// =============================================================================

/// A control request, inbound or outbound
///
/// Wire format:
/// ```
/// {"type":"control_request","request_id":"<id>","request":{"subtype":"<kind>",...}}
/// ```
struct ControlRequest
{
    std::string request_id;
    ControlRequestKind kind = ControlRequestKind::Unknown;
    /// Raw wire subtype (kept for unknown kinds)
    std::string subtype;
    /// Kind-specific fields of the `request` object, without `subtype`
    json payload = json::object();

    ordered_json to_json() const
    {
        ordered_json request = ordered_json::object();
        request["subtype"] = subtype.empty() ? to_string(kind) : subtype;
        for (const auto& [key, value] : payload.items())
            if (key != "subtype")
                request[key] = ordered_json(value);

        ordered_json j = ordered_json::object();
        j["type"] = message_type::kControlRequest;
        j["request_id"] = request_id;
        j["request"] = std::move(request);
        return j;
    }

    /// Parse an envelope whose `request` member is known to be an object
    static ControlRequest from_json(const json& j)
    {
        ControlRequest req;
        if (j.contains("request_id") && j.at("request_id").is_string())
            req.request_id = j.at("request_id").get<std::string>();

        const auto& request = j.at("request");
        if (request.contains("subtype") && request.at("subtype").is_string())
        {
            req.subtype = request.at("subtype").get<std::string>();
            req.kind = request.at("subtype").get<ControlRequestKind>();
        }

        req.payload = json::object();
        for (const auto& [key, value] : request.items())
            if (key != "subtype")
                req.payload[key] = value;
        return req;
    }

    /// Build an outbound request
    /// @throws std::invalid_argument for ControlRequestKind::Unknown
    static ControlRequest make(std::string request_id, ControlRequestKind kind, json payload = json::object())
    {
        if (kind == ControlRequestKind::Unknown)
            throw std::invalid_argument("Cannot build a control request of unknown kind");

        ControlRequest req;
        req.request_id = std::move(request_id);
        req.kind = kind;
        req.subtype = to_string(kind);
        req.payload = payload.is_null() ? json::object() : std::move(payload);
        return req;
    }
};

// =============================================================================
// Control Response
// =============================================================================

/// Successful handling; `response` is the kind-specific payload
struct ControlSuccess
{
    json response = json::object();
};

/// Failed handling; the far side sees `error`
struct ControlFailure
{
    std::string error;
};

using ControlOutcome = std::variant<ControlSuccess, ControlFailure>;

/// The single reply to a control request
///
/// Wire format:
/// ```
/// {"type":"control_response","response":{"subtype":"success","request_id":"<id>","response":{...}}}
/// {"type":"control_response","response":{"subtype":"error","request_id":"<id>","error":"<message>"}}
/// ```
struct ControlResponse
{
    std::string request_id;
    ControlOutcome outcome;

    static ControlResponse success(std::string request_id, json response = json::object())
    {
        return ControlResponse{std::move(request_id), ControlSuccess{std::move(response)}};
    }

    static ControlResponse failure(std::string request_id, std::string error)
    {
        return ControlResponse{std::move(request_id), ControlFailure{std::move(error)}};
    }

    bool is_error() const
    {
        return std::holds_alternative<ControlFailure>(outcome);
    }

    ordered_json to_json() const
    {
        ordered_json body = ordered_json::object();
        if (const auto* ok = std::get_if<ControlSuccess>(&outcome))
        {
            body["subtype"] = "success";
            body["request_id"] = request_id;
            body["response"] = ordered_json(ok->response);
        }
        else
        {
            body["subtype"] = "error";
            body["request_id"] = request_id;
            body["error"] = std::get<ControlFailure>(outcome).error;
        }

        ordered_json j = ordered_json::object();
        j["type"] = message_type::kControlResponse;
        j["response"] = std::move(body);
        return j;
    }

    /// Parse an inbound control_response envelope
    /// @throws json::exception if `response.request_id` is missing
    static ControlResponse from_json(const json& j)
    {
        const auto& body = j.at("response");
        ControlResponse resp;
        resp.request_id = body.at("request_id").get<std::string>();

        if (body.value("subtype", std::string{}) == "success")
        {
            json payload = body.contains("response") && !body.at("response").is_null()
                               ? body.at("response")
                               : json::object();
            resp.outcome = ControlSuccess{std::move(payload)};
        }
        else
        {
            std::string error = body.contains("error") && body.at("error").is_string()
                                    ? body.at("error").get<std::string>()
                                    : std::string("Unknown control error");
            resp.outcome = ControlFailure{std::move(error)};
        }
        return resp;
    }
};

// =============================================================================
// Request ID Generation
// =============================================================================

/// Per-session source of request ids: req_1, req_2, ...
class RequestIdGenerator
{
  public:
    std::string next()
    {
        return "req_" + std::to_string(counter_.fetch_add(1) + 1);
    }

  private:
    std::atomic<uint64_t> counter_{0};
};

// =============================================================================
// Pending Request Tracking
// =============================================================================

/// Holds state for an outbound control request awaiting its response
struct PendingControlRequest
{
    std::promise<json> promise;
    std::chrono::steady_clock::time_point deadline;

    PendingControlRequest(std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        : deadline(
              timeout.count() > 0 ? std::chrono::steady_clock::now() + timeout
                                  : std::chrono::steady_clock::time_point::max()
          )
    {
    }
};

/// Table of outbound requests awaiting a control_response, keyed by request id.
/// All access goes through one mutex.
class PendingControlRequests
{
  public:
    using clock = std::chrono::steady_clock;

    /// Register a slot before the request is written
    /// @throws ControlRequestError if the id is already pending
    std::future<json> add(const std::string& request_id, std::chrono::milliseconds timeout)
    {
        auto pending = std::make_shared<PendingControlRequest>(timeout);
        auto future = pending->promise.get_future();

        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.emplace(request_id, pending).second)
            throw ControlRequestError(request_id, "Request id already pending: " + request_id);
        return future;
    }

    /// Drop a slot without completing it (e.g. the write failed)
    void remove(const std::string& request_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(request_id);
    }

    /// Complete the slot matching `response`
    /// @return false if no request with that id is pending
    bool resolve(const ControlResponse& response)
    {
        auto pending = take(response.request_id);
        if (!pending)
            return false;

        if (const auto* ok = std::get_if<ControlSuccess>(&response.outcome))
            pending->promise.set_value(ok->response);
        else
            pending->promise.set_exception(std::make_exception_ptr(
                ControlRequestError(response.request_id, std::get<ControlFailure>(response.outcome).error)
            ));
        return true;
    }

    /// Fail one pending request
    void fail(const std::string& request_id, std::exception_ptr error)
    {
        if (auto pending = take(request_id))
            pending->promise.set_exception(std::move(error));
    }

    /// Fail every pending request
    void fail_all(const std::exception_ptr& error)
    {
        std::vector<std::shared_ptr<PendingControlRequest>> to_fail;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            to_fail.reserve(pending_.size());
            for (auto& [id, pending] : pending_)
                to_fail.push_back(pending);
            pending_.clear();
        }
        for (auto& pending : to_fail)
            pending->promise.set_exception(error);
    }

    /// Fail every request whose deadline has passed with ControlTimeoutError
    /// @return The earliest remaining deadline (time_point::max() if none)
    clock::time_point expire(clock::time_point now)
    {
        std::vector<std::pair<std::string, std::shared_ptr<PendingControlRequest>>> expired;
        auto next_deadline = clock::time_point::max();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end();)
            {
                if (it->second->deadline <= now)
                {
                    expired.emplace_back(it->first, it->second);
                    it = pending_.erase(it);
                }
                else
                {
                    next_deadline = std::min(next_deadline, it->second->deadline);
                    ++it;
                }
            }
        }
        for (auto& [id, pending] : expired)
            pending->promise.set_exception(std::make_exception_ptr(ControlTimeoutError(id)));
        return next_deadline;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    std::shared_ptr<PendingControlRequest> take(const std::string& request_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(request_id);
        if (it == pending_.end())
            return nullptr;
        auto pending = it->second;
        pending_.erase(it);
        return pending;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PendingControlRequest>> pending_;
};

} // namespace claudecode
