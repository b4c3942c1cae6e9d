// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <claudecode/dispatcher.hpp>
#include <claudecode/log.hpp>
#include <spdlog/spdlog.h>

namespace claudecode
{

// =============================================================================
// Helper functions
// =============================================================================

static ControlFailure failure(ErrorKind kind, const std::string& request_id, std::string message)
{
    log::logger()->debug("control request {} failed ({}): {}", request_id, to_string(kind), message);
    return ControlFailure{std::move(message)};
}

static constexpr const char* kNonStandardException = "callback failed with a non-standard exception";

static json object_or_empty(const json& payload, const char* key)
{
    if (payload.contains(key) && !payload.at(key).is_null())
        return payload.at(key);
    return json::object();
}

static std::string string_or_empty(const json& payload, const char* key)
{
    if (payload.contains(key) && payload.at(key).is_string())
        return payload.at(key).get<std::string>();
    return {};
}

static ToolPermissionContext parse_permission_context(const json& payload, const std::string& request_id)
{
    ToolPermissionContext context;

    if (payload.contains("permission_suggestions") && payload.at("permission_suggestions").is_array())
    {
        for (const auto& suggestion : payload.at("permission_suggestions"))
        {
            try
            {
                context.suggestions.push_back(suggestion.get<PermissionUpdate>());
            }
            catch (const json::exception& e)
            {
                log::logger()->debug(
                    "control request {}: ignoring malformed permission suggestion: {}", request_id, e.what()
                );
            }
        }
    }

    if (payload.contains("blocked_path") && payload.at("blocked_path").is_string())
        context.blocked_path = payload.at("blocked_path").get<std::string>();

    return context;
}

// =============================================================================
// ControlDispatcher implementation
// =============================================================================

ControlResponse ControlDispatcher::dispatch(const json& envelope) const
{
    std::string request_id = string_or_empty(envelope, "request_id");

    if (!envelope.contains("request") || !envelope.at("request").is_object())
        return {request_id, failure(ErrorKind::Dispatch, request_id, "invalid request format")};

    try
    {
        auto request = ControlRequest::from_json(envelope);
        log::logger()->debug("dispatching control request {} ({})", request_id, request.subtype);

        switch (request.kind)
        {
        case ControlRequestKind::CanUseTool:
            return {request_id, handle_can_use_tool(request)};
        case ControlRequestKind::HookCallback:
            return {request_id, handle_hook_callback(request)};
        case ControlRequestKind::McpMessage:
            return {request_id, handle_mcp_message(request)};
        case ControlRequestKind::Interrupt:
        case ControlRequestKind::Initialize:
        case ControlRequestKind::SetPermissionMode:
        case ControlRequestKind::Unknown:
            break;
        }

        return {
            request_id,
            failure(ErrorKind::Dispatch, request_id, "unknown control request subtype: " + request.subtype)
        };
    }
    catch (const std::exception& e)
    {
        return {request_id, failure(ErrorKind::Dispatch, request_id, e.what())};
    }
    catch (...)
    {
        return {request_id, failure(ErrorKind::Dispatch, request_id, kNonStandardException)};
    }
}

ControlOutcome ControlDispatcher::handle_can_use_tool(const ControlRequest& request) const
{
    const auto& callback = registry_.permission_callback();
    if (!callback || !*callback)
        return ControlSuccess{json{{"behavior", PermissionBehavior::Allow}}};

    std::string tool_name = string_or_empty(request.payload, "tool_name");
    json input = object_or_empty(request.payload, "input");
    auto context = parse_permission_context(request.payload, request.request_id);

    try
    {
        PermissionResult result = (*callback)(tool_name, input, context);
        return ControlSuccess{permission_result_to_json(result)};
    }
    catch (const std::exception& e)
    {
        return failure(ErrorKind::Callback, request.request_id, e.what());
    }
    catch (...)
    {
        return failure(ErrorKind::Callback, request.request_id, kNonStandardException);
    }
}

ControlOutcome ControlDispatcher::handle_hook_callback(const ControlRequest& request) const
{
    std::string callback_id = string_or_empty(request.payload, "callback_id");
    const RegisteredHook* hook = registry_.find_hook(callback_id);
    if (hook == nullptr || !hook->callback)
        return failure(ErrorKind::Dispatch, request.request_id, "callback not found: " + callback_id);

    json input = object_or_empty(request.payload, "input");
    std::optional<std::string> tool_use_id;
    if (request.payload.contains("tool_use_id") && request.payload.at("tool_use_id").is_string())
        tool_use_id = request.payload.at("tool_use_id").get<std::string>();

    try
    {
        auto output = hook->callback(input, tool_use_id, HookContext{callback_id});
        json payload = json::object();
        if (output)
            to_json(payload, *output);
        return ControlSuccess{std::move(payload)};
    }
    catch (const std::exception& e)
    {
        return failure(ErrorKind::Callback, request.request_id, e.what());
    }
    catch (...)
    {
        return failure(ErrorKind::Callback, request.request_id, kNonStandardException);
    }
}

ControlOutcome ControlDispatcher::handle_mcp_message(const ControlRequest& request) const
{
    std::string server_name = string_or_empty(request.payload, "server_name");
    const SdkMcpServer* server = registry_.find_mcp_server(server_name);
    if (server == nullptr)
        return failure(ErrorKind::Dispatch, request.request_id, "SDK MCP server not found: " + server_name);

    if (!server->handler)
        return failure(
            ErrorKind::Dispatch,
            request.request_id,
            "MCP message handling not implemented for server: " + server_name
        );

    json message = request.payload.contains("message") ? request.payload.at("message") : json(nullptr);
    try
    {
        return ControlSuccess{json{{"mcp_response", server->handler(message)}}};
    }
    catch (const std::exception& e)
    {
        return failure(ErrorKind::Callback, request.request_id, e.what());
    }
    catch (...)
    {
        return failure(ErrorKind::Callback, request.request_id, kNonStandardException);
    }
}

} // namespace claudecode
