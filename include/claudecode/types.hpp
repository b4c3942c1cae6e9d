// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdlib>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace claudecode
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Conversation message types
// =============================================================================

/// Values of the `type` discriminator carried by every line
namespace message_type
{
inline constexpr const char* kUser = "user";
inline constexpr const char* kAssistant = "assistant";
inline constexpr const char* kSystem = "system";
inline constexpr const char* kResult = "result";
inline constexpr const char* kStream = "stream";
inline constexpr const char* kControlRequest = "control_request";
inline constexpr const char* kControlResponse = "control_response";
} // namespace message_type

// =============================================================================
// Enums
// =============================================================================

/// Permission handling mode of the agent
enum class PermissionMode
{
    Default,
    AcceptEdits,
    Plan,
    BypassPermissions
};

/// Behaviour carried by a permission decision or rule update
enum class PermissionBehavior
{
    Allow,
    Deny,
    Ask
};

/// Kind of permission rule update suggested by, or returned to, the agent
enum class PermissionUpdateType
{
    AddRules,
    ReplaceRules,
    RemoveRules,
    SetMode,
    AddDirectories,
    RemoveDirectories
};

/// Where a permission update is persisted
enum class PermissionUpdateDestination
{
    UserSettings,
    ProjectSettings,
    LocalSettings,
    Session
};

/// Lifecycle events a hook can be registered for
enum class HookEvent
{
    PreToolUse,
    PostToolUse,
    UserPromptSubmit,
    Stop,
    SubagentStop,
    PreCompact
};

/// Decision returned by a hook
enum class HookDecision
{
    Block
};

// JSON enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(
    PermissionMode,
    {
        {PermissionMode::Default, "default"},
        {PermissionMode::AcceptEdits, "acceptEdits"},
        {PermissionMode::Plan, "plan"},
        {PermissionMode::BypassPermissions, "bypassPermissions"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    PermissionBehavior,
    {
        {PermissionBehavior::Allow, "allow"},
        {PermissionBehavior::Deny, "deny"},
        {PermissionBehavior::Ask, "ask"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    PermissionUpdateType,
    {
        {PermissionUpdateType::AddRules, "addRules"},
        {PermissionUpdateType::ReplaceRules, "replaceRules"},
        {PermissionUpdateType::RemoveRules, "removeRules"},
        {PermissionUpdateType::SetMode, "setMode"},
        {PermissionUpdateType::AddDirectories, "addDirectories"},
        {PermissionUpdateType::RemoveDirectories, "removeDirectories"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    PermissionUpdateDestination,
    {
        {PermissionUpdateDestination::UserSettings, "userSettings"},
        {PermissionUpdateDestination::ProjectSettings, "projectSettings"},
        {PermissionUpdateDestination::LocalSettings, "localSettings"},
        {PermissionUpdateDestination::Session, "session"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    HookEvent,
    {
        {HookEvent::PreToolUse, "PreToolUse"},
        {HookEvent::PostToolUse, "PostToolUse"},
        {HookEvent::UserPromptSubmit, "UserPromptSubmit"},
        {HookEvent::Stop, "Stop"},
        {HookEvent::SubagentStop, "SubagentStop"},
        {HookEvent::PreCompact, "PreCompact"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    HookDecision,
    {
        {HookDecision::Block, "block"},
    }
)

/// Wire name of a hook event (e.g. "PreToolUse")
inline std::string to_string(HookEvent event)
{
    return json(event).get<std::string>();
}

// =============================================================================
// Permission Types
// =============================================================================

/// A single permission rule
struct PermissionRuleValue
{
    std::string tool_name;
    std::optional<std::string> rule_content;
};

inline void to_json(json& j, const PermissionRuleValue& r)
{
    j = json{{"tool_name", r.tool_name}};
    if (r.rule_content)
        j["rule_content"] = *r.rule_content;
}

inline void from_json(const json& j, PermissionRuleValue& r)
{
    j.at("tool_name").get_to(r.tool_name);
    if (j.contains("rule_content") && !j.at("rule_content").is_null())
        r.rule_content = j.at("rule_content").get<std::string>();
}

/// A change to the agent's permission rules
struct PermissionUpdate
{
    PermissionUpdateType type = PermissionUpdateType::AddRules;
    std::optional<std::vector<PermissionRuleValue>> rules;
    std::optional<PermissionBehavior> behavior;
    std::optional<PermissionMode> mode;
    std::optional<std::vector<std::string>> directories;
    std::optional<PermissionUpdateDestination> destination;
};

inline void to_json(json& j, const PermissionUpdate& u)
{
    j = json{{"type", u.type}};
    if (u.rules)
        j["rules"] = *u.rules;
    if (u.behavior)
        j["behavior"] = *u.behavior;
    if (u.mode)
        j["mode"] = *u.mode;
    if (u.directories)
        j["directories"] = *u.directories;
    if (u.destination)
        j["destination"] = *u.destination;
}

inline void from_json(const json& j, PermissionUpdate& u)
{
    j.at("type").get_to(u.type);
    if (j.contains("rules") && !j.at("rules").is_null())
        u.rules = j.at("rules").get<std::vector<PermissionRuleValue>>();
    if (j.contains("behavior") && !j.at("behavior").is_null())
        u.behavior = j.at("behavior").get<PermissionBehavior>();
    if (j.contains("mode") && !j.at("mode").is_null())
        u.mode = j.at("mode").get<PermissionMode>();
    if (j.contains("directories") && !j.at("directories").is_null())
        u.directories = j.at("directories").get<std::vector<std::string>>();
    if (j.contains("destination") && !j.at("destination").is_null())
        u.destination = j.at("destination").get<PermissionUpdateDestination>();
}

/// Context passed to the tool permission callback
struct ToolPermissionContext
{
    /// Rule updates the agent suggests applying alongside an allow
    std::vector<PermissionUpdate> suggestions;
    std::optional<std::string> blocked_path;
};

/// Allow the tool call, optionally rewriting its input or the rule set
struct PermissionResultAllow
{
    std::optional<json> updated_input;
    std::optional<std::vector<PermissionUpdate>> updated_permissions;
};

/// Deny the tool call
struct PermissionResultDeny
{
    std::string message;
    /// Also interrupt the current turn
    bool interrupt = false;
};

/// Outcome of a permission check
using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

inline void to_json(json& j, const PermissionResultAllow& r)
{
    j = json{{"behavior", PermissionBehavior::Allow}};
    if (r.updated_input)
        j["updated_input"] = *r.updated_input;
    if (r.updated_permissions)
        j["updated_permissions"] = *r.updated_permissions;
}

inline void to_json(json& j, const PermissionResultDeny& r)
{
    j = json{{"behavior", PermissionBehavior::Deny}, {"message", r.message}};
    if (r.interrupt)
        j["interrupt"] = true;
}

/// Serialize a permission decision into the control response payload
inline json permission_result_to_json(const PermissionResult& result)
{
    return std::visit(
        [](const auto& r) -> json
        {
            using T = std::decay_t<decltype(r)>;
            static_assert(
                std::is_same_v<T, PermissionResultAllow> || std::is_same_v<T, PermissionResultDeny>,
                "unhandled PermissionResult alternative"
            );
            json j;
            to_json(j, r);
            return j;
        },
        result
    );
}

/// Tool permission callback: (tool name, tool input, context) -> decision.
/// Throwing reports a failure to the agent; it is never treated as allow or deny.
using CanUseTool = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context
)>;

// =============================================================================
// Hook Types
// =============================================================================

/// Context passed to a hook callback
struct HookContext
{
    /// Identifier the callback was registered under
    std::string callback_id;
};

/// Output of a hook callback
struct HookOutput
{
    std::optional<HookDecision> decision;
    std::optional<std::string> system_message;
    std::optional<json> hook_specific_output;
};

inline void to_json(json& j, const HookOutput& o)
{
    j = json::object();
    if (o.decision)
        j["decision"] = *o.decision;
    if (o.system_message)
        j["systemMessage"] = *o.system_message;
    if (o.hook_specific_output)
        j["hookSpecificOutput"] = *o.hook_specific_output;
}

inline void from_json(const json& j, HookOutput& o)
{
    if (j.contains("decision") && !j.at("decision").is_null())
        o.decision = j.at("decision").get<HookDecision>();
    if (j.contains("systemMessage") && !j.at("systemMessage").is_null())
        o.system_message = j.at("systemMessage").get<std::string>();
    if (j.contains("hookSpecificOutput") && !j.at("hookSpecificOutput").is_null())
        o.hook_specific_output = j.at("hookSpecificOutput");
}

/// Hook callback: (hook input, tool use id, context) -> optional output.
/// Returning std::nullopt produces an empty success payload.
using HookCallback = std::function<std::optional<HookOutput>(
    const json& input, const std::optional<std::string>& tool_use_id, const HookContext& context
)>;

/// A set of hook callbacks bound to one matcher pattern (e.g. a tool name)
struct HookMatcher
{
    std::optional<std::string> matcher;
    std::vector<HookCallback> hooks;
};

// =============================================================================
// In-process MCP servers
// =============================================================================

/// Handler for JSON-RPC messages routed to an in-process MCP server
using McpMessageHandler = std::function<json(const json& message)>;

/// An MCP server hosted inside this process and reached over the control channel
struct SdkMcpServer
{
    std::string name;
    std::string version = "1.0.0";
    /// Empty handler: requests for this server are answered with a failure
    McpMessageHandler handler;
};

// =============================================================================
// Session Options
// =============================================================================

/// Configuration of one control-protocol session
struct SessionOptions
{
    /// Tool permission callback; unset means every tool call is allowed
    std::optional<CanUseTool> can_use_tool;

    /// Hook callbacks by event
    std::map<HookEvent, std::vector<HookMatcher>> hooks;

    /// In-process MCP servers by name
    std::map<std::string, SdkMcpServer> mcp_servers;

    /// Capacity of the conversation message queue
    size_t message_queue_capacity = 100;

    /// Capacity of the error event queue
    size_t error_queue_capacity = 10;

    /// Longest accepted input line in bytes
    size_t max_line_size = 1024 * 1024;

    /// Send an `initialize` control request and wait for its reply on start
    bool initialize = false;

    /// Deadline for outbound control requests that expect a reply
    std::chrono::milliseconds control_timeout{60000};

    /// How long a fire-and-forget request (e.g. interrupt) waits for its
    /// acknowledgement before the slot is dropped. Always finite; zero or
    /// negative values fall back to the default.
    std::chrono::milliseconds acknowledgement_timeout{60000};

    /// Logger level name (trace, debug, info, warn, err, critical, off)
    std::optional<std::string> log_level;

    // ─────────────────────────────────────────────────────────────────────────
    // Environment Variable Support
    // ─────────────────────────────────────────────────────────────────────────

    static constexpr const char* ENV_LOG_LEVEL = "CLAUDECODE_LOG_LEVEL";
    static constexpr const char* ENV_MESSAGE_QUEUE_CAPACITY = "CLAUDECODE_MESSAGE_QUEUE_CAPACITY";
    static constexpr const char* ENV_MAX_LINE_SIZE = "CLAUDECODE_MAX_LINE_SIZE";

    /// Defaults overlaid with CLAUDECODE_* environment variables.
    /// Unparseable numeric values are ignored.
    static SessionOptions from_env()
    {
        SessionOptions options;

        if (const char* level = std::getenv(ENV_LOG_LEVEL); level != nullptr && level[0] != '\0')
            options.log_level = std::string(level);

        if (auto capacity = size_from_env(ENV_MESSAGE_QUEUE_CAPACITY))
            options.message_queue_capacity = *capacity;

        if (auto size = size_from_env(ENV_MAX_LINE_SIZE))
            options.max_line_size = *size;

        return options;
    }

  private:
    static std::optional<size_t> size_from_env(const char* name)
    {
        const char* value = std::getenv(name);
        if (value == nullptr || value[0] == '\0')
            return std::nullopt;
        try
        {
            size_t pos = 0;
            unsigned long long parsed = std::stoull(value, &pos);
            if (pos != std::string(value).size() || parsed == 0)
                return std::nullopt;
            return static_cast<size_t>(parsed);
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }
};

} // namespace claudecode
