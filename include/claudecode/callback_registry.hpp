// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file callback_registry.hpp
/// @brief Consumer-supplied callbacks, looked up by the control dispatcher

#include <claudecode/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace claudecode
{

/// A hook callback together with the id the agent uses to invoke it
struct RegisteredHook
{
    std::string callback_id;
    HookEvent event = HookEvent::PreToolUse;
    std::optional<std::string> matcher;
    HookCallback callback;
};

/// Registry of the permission callback, hook callbacks and in-process MCP servers
///
/// Populated during session setup, then sealed before the read loop starts.
/// After sealing the registry is read-only, so lookups need no locking.
class CallbackRegistry
{
  public:
    CallbackRegistry() = default;

    /// Build a registry from session options (not sealed)
    explicit CallbackRegistry(const SessionOptions& options);

    /// Bind the tool permission callback, replacing any previous one
    /// @throws std::logic_error if sealed
    void set_permission_callback(CanUseTool callback);

    /// Register every callback of `matcher` for `event`
    /// @return The ids assigned, in callback order
    /// @throws std::logic_error if sealed
    std::vector<std::string> add_hook_matcher(HookEvent event, const HookMatcher& matcher);

    /// Register an in-process MCP server under its name
    /// @throws std::logic_error if sealed
    /// @throws std::invalid_argument if the name is empty or already registered
    void add_mcp_server(SdkMcpServer server);

    /// Forbid further mutation. Idempotent.
    void seal()
    {
        sealed_ = true;
    }

    bool is_sealed() const
    {
        return sealed_;
    }

    const std::optional<CanUseTool>& permission_callback() const
    {
        return can_use_tool_;
    }

    /// Look up a hook by callback id
    /// @return nullptr if no hook has that id
    const RegisteredHook* find_hook(const std::string& callback_id) const;

    /// Look up an MCP server by name
    /// @return nullptr if no server has that name
    const SdkMcpServer* find_mcp_server(const std::string& name) const;

    size_t hook_count() const
    {
        return hooks_.size();
    }

    /// Hook registration map sent in the `initialize` control request:
    /// `{"PreToolUse":[{"matcher":"Bash","hookCallbackIds":["hook_PreToolUse_0"]}]}`
    json hooks_config() const;

  private:
    void ensure_mutable(const char* operation) const;

    bool sealed_ = false;
    std::optional<CanUseTool> can_use_tool_;
    /// Keyed by callback id
    std::map<std::string, RegisteredHook> hooks_;
    /// Registration order, grouped as (event, matcher, ids) for hooks_config()
    struct MatcherEntry
    {
        HookEvent event;
        std::optional<std::string> matcher;
        std::vector<std::string> callback_ids;
    };
    std::vector<MatcherEntry> matchers_;
    std::map<std::string, SdkMcpServer> mcp_servers_;
};

} // namespace claudecode
