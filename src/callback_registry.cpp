// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <claudecode/callback_registry.hpp>
#include <stdexcept>

namespace claudecode
{

CallbackRegistry::CallbackRegistry(const SessionOptions& options)
{
    if (options.can_use_tool)
        set_permission_callback(*options.can_use_tool);

    for (const auto& [event, matchers] : options.hooks)
        for (const auto& matcher : matchers)
            add_hook_matcher(event, matcher);

    for (const auto& [name, server] : options.mcp_servers)
    {
        SdkMcpServer entry = server;
        if (entry.name.empty())
            entry.name = name;
        add_mcp_server(std::move(entry));
    }
}

void CallbackRegistry::ensure_mutable(const char* operation) const
{
    if (sealed_)
        throw std::logic_error(std::string("CallbackRegistry is sealed: cannot ") + operation);
}

void CallbackRegistry::set_permission_callback(CanUseTool callback)
{
    ensure_mutable("set permission callback");
    can_use_tool_ = std::move(callback);
}

std::vector<std::string> CallbackRegistry::add_hook_matcher(HookEvent event, const HookMatcher& matcher)
{
    ensure_mutable("add hook");

    MatcherEntry entry{event, matcher.matcher, {}};
    for (const auto& callback : matcher.hooks)
    {
        // Ids count every hook registered so far, across all events
        std::string id = "hook_" + to_string(event) + "_" + std::to_string(hooks_.size());
        hooks_.emplace(id, RegisteredHook{id, event, matcher.matcher, callback});
        entry.callback_ids.push_back(id);
    }

    auto ids = entry.callback_ids;
    matchers_.push_back(std::move(entry));
    return ids;
}

void CallbackRegistry::add_mcp_server(SdkMcpServer server)
{
    ensure_mutable("add MCP server");
    if (server.name.empty())
        throw std::invalid_argument("MCP server name must not be empty");

    std::string name = server.name;
    if (!mcp_servers_.emplace(name, std::move(server)).second)
        throw std::invalid_argument("MCP server already registered: " + name);
}

const RegisteredHook* CallbackRegistry::find_hook(const std::string& callback_id) const
{
    auto it = hooks_.find(callback_id);
    return it == hooks_.end() ? nullptr : &it->second;
}

const SdkMcpServer* CallbackRegistry::find_mcp_server(const std::string& name) const
{
    auto it = mcp_servers_.find(name);
    return it == mcp_servers_.end() ? nullptr : &it->second;
}

json CallbackRegistry::hooks_config() const
{
    json config = json::object();
    for (const auto& entry : matchers_)
    {
        json item = json::object();
        item["matcher"] = entry.matcher ? json(*entry.matcher) : json(nullptr);
        item["hookCallbackIds"] = entry.callback_ids;

        auto& list = config[to_string(entry.event)];
        if (list.is_null())
            list = json::array();
        list.push_back(std::move(item));
    }
    return config;
}

} // namespace claudecode
