// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file dispatcher.hpp
/// @brief Routes inbound control requests to registered callbacks

#include <claudecode/callback_registry.hpp>
#include <claudecode/control.hpp>

namespace claudecode
{

/// Handles control requests initiated by the agent
///
/// Every call to dispatch() yields exactly one ControlResponse, whatever
/// happens inside routing or a consumer callback:
///
/// | subtype         | outcome                                                  |
/// |-----------------|----------------------------------------------------------|
/// | can_use_tool    | permission decision (allow when no callback is bound)    |
/// | hook_callback   | hook output, or failure if the callback id is unknown    |
/// | mcp_message     | `{"mcp_response": ...}` from the named in-process server |
/// | anything else   | failure: `unknown control request subtype: <subtype>`    |
///
/// The dispatcher holds no mutable state; concurrent calls are safe as long as
/// the registry is sealed.
class ControlDispatcher
{
  public:
    explicit ControlDispatcher(const CallbackRegistry& registry) : registry_(registry) {}

    /// Handle one `control_request` envelope
    /// @param envelope The decoded line, including `type` and `request_id`
    /// @return The response to write back; never throws for bad input or callback errors
    ControlResponse dispatch(const json& envelope) const;

  private:
    ControlOutcome handle_can_use_tool(const ControlRequest& request) const;
    ControlOutcome handle_hook_callback(const ControlRequest& request) const;
    ControlOutcome handle_mcp_message(const ControlRequest& request) const;

    const CallbackRegistry& registry_;
};

} // namespace claudecode
