// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file hooks.cpp
/// @brief Example demonstrating hook callbacks for tool lifecycle interception
///
/// This example shows how to:
/// 1. Register a PreToolUse hook that blocks dangerous shell commands
/// 2. Register a PostToolUse hook that annotates tool results
/// 3. Send the hook configuration with the initialize handshake
///
/// Run with the agent connected to stdin/stdout (see permission_callback.cpp).

#include <chrono>
#include <claudecode/claudecode.hpp>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

struct HookLog
{
    std::string hook_type;
    std::string detail;
};

std::vector<HookLog> g_hook_log;
std::mutex g_log_mutex;

void log_hook(const std::string& type, const std::string& detail)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_hook_log.push_back({type, detail});
    std::cerr << "[HOOK:" << type << "] " << detail << "\n";
}

int main(int argc, char* argv[])
{
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::string prompt = argc > 1 ? argv[1] : "Run 'rm -rf build' and then 'ls'.";

        claudecode::SessionOptions options = claudecode::SessionOptions::from_env();
        options.initialize = true;

        // ---- PreToolUse Hook ----
        // Fires before every Bash call; blocks anything that deletes files.
        options.hooks[claudecode::HookEvent::PreToolUse].push_back(claudecode::HookMatcher{
            "Bash",
            {[](const claudecode::json& input,
                const std::optional<std::string>& tool_use_id,
                const claudecode::HookContext& context) -> std::optional<claudecode::HookOutput>
             {
                 std::string command = input.value("tool_input", claudecode::json::object()).value("command", "");
                 log_hook(
                     "PreToolUse",
                     context.callback_id + " " + tool_use_id.value_or("-") + ": " + command
                 );

                 if (command.find("rm ") != std::string::npos)
                 {
                     log_hook("PreToolUse", "DENIED: " + command);
                     return claudecode::HookOutput{
                         .decision = claudecode::HookDecision::Block,
                         .system_message = "Deleting files is blocked by policy",
                         .hook_specific_output = claudecode::json{
                             {"hookEventName", "PreToolUse"},
                             {"permissionDecision", "deny"},
                             {"permissionDecisionReason", "rm is not allowed"},
                         },
                     };
                 }
                 return std::nullopt;
             }}
        });

        // ---- PostToolUse Hook ----
        // Fires after every tool call, whatever the tool.
        options.hooks[claudecode::HookEvent::PostToolUse].push_back(claudecode::HookMatcher{
            std::nullopt,
            {[](const claudecode::json& input,
                const std::optional<std::string>&,
                const claudecode::HookContext&) -> std::optional<claudecode::HookOutput>
             {
                 std::string tool_name = input.value("tool_name", "");
                 log_hook("PostToolUse", "Tool: " + tool_name);
                 return claudecode::HookOutput{
                     .hook_specific_output = claudecode::json{
                         {"hookEventName", "PostToolUse"},
                         {"additionalContext", "Tool " + tool_name + " completed"},
                     },
                 };
             }}
        });

        claudecode::Client client(options);

        std::cerr << "=== Hooks Example ===\n\n";

        client.connect(
            std::make_unique<claudecode::PipeTransport>(STDIN_FILENO, STDOUT_FILENO, /*owns_handles=*/false)
        );
        if (auto info = client.server_info())
            std::cerr << "Initialized: " << info->dump() << "\n\n";

        client.send_message(prompt);

        auto messages = client.receive_response();
        if (!messages.empty() && claudecode::envelope_type(messages.back()) == claudecode::message_type::kResult)
            std::cerr << "\nResult: " << messages.back().value("result", "") << "\n";

        while (auto error = client.receive_error_for(std::chrono::milliseconds(0)))
            std::cerr << "[ERROR:" << claudecode::to_string(error->kind) << "] " << error->message << "\n";

        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << "\n=== Hook Log (" << g_hook_log.size() << " entries) ===\n";
            for (const auto& entry : g_hook_log)
                std::cerr << entry.hook_type << " | " << entry.detail << "\n";
        }

        client.close();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
