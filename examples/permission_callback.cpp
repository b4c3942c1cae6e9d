// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file permission_callback.cpp
/// @brief Example demonstrating permission callbacks for tool execution control
///
/// The agent is expected on the other end of stdin/stdout, e.g.
///   socat EXEC:"claude --input-format stream-json --output-format stream-json" EXEC:./permission_callback
/// stdout carries the protocol, so everything human-readable goes to stderr.

#include <chrono>
#include <claudecode/claudecode.hpp>
#include <csignal>
#include <ctime>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

// Track tool usage for auditing
struct ToolUsageLog
{
    std::string tool_name;
    std::string timestamp;
    bool allowed;
    std::string reason;
};

std::vector<ToolUsageLog> g_tool_usage_log;
std::mutex g_log_mutex;

void log_tool_usage(const std::string& tool_name, bool allowed, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::string timestamp = std::ctime(&time_t);
    if (!timestamp.empty() && timestamp.back() == '\n')
        timestamp.pop_back();

    g_tool_usage_log.push_back({tool_name, timestamp, allowed, reason});

    std::cerr << "[PERMISSION] " << timestamp << " - " << tool_name << ": "
              << (allowed ? "ALLOWED" : "DENIED") << " (" << reason << ")\n";
}

int main(int argc, char* argv[])
{
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::string prompt = argc > 1 ? argv[1] : "List the files in the current directory, then delete them.";

        std::set<std::string> safe_tools = {"Read", "Glob", "Grep", "LS"};
        std::set<std::string> dangerous_tools = {"Bash", "Write", "Edit"};

        claudecode::SessionOptions options = claudecode::SessionOptions::from_env();
        options.initialize = true;
        options.can_use_tool = [&](const std::string& tool_name,
                                   const claudecode::json& input,
                                   const claudecode::ToolPermissionContext& context) -> claudecode::PermissionResult
        {
            if (safe_tools.count(tool_name))
            {
                log_tool_usage(tool_name, true, "Safe tool - auto-approved");
                return claudecode::PermissionResultAllow{};
            }

            if (dangerous_tools.count(tool_name))
            {
                // Let read-only shell commands through, rewritten to be verbose
                if (tool_name == "Bash" && input.value("command", "").rfind("ls", 0) == 0)
                {
                    log_tool_usage(tool_name, true, "Listing only - rewritten to ls -la");
                    claudecode::json rewritten = input;
                    rewritten["command"] = "ls -la";
                    return claudecode::PermissionResultAllow{.updated_input = rewritten};
                }

                std::string reason = "Dangerous tool - blocked by policy";
                if (context.blocked_path)
                    reason += " (path " + *context.blocked_path + ")";
                log_tool_usage(tool_name, false, reason);
                return claudecode::PermissionResultDeny{.message = reason};
            }

            log_tool_usage(tool_name, true, "Unknown tool - allowed by default");
            return claudecode::PermissionResultAllow{};
        };

        claudecode::Client client(options);

        std::cerr << "=== Permission Callback Example ===\n\n";
        std::cerr << "- Safe tools (Read, Glob, Grep, LS): always allowed\n";
        std::cerr << "- Dangerous tools (Bash, Write, Edit): denied unless harmless\n\n";

        client.connect(
            std::make_unique<claudecode::PipeTransport>(STDIN_FILENO, STDOUT_FILENO, /*owns_handles=*/false)
        );
        client.send_message(prompt);

        for (const auto& message : client.receive_response())
        {
            if (claudecode::envelope_type(message) == claudecode::message_type::kAssistant)
                std::cerr << "\nAssistant: " << message["message"].dump() << "\n";
        }

        while (auto error = client.receive_error_for(std::chrono::milliseconds(0)))
            std::cerr << "[ERROR:" << claudecode::to_string(error->kind) << "] " << error->message << "\n";

        std::cerr << "\n=== Tool Usage Log ===\n";
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            for (const auto& entry : g_tool_usage_log)
            {
                std::cerr << entry.timestamp << " | " << entry.tool_name << " | "
                          << (entry.allowed ? "ALLOWED" : "DENIED") << " | " << entry.reason << "\n";
            }
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
