// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file mcp_servers.cpp
/// @brief Example demonstrating an in-process (SDK) MCP server
///
/// The agent reaches SDK MCP servers through `mcp_message` control requests.
/// This example hosts a tiny calculator server answering the JSON-RPC methods
/// `initialize`, `tools/list` and `tools/call`.
///
/// Run with the agent connected to stdin/stdout (see permission_callback.cpp).

#include <chrono>
#include <claudecode/claudecode.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h>

using claudecode::json;

namespace
{

json rpc_result(const json& request, json result)
{
    return json{{"jsonrpc", "2.0"}, {"id", request.value("id", json())}, {"result", std::move(result)}};
}

json rpc_error(const json& request, int code, const std::string& message)
{
    return json{
        {"jsonrpc", "2.0"},
        {"id", request.value("id", json())},
        {"error", {{"code", code}, {"message", message}}},
    };
}

json number_schema()
{
    return json{
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", json::array({"a", "b"})},
    };
}

/// JSON-RPC handler for the calculator server
json handle_calculator(const json& request)
{
    std::string method = request.value("method", "");
    std::cerr << "[MCP:calculator] " << method << "\n";

    if (method == "initialize")
    {
        return rpc_result(
            request,
            {
                {"protocolVersion", "2024-11-05"},
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", "calculator"}, {"version", "1.0.0"}}},
            }
        );
    }

    if (method == "notifications/initialized")
        return rpc_result(request, json::object());

    if (method == "tools/list")
    {
        return rpc_result(
            request,
            {{"tools",
              {
                  {{"name", "add"}, {"description", "Add two numbers"}, {"inputSchema", number_schema()}},
                  {{"name", "multiply"}, {"description", "Multiply two numbers"}, {"inputSchema", number_schema()}},
              }}}
        );
    }

    if (method == "tools/call")
    {
        const json params = request.value("params", json::object());
        std::string tool = params.value("name", "");
        const json args = params.value("arguments", json::object());
        double a = args.value("a", 0.0);
        double b = args.value("b", 0.0);

        double value;
        if (tool == "add")
            value = a + b;
        else if (tool == "multiply")
            value = a * b;
        else
            return rpc_error(request, -32602, "Unknown tool: " + tool);

        return rpc_result(request, {{"content", {{{"type", "text"}, {"text", std::to_string(value)}}}}});
    }

    return rpc_error(request, -32601, "Method not found: " + method);
}

} // namespace

int main(int argc, char* argv[])
{
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::string prompt = argc > 1 ? argv[1] : "Use the calculator to add 19 and 23, then multiply by 2.";

        claudecode::SessionOptions options = claudecode::SessionOptions::from_env();
        options.initialize = true;
        options.mcp_servers["calculator"] = claudecode::SdkMcpServer{
            .name = "calculator",
            .handler = handle_calculator,
        };

        claudecode::Client client(options);

        std::cerr << "=== SDK MCP Server Example ===\n\n";

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

        client.close();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
