// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <claudecode/session.hpp>
#include <future>
#include <gtest/gtest.h>
#include <thread>

using namespace claudecode;
using claudecode::testing::FakeAgent;
using claudecode::testing::MemoryTransport;

// =============================================================================
// Fixture
// =============================================================================

class SessionTest : public ::testing::Test
{
  protected:
    /// Create the session and the fake agent on the other end of the stream
    void open(SessionOptions options = {}, bool start = true)
    {
        auto [session_end, agent_end] = MemoryTransport::create_pair();
        session_transport_ = session_end.get();
        agent_ = std::make_unique<FakeAgent>(std::move(agent_end));
        session_ = std::make_unique<Session>(std::move(session_end), std::move(options));
        if (start)
            session_->start();
    }

    void TearDown() override
    {
        if (session_)
            session_->close();
    }

    static std::string control_request_line(const std::string& request_id, const json& request)
    {
        return json{{"type", "control_request"}, {"request_id", request_id}, {"request", request}}.dump();
    }

    static std::string success_line(const std::string& request_id, const json& response)
    {
        return ControlResponse::success(request_id, response).to_json().dump();
    }

    std::unique_ptr<FakeAgent> agent_;
    std::unique_ptr<Session> session_;
    MemoryTransport* session_transport_ = nullptr;
};

// =============================================================================
// Line demultiplexing
// =============================================================================

TEST_F(SessionTest, ConversationMessageDelivered)
{
    open();
    agent_->send(R"({"type":"result","subtype":"success","duration_ms":120,"session_id":"s1"})");

    auto message = session_->receive_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(
        *message, json::parse(R"({"type":"result","subtype":"success","duration_ms":120,"session_id":"s1"})")
    );
    EXPECT_EQ(session_->errors().size(), 0u);
    EXPECT_EQ(session_->pending_request_count(), 0u);
}

TEST_F(SessionTest, PermissionCheckWithoutCallbackAllows)
{
    open();
    agent_->send(
        R"({"type":"control_request","request_id":"r1","request":{"subtype":"can_use_tool","tool_name":"Bash","input":{}}})"
    );

    EXPECT_EQ(
        agent_->read_line(),
        R"({"type":"control_response","response":{"subtype":"success","request_id":"r1","response":{"behavior":"allow"}}})"
    );
}

TEST_F(SessionTest, PermissionDenyIsDelivered)
{
    SessionOptions options;
    options.can_use_tool = [](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
    { return PermissionResultDeny{.message = "blocked"}; };
    open(std::move(options));

    agent_->send(
        R"({"type":"control_request","request_id":"r1","request":{"subtype":"can_use_tool","tool_name":"Bash","input":{}}})"
    );

    EXPECT_EQ(
        agent_->read_line(),
        R"({"type":"control_response","response":{"subtype":"success","request_id":"r1","response":{"behavior":"deny","message":"blocked"}}})"
    );
}

TEST_F(SessionTest, MalformedLineReportedAndSkipped)
{
    open();
    agent_->send(std::string("not-json"));
    agent_->send(R"({"type":"assistant","message":{"content":[]}})");

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Decode);
    EXPECT_EQ(error->raw_line, "not-json");

    auto message = session_->receive_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["type"], "assistant");
}

TEST_F(SessionTest, NonObjectLineIsDecodeError)
{
    open();
    agent_->send(std::string("[1,2,3]"));

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Decode);
    EXPECT_EQ(error->raw_line, "[1,2,3]");
}

TEST_F(SessionTest, BlankLinesSkipped)
{
    open();
    agent_->send(std::string(""));
    agent_->send(std::string("   "));
    agent_->send(R"({"type":"system","subtype":"init"})");

    auto message = session_->receive_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["type"], "system");
    EXPECT_EQ(session_->errors().size(), 0u);
}

TEST_F(SessionTest, UnknownShapesForwardedAsMessages)
{
    open();
    agent_->send(R"({"type":"telemetry","value":1})");
    agent_->send(R"({"no_type":true})");

    auto first = session_->receive_message();
    auto second = session_->receive_message();
    ASSERT_TRUE(first && second);
    EXPECT_EQ((*first)["type"], "telemetry");
    EXPECT_EQ((*second)["no_type"], true);
}

TEST_F(SessionTest, OversizeLineReportedAndSkipped)
{
    SessionOptions options;
    options.max_line_size = 64;
    open(std::move(options));

    agent_->send(R"({"type":"assistant","text":")" + std::string(200, 'x') + R"("})");
    agent_->send(R"({"type":"result"})");

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Decode);
    ASSERT_TRUE(error->raw_line.has_value());
    EXPECT_EQ(error->raw_line->rfind(R"({"type":"assistant")", 0), 0u);

    auto message = session_->receive_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["type"], "result");
}

TEST_F(SessionTest, MessagesDeliveredInOrderUnderBackpressure)
{
    SessionOptions options;
    options.message_queue_capacity = 2;
    open(std::move(options));

    constexpr int kCount = 100;
    std::thread producer(
        [this]
        {
            for (int i = 0; i < kCount; ++i)
                agent_->send(json{{"type", "stream"}, {"seq", i}});
        }
    );

    for (int i = 0; i < kCount; ++i)
    {
        auto message = session_->receive_message();
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ((*message)["seq"], i);
    }
    producer.join();
}

// =============================================================================
// Inbound control requests
// =============================================================================

TEST_F(SessionTest, HookCallbackDispatched)
{
    SessionOptions options;
    options.hooks[HookEvent::PreToolUse].push_back(HookMatcher{
        "Bash",
        {[](const json&, const std::optional<std::string>&, const HookContext&) -> std::optional<HookOutput>
         { return HookOutput{.system_message = "checked"}; }}
    });
    open(std::move(options));

    agent_->send(control_request_line(
        "r2", {{"subtype", "hook_callback"}, {"callback_id", "hook_PreToolUse_0"}, {"input", json::object()}}
    ));

    auto response = agent_->read_json();
    EXPECT_EQ(response["response"]["subtype"], "success");
    EXPECT_EQ(response["response"]["request_id"], "r2");
    EXPECT_EQ(response["response"]["response"], json({{"systemMessage", "checked"}}));
}

TEST_F(SessionTest, UnknownControlRequestAnsweredWithError)
{
    open();
    agent_->send(control_request_line("r3", {{"subtype", "interrupt"}}));

    EXPECT_EQ(
        agent_->read_line(),
        R"({"type":"control_response","response":{"subtype":"error","request_id":"r3","error":"unknown control request subtype: interrupt"}})"
    );
}

TEST_F(SessionTest, SlowCallbackDoesNotBlockMessages)
{
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    SessionOptions options;
    options.can_use_tool = [gate](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
    {
        gate.wait_for(std::chrono::seconds(5));
        return PermissionResultAllow{};
    };
    open(std::move(options));

    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));
    agent_->send(R"({"type":"assistant","seq":1})");

    auto message = session_->messages().pop_for(std::chrono::seconds(2));
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["seq"], 1);

    release.set_value();
    auto response = agent_->read_json();
    EXPECT_EQ(response["response"]["request_id"], "r1");
}

TEST_F(SessionTest, ResponsesMayLeaveOutOfOrder)
{
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    SessionOptions options;
    options.can_use_tool = [gate](const std::string& tool, const json&, const ToolPermissionContext&)
        -> PermissionResult
    {
        if (tool == "Slow")
            gate.wait_for(std::chrono::seconds(5));
        return PermissionResultAllow{};
    };
    open(std::move(options));

    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Slow"}}));
    agent_->send(control_request_line("r2", {{"subtype", "can_use_tool"}, {"tool_name", "Fast"}}));

    auto first = agent_->read_json();
    EXPECT_EQ(first["response"]["request_id"], "r2");

    release.set_value();
    auto second = agent_->read_json();
    EXPECT_EQ(second["response"]["request_id"], "r1");
}

TEST_F(SessionTest, ReusedInFlightRequestIdReported)
{
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    SessionOptions options;
    options.can_use_tool = [gate](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
    {
        gate.wait_for(std::chrono::seconds(5));
        return PermissionResultAllow{};
    };
    open(std::move(options));

    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));
    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Protocol);

    release.set_value();
    EXPECT_EQ(agent_->read_json()["response"]["request_id"], "r1");

    // Exactly one response for the id
    agent_->transport().set_read_timeout(std::chrono::milliseconds(100));
    EXPECT_THROW(agent_->read_line(), TransportError);
}

// =============================================================================
// Outbound control requests
// =============================================================================

TEST_F(SessionTest, InterruptWritesFirstRequestId)
{
    open();

    EXPECT_EQ(session_->interrupt(), "req_1");
    EXPECT_EQ(
        agent_->read_line(), R"({"type":"control_request","request_id":"req_1","request":{"subtype":"interrupt"}})"
    );

    // The acknowledgement of a fire-and-forget request is not an error
    agent_->send(success_line("req_1", json::object()));
    agent_->send(R"({"type":"result"})");
    ASSERT_TRUE(session_->receive_message().has_value());
    EXPECT_EQ(session_->errors().size(), 0u);
}

TEST_F(SessionTest, RequestResolvedByMatchingResponse)
{
    open();

    auto reply = session_->set_permission_mode(PermissionMode::AcceptEdits);
    auto request = agent_->read_json();
    EXPECT_EQ(request["request_id"], "req_1");
    EXPECT_EQ(request["request"], json({{"subtype", "set_permission_mode"}, {"mode", "acceptEdits"}}));

    agent_->send(success_line("req_1", {{"mode", "acceptEdits"}}));

    ASSERT_EQ(reply.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(reply.get()["mode"], "acceptEdits");
    EXPECT_EQ(session_->pending_request_count(), 0u);
}

TEST_F(SessionTest, RequestsCorrelatedRegardlessOfArrivalOrder)
{
    open();

    auto first = session_->request(ControlRequestKind::SetPermissionMode, {{"mode", "plan"}});
    auto second = session_->request(ControlRequestKind::SetPermissionMode, {{"mode", "default"}});
    EXPECT_EQ(agent_->read_json()["request_id"], "req_1");
    EXPECT_EQ(agent_->read_json()["request_id"], "req_2");

    agent_->send(success_line("req_2", {{"n", 2}}));
    agent_->send(success_line("req_1", {{"n", 1}}));

    EXPECT_EQ(first.get()["n"], 1);
    EXPECT_EQ(second.get()["n"], 2);
}

TEST_F(SessionTest, ErrorResponseRejectsRequest)
{
    open();

    auto reply = session_->set_permission_mode(PermissionMode::Plan);
    agent_->read_json();
    agent_->send(ControlResponse::failure("req_1", "mode not allowed").to_json().dump());

    try
    {
        reply.get();
        FAIL() << "Expected ControlRequestError";
    }
    catch (const ControlRequestError& e)
    {
        EXPECT_EQ(e.request_id(), "req_1");
        EXPECT_STREQ(e.what(), "mode not allowed");
    }
}

TEST_F(SessionTest, UnmatchedResponseIsProtocolError)
{
    open();
    agent_->send(success_line("req_99", json::object()));

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Protocol);
    EXPECT_NE(error->message.find("req_99"), std::string::npos);
}

TEST_F(SessionTest, RequestTimesOut)
{
    open();

    auto reply = session_->request(
        ControlRequestKind::SetPermissionMode, {{"mode", "plan"}}, std::chrono::milliseconds(50)
    );

    ASSERT_EQ(reply.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(reply.get(), ControlTimeoutError);
    EXPECT_EQ(session_->pending_request_count(), 0u);
}

TEST_F(SessionTest, InitializeHandshakeSendsHookConfig)
{
    SessionOptions options;
    options.initialize = true;
    options.hooks[HookEvent::PreToolUse].push_back(HookMatcher{
        "Bash",
        {[](const json&, const std::optional<std::string>&, const HookContext&) -> std::optional<HookOutput>
         { return std::nullopt; }}
    });
    open(std::move(options), false);

    json seen_request;
    std::thread agent_thread(
        [this, &seen_request]
        {
            seen_request = agent_->read_json();
            agent_->send(success_line(seen_request["request_id"].get<std::string>(), {{"commands", json::array()}}));
        }
    );

    session_->start();
    agent_thread.join();

    EXPECT_EQ(seen_request["request"]["subtype"], "initialize");
    EXPECT_EQ(
        seen_request["request"]["hooks"],
        json::parse(R"({"PreToolUse":[{"matcher":"Bash","hookCallbackIds":["hook_PreToolUse_0"]}]})")
    );
    ASSERT_TRUE(session_->initialize_result().has_value());
    EXPECT_TRUE((*session_->initialize_result())["commands"].is_array());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(SessionTest, StartTwiceThrows)
{
    open();
    EXPECT_THROW(session_->start(), CliConnectionError);
}

TEST_F(SessionTest, RegistrySealedOnStart)
{
    open(SessionOptions{}, false);
    session_->registry().add_mcp_server(SdkMcpServer{.name = "calc"});
    session_->start();

    EXPECT_TRUE(session_->registry().is_sealed());
    EXPECT_THROW(session_->registry().add_mcp_server(SdkMcpServer{.name = "late"}), std::logic_error);
}

TEST_F(SessionTest, SendBeforeStartThrows)
{
    open(SessionOptions{}, false);
    EXPECT_THROW(session_->interrupt(), CliConnectionError);
    EXPECT_THROW(session_->send_line("{}"), CliConnectionError);
}

TEST_F(SessionTest, EndOfStreamClosesSinksAndFailsPending)
{
    open();
    auto reply = session_->set_permission_mode(PermissionMode::Plan);
    agent_->read_json();

    agent_->send(R"({"type":"result"})");
    agent_->close();

    auto message = session_->receive_message();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(session_->receive_message(), std::nullopt);
    EXPECT_EQ(session_->receive_error(), std::nullopt);
    EXPECT_FALSE(session_->is_running());

    EXPECT_THROW(reply.get(), ConnectionClosedError);
    EXPECT_THROW(session_->interrupt(), CliConnectionError);
}

TEST_F(SessionTest, ReadFailureReportedOnce)
{
    open();
    session_transport_->fail_reads("device unplugged");

    auto error = session_->receive_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Connection);
    EXPECT_NE(error->message.find("device unplugged"), std::string::npos);

    EXPECT_EQ(session_->receive_error(), std::nullopt);
    EXPECT_EQ(session_->receive_message(), std::nullopt);
}

TEST_F(SessionTest, CloseUnblocksConsumer)
{
    open();

    auto consumer = std::async(std::launch::async, [this] { return session_->receive_message(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    session_->close();

    ASSERT_EQ(consumer.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(consumer.get(), std::nullopt);
}

TEST_F(SessionTest, CloseTwiceIsSafe)
{
    open();
    session_->close();
    EXPECT_NO_THROW(session_->close());
    EXPECT_TRUE(session_->is_closed());
    EXPECT_FALSE(session_->is_running());
    EXPECT_EQ(session_->receive_message(), std::nullopt);
}

TEST_F(SessionTest, CloseFailsPendingRequests)
{
    open();
    auto reply = session_->request(ControlRequestKind::SetPermissionMode, {{"mode", "plan"}});
    session_->close();

    ASSERT_EQ(reply.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(reply.get(), ConnectionClosedError);
}

TEST_F(SessionTest, CloseWaitsForInFlightCallbacks)
{
    std::atomic<bool> callback_finished{false};

    SessionOptions options;
    options.can_use_tool = [&callback_finished](const std::string&, const json&, const ToolPermissionContext&)
        -> PermissionResult
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        callback_finished = true;
        return PermissionResultAllow{};
    };
    open(std::move(options));

    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));
    agent_->send(R"({"type":"assistant"})");
    ASSERT_TRUE(session_->receive_message().has_value());

    session_->close();
    EXPECT_TRUE(callback_finished);
}

TEST_F(SessionTest, NullTransportRejected)
{
    EXPECT_THROW(Session(nullptr), std::invalid_argument);
}

// =============================================================================
// Failure containment
// =============================================================================

TEST_F(SessionTest, NonStandardThrowFromCallbackAnsweredOnce)
{
    SessionOptions options;
    options.can_use_tool = [](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
    { throw 42; };
    open(std::move(options));

    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));
    EXPECT_EQ(
        agent_->read_line(),
        R"({"type":"control_response","response":{"subtype":"error","request_id":"r1","error":"callback failed with a non-standard exception"}})"
    );

    // The next request reaps the finished task; the session keeps serving
    agent_->send(control_request_line("r2", {{"subtype", "can_use_tool"}, {"tool_name", "Read"}}));
    auto second = agent_->read_json();
    EXPECT_EQ(second["response"]["request_id"], "r2");
    EXPECT_EQ(second["response"]["subtype"], "error");

    agent_->send(R"({"type":"assistant"})");
    ASSERT_TRUE(session_->receive_message().has_value());
    EXPECT_TRUE(session_->is_running());

    // Exactly one response per request
    session_->close();
    EXPECT_EQ(agent_->read_line(), std::nullopt);
}

TEST_F(SessionTest, UndrainedErrorsDoNotStallMessages)
{
    SessionOptions options;
    options.error_queue_capacity = 10;
    open(std::move(options));

    for (int i = 0; i < 25; ++i)
        agent_->send("not-json " + std::to_string(i));
    agent_->send(R"({"type":"assistant"})");
    agent_->send(control_request_line("r1", {{"subtype", "can_use_tool"}, {"tool_name", "Bash"}}));

    // The consumer reads messages only
    auto message = session_->messages().pop_for(std::chrono::seconds(2));
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ((*message)["type"], "assistant");

    auto response = agent_->read_json();
    EXPECT_EQ(response["response"]["request_id"], "r1");
    EXPECT_EQ(response["response"]["subtype"], "success");

    // The oldest errors made room for the newest
    EXPECT_EQ(session_->errors().size(), 10u);
    auto oldest_kept = session_->receive_error();
    ASSERT_TRUE(oldest_kept.has_value());
    EXPECT_EQ(oldest_kept->raw_line, "not-json 15");
}

TEST_F(SessionTest, FireAndForgetSlotExpiresWithoutControlTimeout)
{
    SessionOptions options;
    options.control_timeout = std::chrono::milliseconds(0);
    options.acknowledgement_timeout = std::chrono::milliseconds(50);
    open(std::move(options));

    session_->interrupt();
    EXPECT_EQ(session_->pending_request_count(), 1u);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (session_->pending_request_count() > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(session_->pending_request_count(), 0u);
}
