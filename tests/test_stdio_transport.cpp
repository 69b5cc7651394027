//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: GoogleTests for the newline-delimited stdio loop (framing, parse errors, notifications)
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "logging/Logger.h"
#include "toolhost/Config.h"
#include "toolhost/Instructions.h"
#include "toolhost/StdioTransport.hpp"

using namespace toolhost;
using namespace toolhost::schema;

namespace {

std::shared_ptr<ToolRegistry> makeRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    registry->Register("echo", "Echo", "Echo a message",
        {ParameterSpec::Required("message", TypeDescriptor::String())},
        [](const JSONValue::Object& args, ToolContext*) {
            std::promise<JSONValue> p;
            p.set_value(*args.at("message"));
            return p.get_future();
        });
    registry->Register("chatty", "", "Logs before answering",
        {ParameterSpec::Context()},
        [](const JSONValue::Object&, ToolContext* ctx) {
            ctx->Log(Logger::Level::ERROR, "about to answer");
            std::promise<JSONValue> p;
            p.set_value(JSONValue{std::string("done")});
            return p.get_future();
        });
    registry->Register("boom", "", "Throws a non-standard exception", {},
        [](const JSONValue::Object&, ToolContext*) -> std::future<JSONValue> {
            throw 42;
        });
    return registry;
}

std::vector<JSONValue> outputLines(const std::string& text) {
    std::vector<JSONValue> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(ParseJSON(line));
    }
    return lines;
}

std::vector<JSONValue> runSession(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    StdioTransport transport(makeRegistry(), DispatcherOptions(), in, out);
    transport.Run();
    EXPECT_FALSE(transport.IsRunning());
    EXPECT_TRUE(transport.Session().StopRequested());
    return outputLines(out.str());
}

int errorCode(const JSONValue& msg) {
    return static_cast<int>(std::get<int64_t>(FindMember(*FindMember(msg, "error"), "code")->value));
}

const std::string kInit =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18"}})" "\n";

} // namespace

TEST(StdioTransport, InitializeListAndCall) {
    auto lines = runSession(kInit +
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":"three","method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})" "\n");

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[0], "id")->value), 1);
    EXPECT_NE(FindMember(lines[0], "result"), nullptr);

    const JSONValue* tools = FindMember(*FindMember(lines[1], "result"), "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(tools->value).size(), 3u);

    EXPECT_EQ(std::get<std::string>(FindMember(lines[2], "id")->value), "three");
    const JSONValue* result = FindMember(lines[2], "result");
    ASSERT_NE(result, nullptr);
    const auto& content = std::get<JSONValue::Array>(FindMember(*result, "content")->value);
    EXPECT_EQ(std::get<std::string>(FindMember(*content[0], "text")->value), "hi");
}

TEST(StdioTransport, ParseErrorKeepsLoopAlive) {
    auto lines = runSession("{not json\n" + kInit);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(FindMember(lines[0], "id")->IsNull());
    EXPECT_EQ(errorCode(lines[0]), -32700);
    EXPECT_NE(FindMember(lines[1], "result"), nullptr);
}

TEST(StdioTransport, BlankLinesAndClientResponsesProduceNoOutput) {
    auto lines = runSession("\n   \n"
        R"({"jsonrpc":"2.0","id":7,"result":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":1}})" "\n");
    EXPECT_TRUE(lines.empty());
}

TEST(StdioTransport, InvalidRequestsAnswered) {
    auto lines = runSession(
        R"({"jsonrpc":"2.0","id":5,"method":"ping","params":[1]})" "\n"
        "[1,2,3]\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[0], "id")->value), 5);
    EXPECT_EQ(errorCode(lines[0]), -32600);
    EXPECT_TRUE(FindMember(lines[1], "id")->IsNull());
    EXPECT_EQ(errorCode(lines[1]), -32600);
}

TEST(StdioTransport, RequestsWithoutVersionOrWithNullParamsAreDispatched) {
    auto lines = runSession(kInit +
        R"({"id":2,"method":"ping"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"ping","params":null})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"tools/list","params":null})" "\n");
    ASSERT_EQ(lines.size(), 4u);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        EXPECT_EQ(std::get<int64_t>(FindMember(lines[i], "id")->value), static_cast<int64_t>(i + 1));
        EXPECT_NE(FindMember(lines[i], "result"), nullptr);
        EXPECT_EQ(FindMember(lines[i], "error"), nullptr);
    }
    EXPECT_EQ(std::get<std::string>(FindMember(lines[1], "jsonrpc")->value), "2.0");
}

TEST(StdioTransport, NonStandardToolExceptionKeepsLoopAlive) {
    auto lines = runSession(kInit +
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"boom"}})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"ping"})" "\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[1], "id")->value), 2);
    EXPECT_EQ(errorCode(lines[1]), -32603);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[2], "id")->value), 3);
    EXPECT_NE(FindMember(lines[2], "result"), nullptr);
}

TEST(StdioTransport, UninitializedCallIsRejected) {
    auto lines = runSession(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(errorCode(lines[0]), -32600);
}

TEST(StdioTransport, ToolNotificationsPrecedeResponse) {
    auto lines = runSession(kInit +
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"chatty"}})" "\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(std::get<std::string>(FindMember(lines[1], "method")->value), "notifications/message");
    EXPECT_EQ(FindMember(lines[1], "id"), nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[2], "id")->value), 2);
}

TEST(StdioTransport, HandleLineSingleMessage) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(makeRegistry(), DispatcherOptions(), in, out);
    EXPECT_TRUE(transport.HandleLine(R"({"jsonrpc":"2.0","id":9,"method":"ping"})"));
    auto lines = outputLines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(FindMember(lines[0], "id")->value), 9);
    EXPECT_TRUE(FindMember(lines[0], "result")->IsObject());
}

TEST(StdioTransport, StopsWhenOutputFails) {
    std::istringstream in(kInit + kInit);
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(makeRegistry(), DispatcherOptions(), in, out);
    transport.Run();
    EXPECT_FALSE(transport.IsRunning());
    EXPECT_FALSE(transport.HandleLine(R"({"jsonrpc":"2.0","id":9,"method":"ping"})"));
}

TEST(StdioTransport, StartupLogsStayOffStdout) {
    ::unsetenv("TRANSPORT");
    ::unsetenv("MCP_INSTRUCTIONS_PATH");
    Logger::setStdioMode(false);

    std::istringstream in(kInit + R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n");
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* oldIn = std::cin.rdbuf(in.rdbuf());
    std::streambuf* oldOut = std::cout.rdbuf(out.rdbuf());
    std::streambuf* oldErr = std::cerr.rdbuf(err.rdbuf());

    // Same order as the server entry point: config (warns on the bad level), logging, instructions, transport
    std::string prog = "toolhost_server";
    std::string level = "--log-level=chatty";
    char* argv[] = {prog.data(), level.data(), nullptr};
    ServerConfig cfg = ServerConfig::FromArgs(2, argv);
    cfg.ApplyLogging();
    DispatcherOptions dopts;
    dopts.instructions = LoadInstructions();
    LOG_INFO("Server starting with transport={}", TransportName(cfg.transport));
    StdioTransport transport(makeRegistry(), dopts);
    transport.Run();

    std::cin.rdbuf(oldIn);
    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
        EXPECT_NO_THROW((void)ParseJSON(line)) << "non-protocol line on stdout: " << line;
    }
    EXPECT_EQ(count, 2);
    EXPECT_NE(err.str().find("Unknown log level"), std::string::npos);
    EXPECT_NE(err.str().find("Server starting"), std::string::npos);
}
