//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_compatibility_layer.cpp
// Purpose: GoogleTests for instruction resolution, listener timeouts from the environment and
//          idempotent installation of the startup overrides
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "toolhost/CompatibilityLayer.h"
#include "toolhost/Instructions.h"

using namespace toolhost;

namespace {

void clearTimeoutEnv() {
    ::unsetenv("MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE");
    ::unsetenv("MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY");
    ::unsetenv("MCP_STREAMABLE_HTTP_TIMEOUT_GRACEFUL_SHUTDOWN");
    ::unsetenv("MCP_STREAMABLE_HTTP_TIMEOUT_SESSION_IDLE");
}

std::string instructionsOf(const http::StreamEvent& ev) {
    JSONValue payload = ParseJSON(ev.data);
    const JSONValue* session = FindMember(payload, "session");
    return std::get<std::string>(FindMember(*session, "instructions")->value);
}

std::unique_ptr<StreamableHTTPServer> makeServer() {
    StreamableHTTPServer::Options opts;
    opts.port = "0";
    return std::make_unique<StreamableHTTPServer>(opts, std::make_shared<ToolRegistry>(), DispatcherOptions());
}

} // namespace

TEST(ListenerTimeouts, DefaultsWhenUnset) {
    clearTimeoutEnv();
    ListenerTimeouts t = LoadListenerTimeoutsFromEnv();
    EXPECT_EQ(t.keepAlive.count(), 65000);
    EXPECT_EQ(t.notify.count(), 120000);
    EXPECT_EQ(t.gracefulShutdown.count(), 120000);
    EXPECT_EQ(t.sessionIdle.count(), 1800000);
}

TEST(ListenerTimeouts, ReadsEnvironment) {
    clearTimeoutEnv();
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE", "70", 1);
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY", "150", 1);
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_GRACEFUL_SHUTDOWN", "200", 1);
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_SESSION_IDLE", "0", 1);
    ListenerTimeouts t = LoadListenerTimeoutsFromEnv();
    EXPECT_EQ(t.keepAlive.count(), 70000);
    EXPECT_EQ(t.notify.count(), 150000);
    EXPECT_EQ(t.gracefulShutdown.count(), 200000);
    EXPECT_EQ(t.sessionIdle.count(), 0);
    clearTimeoutEnv();
}

TEST(ListenerTimeouts, GracefulFollowsLongerNotify) {
    clearTimeoutEnv();
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY", "300.5", 1);
    ListenerTimeouts t = LoadListenerTimeoutsFromEnv();
    EXPECT_EQ(t.notify.count(), 300500);
    EXPECT_EQ(t.gracefulShutdown.count(), 300500);
    clearTimeoutEnv();
}

TEST(ListenerTimeouts, InvalidValuesUseDefaults) {
    clearTimeoutEnv();
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE", "soon", 1);
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY", "-5", 1);
    ListenerTimeouts t = LoadListenerTimeoutsFromEnv();
    EXPECT_EQ(t.keepAlive.count(), 65000);
    EXPECT_EQ(t.notify.count(), 120000);
    clearTimeoutEnv();
}

TEST(ListenerTimeouts, HugeValuesAreClamped) {
    clearTimeoutEnv();
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE", "1e300", 1);
    ::setenv("MCP_STREAMABLE_HTTP_TIMEOUT_GRACEFUL_SHUTDOWN", "1e300", 1);
    ListenerTimeouts t = LoadListenerTimeoutsFromEnv();
    EXPECT_EQ(t.keepAlive, kMaxListenerTimeout);
    EXPECT_EQ(t.gracefulShutdown, kMaxListenerTimeout);
    EXPECT_EQ(t.notify.count(), 120000);
    EXPECT_GT(std::chrono::steady_clock::now() + t.gracefulShutdown, std::chrono::steady_clock::now());
    clearTimeoutEnv();
}

TEST(ListenerTimeouts, ServerClampsExplicitValues) {
    auto server = makeServer();
    server->SetTimeouts(ListenerTimeouts{std::chrono::milliseconds::max(), std::chrono::milliseconds(-5),
                                         std::chrono::milliseconds(1500)});
    ListenerTimeouts t = server->GetTimeouts();
    EXPECT_EQ(t.keepAlive, kMaxListenerTimeout);
    EXPECT_EQ(t.notify.count(), 0);
    EXPECT_EQ(t.gracefulShutdown.count(), 1500);
}

TEST(RequestInstructions, ResolutionOrder) {
    ::setenv("MCP_PREPROMPT_SUPPORT_DESK", "  From template  ", 1);
    ::setenv("MCP_PREPROMPT_TENANT_ACME", "From tenant", 1);

    HeaderMap all{{"x-preprompt-id", "support-desk"}, {"x-tenant", "acme"}, {"x-preprompt", "From header"}};
    EXPECT_EQ(ResolveRequestInstructions(all, "Default"), std::optional<std::string>("From template"));

    HeaderMap tenant{{"x-preprompt-id", "unknown"}, {"x-tenant", "acme"}, {"x-preprompt", "From header"}};
    EXPECT_EQ(ResolveRequestInstructions(tenant, "Default"), std::optional<std::string>("From tenant"));

    HeaderMap header{{"x-preprompt", "  From header "}};
    EXPECT_EQ(ResolveRequestInstructions(header, "Default"), std::optional<std::string>("From header"));

    EXPECT_EQ(ResolveRequestInstructions(HeaderMap{}, "  Default\n"), std::optional<std::string>("Default"));
    EXPECT_FALSE(ResolveRequestInstructions(HeaderMap{{"x-preprompt", "   "}}, "").has_value());

    ::unsetenv("MCP_PREPROMPT_SUPPORT_DESK");
    ::unsetenv("MCP_PREPROMPT_TENANT_ACME");
}

TEST(RequestInstructions, SessionUpdateEventShape) {
    http::StreamEvent ev = BuildSessionUpdateEvent("Be brief \"always\"");
    EXPECT_EQ(ev.event, "message");
    EXPECT_FALSE(ev.terminal);
    JSONValue payload = ParseJSON(ev.data);
    EXPECT_EQ(std::get<std::string>(FindMember(payload, "type")->value), "session.update");
    EXPECT_EQ(instructionsOf(ev), "Be brief \"always\"");
}

TEST(CompatibilityLayer, InstallationIsIdempotent) {
    auto server = makeServer();
    CompatibilityLayer layer;
    EXPECT_FALSE(layer.LenientAcceptInstalled());
    layer.InstallAll(*server, "/sse");
    EXPECT_TRUE(layer.LenientAcceptInstalled());
    EXPECT_TRUE(layer.TimeoutsApplied());
    EXPECT_TRUE(layer.PostAliasInstalled());
    EXPECT_TRUE(layer.InstructionsInjectionInstalled());

    // A second round changes nothing, even with a different alias
    server->SetTimeouts(ListenerTimeouts{std::chrono::milliseconds(1), std::chrono::milliseconds(2),
                                         std::chrono::milliseconds(3)});
    layer.InstallAll(*server, "/other");
    EXPECT_EQ(server->GetTimeouts().keepAlive.count(), 1);
}

TEST(CompatibilityLayer, AliasEqualToEndpointIsSkipped) {
    auto server = makeServer();
    CompatibilityLayer layer;
    layer.InstallPostAlias(*server, "/mcp");
    EXPECT_FALSE(layer.PostAliasInstalled());
}

TEST(CompatibilityLayer, InstructionsAreTrimmed) {
    CompatibilityLayer layer;
    layer.SetInstructions("\n  Prefer summaries.  \n");
    EXPECT_EQ(layer.Instructions(), "Prefer summaries.");
    layer.SetInstructions("   ");
    EXPECT_EQ(layer.Instructions(), "");
}

TEST(Instructions, LoadsFromEnvironmentPath) {
    const std::string path = ::testing::TempDir() + "toolhost_instructions_test.md";
    {
        std::ofstream out(path);
        out << "\n  Custom instructions for tests.\n\n";
    }
    ::setenv("MCP_INSTRUCTIONS_PATH", path.c_str(), 1);
    EXPECT_EQ(LoadInstructions(), "Custom instructions for tests.");
    ::unsetenv("MCP_INSTRUCTIONS_PATH");
    std::remove(path.c_str());
}

TEST(Instructions, DefaultWhenNothingConfigured) {
    ::setenv("MCP_INSTRUCTIONS_PATH", "/nonexistent/toolhost/instructions.md", 1);
    const std::string text = LoadInstructions();
    EXPECT_FALSE(text.empty());
    ::unsetenv("MCP_INSTRUCTIONS_PATH");
    EXPECT_FALSE(DefaultInstructions().empty());
}
