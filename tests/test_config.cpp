//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: GoogleTests for command-line/environment configuration and endpoint path helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include "toolhost/Config.h"
#include "toolhost/StreamableHTTPServer.hpp"

using namespace toolhost;

namespace {

// Owns argv storage for ServerConfig::FromArgs.
struct Argv {
    std::vector<std::string> args;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        args.insert(args.begin(), "toolhost_server");
        for (auto& s : args) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args.size()); }
    char** argv() { return ptrs.data(); }
};

ServerConfig parse(std::vector<std::string> args) {
    Argv a(std::move(args));
    return ServerConfig::FromArgs(a.argc(), a.argv());
}

// Clears the variables ServerConfig reads so the host environment does not leak into tests.
void clearConfigEnv() {
    for (const char* name : {"TRANSPORT", "APP_ADDRESS", "BASE_PATH", "STREAMABLE_HTTP_PATH", "TOOLHOST_LOG_LEVEL"}) {
        ::unsetenv(name);
    }
}

} // namespace

TEST(Config, Defaults) {
    clearConfigEnv();
    ServerConfig cfg = parse({});
    EXPECT_EQ(cfg.transport, ServerConfig::Transport::Stdio);
    EXPECT_EQ(cfg.host, "localhost");
    EXPECT_EQ(cfg.port, "8000");
    EXPECT_EQ(cfg.EndpointPath(), "/mcp");
    EXPECT_EQ(cfg.AliasPath(), "/sse");
    EXPECT_FALSE(cfg.debug);
    EXPECT_FALSE(cfg.UseTls());
    EXPECT_EQ(std::string(TransportName(cfg.transport)), "stdio");
}

TEST(Config, FlagsOverrideEnvironment) {
    clearConfigEnv();
    ::setenv("TRANSPORT", "stdio", 1);
    ::setenv("APP_ADDRESS", "0.0.0.0:9000", 1);
    ServerConfig cfg = parse({"--transport=streamable-http", "--base-path=/api/", "--debug", "--json-response"});
    EXPECT_EQ(cfg.transport, ServerConfig::Transport::StreamableHttp);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, "9000");
    EXPECT_EQ(cfg.MountPath(), "/api");
    EXPECT_EQ(cfg.EndpointPath(), "/api/mcp");
    EXPECT_EQ(cfg.AliasPath(), "/api/sse");
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.jsonResponse);
    clearConfigEnv();
}

TEST(Config, InvalidValuesRejected) {
    clearConfigEnv();
    EXPECT_THROW(parse({"--transport=carrier-pigeon"}), std::invalid_argument);
    EXPECT_THROW(parse({"--address=nohostport"}), std::invalid_argument);
    EXPECT_THROW(parse({"--address=host:http"}), std::invalid_argument);
    EXPECT_THROW(parse({"--address=host:70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--cert=server.pem"}), std::invalid_argument);
}

TEST(Config, UnknownLogLevelFallsBackToInfo) {
    clearConfigEnv();
    ServerConfig cfg = parse({"--log-level=chatty"});
    EXPECT_EQ(cfg.logLevel, "INFO");
}

TEST(Config, TlsRequiresBothFiles) {
    clearConfigEnv();
    ServerConfig cfg = parse({"--cert=c.pem", "--key=k.pem"});
    EXPECT_TRUE(cfg.UseTls());
}

TEST(ConfigPaths, AddressForms) {
    EXPECT_EQ(ParseAddress("[::1]:8080"), std::make_pair(std::string("::1"), std::string("8080")));
    EXPECT_EQ(ParseAddress("example.com:0"), std::make_pair(std::string("example.com"), std::string("0")));
}

TEST(ConfigPaths, MountAndJoin) {
    EXPECT_EQ(NormalizeMountPath(""), "/");
    EXPECT_EQ(NormalizeMountPath("api//"), "/api");
    EXPECT_EQ(JoinPath("/", "mcp"), "/mcp");
    EXPECT_EQ(JoinPath("/api/", "/mcp/"), "/api/mcp");
    EXPECT_EQ(JoinPath("/api", ""), "/api");
}

TEST(ConfigPaths, ResolveEndpoint) {
    EXPECT_EQ(ResolveEndpointPath("", "/api", "mcp"), "/api/mcp");
    EXPECT_EQ(ResolveEndpointPath("stream", "/api", "mcp"), "/api/stream");
    EXPECT_EQ(ResolveEndpointPath("/absolute/", "/api", "mcp"), "/absolute");
    EXPECT_EQ(ResolveEndpointPath("/", "/api", "mcp"), "/");
}

TEST(FactoryOptions, ParsesConfigurationStrings) {
    auto o = StreamableHTTPServerFactory::ParseOptions("https://0.0.0.0:8443/tools?cert=c.pem&key=k.pem&json=1");
    EXPECT_EQ(o.scheme, "https");
    EXPECT_EQ(o.address, "0.0.0.0");
    EXPECT_EQ(o.port, "8443");
    EXPECT_EQ(o.endpointPath, "/tools");
    EXPECT_EQ(o.certFile, "c.pem");
    EXPECT_EQ(o.keyFile, "k.pem");
    EXPECT_TRUE(o.jsonResponse);

    auto d = StreamableHTTPServerFactory::ParseOptions("127.0.0.1");
    EXPECT_EQ(d.scheme, "http");
    EXPECT_EQ(d.port, "8000");
    EXPECT_EQ(d.endpointPath, "/mcp");
    EXPECT_FALSE(d.jsonResponse);
}
