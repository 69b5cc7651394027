//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolhost server example (stdio or streamable HTTP)
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/CompatibilityLayer.h"
#include "toolhost/Config.h"
#include "toolhost/Dispatcher.h"
#include "toolhost/Instructions.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/StreamableHTTPServer.hpp"
#include "toolhost/ToolRegistry.h"
#include "toolhost/version.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace toolhost;
using namespace toolhost::schema;

namespace {

std::atomic<bool> gStopRequested{false};

extern "C" void onSignal(int) {
    gStopRequested.store(true);
}

std::string stringArg(const JSONValue::Object& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || !it->second || !it->second->IsString()) {
        return std::string();
    }
    return std::get<std::string>(it->second->value);
}

double numberArg(const JSONValue::Object& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || !it->second) {
        return 0.0;
    }
    if (std::holds_alternative<int64_t>(it->second->value)) {
        return static_cast<double>(std::get<int64_t>(it->second->value));
    }
    if (std::holds_alternative<double>(it->second->value)) {
        return std::get<double>(it->second->value);
    }
    throw std::invalid_argument("Argument '" + key + "' must be a number");
}

//==========================================================================================================
// Registers the demonstration tools.
//   echo            returns its message
//   add             sums two numbers (structured result)
//   describe_caller reports the caller configuration seen by the session (uses the tool context)
//   search          filters a fixed catalog by query, optional limit and label list
//==========================================================================================================
void registerDemoTools(ToolRegistry& registry) {
    registry.Register("echo", "Echo", "Echo a message back to the caller",
        {ParameterSpec::Required("message", TypeDescriptor::String())},
        [](const JSONValue::Object& args, ToolContext*) {
            std::promise<JSONValue> p;
            p.set_value(JSONValue{stringArg(args, "message")});
            return p.get_future();
        });

    registry.Register("add", "Add", "Add two numbers",
        {ParameterSpec::Required("a", TypeDescriptor::Number()),
         ParameterSpec::Required("b", TypeDescriptor::Number())},
        [](const JSONValue::Object& args, ToolContext*) {
            return std::async(std::launch::async, [args]() {
                JSONValue::Object out;
                out["sum"] = std::make_shared<JSONValue>(numberArg(args, "a") + numberArg(args, "b"));
                return JSONValue{out};
            });
        });

    registry.Register("describe_caller", "Describe caller",
        "Report the upstream endpoint and which credentials the caller supplied",
        {ParameterSpec::Context()},
        [](const JSONValue::Object&, ToolContext* ctx) {
            return std::async(std::launch::async, [ctx]() {
                JSONValue::Object out;
                if (ctx == nullptr) {
                    return JSONValue{out};
                }
                ctx->Log(Logger::Level::INFO, "describe_caller invoked");
                CallerConfig cfg = ctx->CallerConfiguration();
                out["sessionId"] = std::make_shared<JSONValue>(ctx->Session().Id());
                out["baseUrl"] = std::make_shared<JSONValue>(cfg.baseUrl);
                out["hasApiKey"] = std::make_shared<JSONValue>(!cfg.apiKey.empty());
                out["hasAccessToken"] = std::make_shared<JSONValue>(!cfg.accessToken.empty());
                out["hasIdToken"] = std::make_shared<JSONValue>(!cfg.idToken.empty());
                return JSONValue{out};
            });
        });

    registry.Register("search", "Search catalog",
        "Search a small built-in catalog by substring, optionally restricted to labels",
        {ParameterSpec::Required("query", TypeDescriptor::String()),
         ParameterSpec::WithDefault("limit", TypeDescriptor::Optional(TypeDescriptor::Integer()),
                                    JSONValue{static_cast<int64_t>(10)}),
         ParameterSpec::WithDefault("labels", TypeDescriptor::Optional(TypeDescriptor::ArrayOf(TypeDescriptor::String())),
                                    JSONValue{nullptr})},
        [](const JSONValue::Object& args, ToolContext*) {
            return std::async(std::launch::async, [args]() {
                struct Entry { const char* name; const char* label; };
                static const Entry catalog[] = {
                    {"api-gateway", "prod"}, {"api-worker", "prod"}, {"billing", "prod"},
                    {"api-sandbox", "dev"}, {"metrics-relay", "dev"}};

                const std::string query = stringArg(args, "query");
                int64_t limit = 10;
                if (auto it = args.find("limit"); it != args.end() && it->second &&
                    std::holds_alternative<int64_t>(it->second->value)) {
                    limit = std::get<int64_t>(it->second->value);
                }
                std::vector<std::string> labels;
                if (auto it = args.find("labels"); it != args.end() && it->second && it->second->IsArray()) {
                    for (const auto& v : std::get<JSONValue::Array>(it->second->value)) {
                        if (v && v->IsString()) labels.push_back(std::get<std::string>(v->value));
                    }
                }

                JSONValue::Array matches;
                for (const auto& e : catalog) {
                    if (static_cast<int64_t>(matches.size()) >= limit) break;
                    if (std::string(e.name).find(query) == std::string::npos) continue;
                    if (!labels.empty() && std::find(labels.begin(), labels.end(), e.label) == labels.end()) continue;
                    JSONValue::Object item;
                    item["name"] = std::make_shared<JSONValue>(e.name);
                    item["label"] = std::make_shared<JSONValue>(e.label);
                    matches.push_back(std::make_shared<JSONValue>(item));
                }
                JSONValue::Object out;
                out["count"] = std::make_shared<JSONValue>(static_cast<int64_t>(matches.size()));
                out["results"] = std::make_shared<JSONValue>(matches);
                return JSONValue{out};
            });
        });
}

} // namespace

int main(int argc, char** argv) {
    ServerConfig cfg;
    try {
        cfg = ServerConfig::FromArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "toolhost_server: " << e.what() << std::endl;
        return 2;
    }
    if (cfg.showVersion) {
        std::cout << "toolhost " << getVersionString() << std::endl;
        return 0;
    }
    cfg.ApplyLogging();

    auto registry = std::make_shared<ToolRegistry>();
    registerDemoTools(*registry);

    const std::string instructions = LoadInstructions();
    DispatcherOptions dopts;
    dopts.instructions = instructions;
    dopts.debug = cfg.debug;

    LOG_INFO("Server starting with transport={} ({} tools)", TransportName(cfg.transport), registry->Size());

    if (cfg.transport == ServerConfig::Transport::Stdio) {
        StdioTransport transport(registry, dopts);
        transport.Run();
        LOG_INFO("Stdio transport finished");
        return 0;
    }

    StreamableHTTPServer::Options opts;
    opts.address = cfg.host;
    opts.port = cfg.port;
    opts.endpointPath = cfg.EndpointPath();
    opts.jsonResponse = cfg.jsonResponse;
    if (cfg.UseTls()) {
        opts.scheme = "https";
        opts.certFile = cfg.certFile;
        opts.keyFile = cfg.keyFile;
    }

    StreamableHTTPServer server(opts, registry, dopts);
    CompatibilityLayer compat;
    compat.SetInstructions(instructions);
    compat.InstallAll(server, cfg.AliasPath());

    server.SetErrorHandler([](const std::string& err) {
        LOG_ERROR("Streamable HTTP server error: {}", err);
    });

    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: {}", e.what());
        return 1;
    }
    LOG_INFO("Listening at {}://{}:{}{} (alias {})", opts.scheme, opts.address, server.BoundPort(),
             opts.endpointPath, cfg.AliasPath());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!gStopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down (graceful deadline {} ms)", server.GetTimeouts().gracefulShutdown.count());
    server.Stop().get();
    return 0;
}
