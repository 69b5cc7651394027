//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CompatibilityLayer.cpp
// Purpose: Startup overrides for the streamable HTTP server
//==========================================================================================================

#include "toolhost/CompatibilityLayer.h"

#include <algorithm>
#include <cctype>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/http/ContentNegotiation.h"

namespace toolhost {

namespace {

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string envKey(const std::string& prefix, const std::string& suffix) {
    std::string key = prefix + suffix;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    return key;
}

std::optional<std::string> lookupPreprompt(const std::string& prefix, const std::string& headerValue) {
    if (headerValue.empty()) {
        return std::nullopt;
    }
    auto value = GetEnvOptional(envKey(prefix, headerValue).c_str());
    if (!value.has_value()) {
        return std::nullopt;
    }
    std::string text = trimmed(*value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

double secondsFromEnv(const char* name, double defaultValue) {
    if (!GetEnvOptional(name).has_value()) {
        return defaultValue;
    }
    auto parsed = GetEnvSeconds(name);
    if (!parsed.has_value()) {
        LOG_WARN("Ignoring invalid value for {}; using {}s", name, defaultValue);
        return defaultValue;
    }
    return *parsed;
}

std::chrono::milliseconds toMillis(double seconds) {
    const double maxSeconds = static_cast<double>(kMaxListenerTimeout.count()) / 1000.0;
    if (seconds >= maxSeconds) {
        return kMaxListenerTimeout;
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

ListenerTimeouts LoadListenerTimeoutsFromEnv() {
    const double keepAlive = secondsFromEnv("MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE", 65.0);
    const double notify = secondsFromEnv("MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY", 120.0);
    const double graceful = secondsFromEnv("MCP_STREAMABLE_HTTP_TIMEOUT_GRACEFUL_SHUTDOWN", std::max(notify, 120.0));

    const double sessionIdle = secondsFromEnv("MCP_STREAMABLE_HTTP_TIMEOUT_SESSION_IDLE", 1800.0);

    LOG_INFO("Streamable HTTP timeouts configured (keep_alive={}s, notify={}s, graceful_shutdown={}s, session_idle={}s)",
             keepAlive, notify, graceful, sessionIdle);

    ListenerTimeouts timeouts;
    timeouts.keepAlive = toMillis(keepAlive);
    timeouts.notify = toMillis(notify);
    timeouts.gracefulShutdown = toMillis(graceful);
    timeouts.sessionIdle = toMillis(sessionIdle);
    return timeouts;
}

std::optional<std::string> ResolveRequestInstructions(const HeaderMap& headers, const std::string& defaultText) {
    if (auto text = lookupPreprompt("MCP_PREPROMPT_", HeaderValue(headers, "x-preprompt-id")); text.has_value()) {
        return text;
    }
    if (auto text = lookupPreprompt("MCP_PREPROMPT_TENANT_", HeaderValue(headers, "x-tenant")); text.has_value()) {
        return text;
    }
    std::string headerText = trimmed(HeaderValue(headers, "x-preprompt"));
    if (!headerText.empty()) {
        return headerText;
    }
    std::string fallback = trimmed(defaultText);
    if (!fallback.empty()) {
        return fallback;
    }
    return std::nullopt;
}

http::StreamEvent BuildSessionUpdateEvent(const std::string& instructions) {
    JSONValue::Object session;
    session["instructions"] = std::make_shared<JSONValue>(instructions);
    JSONValue::Object payload;
    payload["type"] = std::make_shared<JSONValue>("session.update");
    payload["session"] = std::make_shared<JSONValue>(std::move(session));

    http::StreamEvent ev;
    ev.event = "message";
    ev.data = SerializeJSON(JSONValue{std::move(payload)});
    return ev;
}

CompatibilityLayer::CompatibilityLayer()
    : instructions(std::make_shared<InstructionsState>()) {}

void CompatibilityLayer::InstallLenientAccept(StreamableHTTPServer& server) {
    if (lenientAcceptApplied) {
        return;
    }
    server.SetAcceptNegotiator(&http::NegotiateAcceptLenient);
    lenientAcceptApplied = true;
    LOG_DEBUG("Lenient Accept negotiation installed");
}

void CompatibilityLayer::ApplyListenerTimeoutsFromEnv(StreamableHTTPServer& server) {
    if (timeoutsApplied) {
        return;
    }
    server.SetTimeouts(LoadListenerTimeoutsFromEnv());
    timeoutsApplied = true;
}

void CompatibilityLayer::InstallPostAlias(StreamableHTTPServer& server, const std::string& aliasPath) {
    if (postAliasApplied) {
        return;
    }
    if (aliasPath.empty() || aliasPath == server.GetOptions().endpointPath) {
        LOG_DEBUG("POST alias skipped (path '{}')", aliasPath);
        return;
    }
    server.AddPostAlias(aliasPath);
    postAliasApplied = true;
    LOG_INFO("POST alias installed at {}", aliasPath);
}

void CompatibilityLayer::InstallInstructionsInjection(StreamableHTTPServer& server) {
    if (instructionsApplied) {
        return;
    }
    auto state = instructions;
    server.SetResponseEventInjector(
        [state](const JSONRPCRequest& request, const HeaderMap& headers) -> std::optional<http::StreamEvent> {
            if (request.method != Methods::Initialize) {
                return std::nullopt;
            }
            std::string defaultText;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                defaultText = state->text;
            }
            auto text = ResolveRequestInstructions(headers, defaultText);
            if (!text.has_value()) {
                return std::nullopt;
            }
            return BuildSessionUpdateEvent(*text);
        });
    instructionsApplied = true;
}

void CompatibilityLayer::InstallAll(StreamableHTTPServer& server, const std::string& aliasPath) {
    InstallLenientAccept(server);
    ApplyListenerTimeoutsFromEnv(server);
    InstallPostAlias(server, aliasPath);
    InstallInstructionsInjection(server);
}

void CompatibilityLayer::SetInstructions(const std::string& text) {
    std::lock_guard<std::mutex> lock(instructions->mutex);
    instructions->text = trimmed(text);
}

std::string CompatibilityLayer::Instructions() const {
    std::lock_guard<std::mutex> lock(instructions->mutex);
    return instructions->text;
}

} // namespace toolhost
