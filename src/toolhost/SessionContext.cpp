//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionContext.cpp
// Purpose: Session state, caller configuration resolution and tool context notifications
//==========================================================================================================

#include "toolhost/SessionContext.h"

#include <cctype>
#include "env/EnvVars.h"
#include "toolhost/Protocol.h"

namespace toolhost {

namespace {
constexpr const char* kDefaultUpstreamUrl = "http://localhost:3000";

std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string sanitizeUrl(std::string url) {
    url = trimmed(url);
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string bearerToken(const HeaderMap& headers) {
    const std::string auth = HeaderValue(headers, "authorization");
    if (auth.size() > 7 && ToLowerAscii(auth.substr(0, 7)) == "bearer ") {
        return trimmed(auth.substr(7));
    }
    return std::string();
}

const char* clientLevelName(Logger::Level level) {
    switch (level) {
        case Logger::Level::DEBUG: return "debug";
        case Logger::Level::INFO: return "info";
        case Logger::Level::WARN: return "warning";
        case Logger::Level::ERROR: return "error";
        default: return "critical";
    }
}
} // namespace

std::string ToLowerAscii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string HeaderValue(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(ToLowerAscii(name));
    return it == headers.end() ? std::string() : it->second;
}

CallerConfig CallerConfig::FromEnvironment() {
    CallerConfig cfg;
    cfg.baseUrl = sanitizeUrl(GetEnvOrDefault("TOOLHOST_UPSTREAM_URL", kDefaultUpstreamUrl));
    if (cfg.baseUrl.empty()) cfg.baseUrl = kDefaultUpstreamUrl;
    cfg.apiKey = trimmed(GetEnvOrDefault("TOOLHOST_UPSTREAM_API_KEY", ""));
    cfg.accessToken = trimmed(GetEnvOrDefault("TOOLHOST_UPSTREAM_ACCESS_TOKEN", ""));
    cfg.idToken = trimmed(GetEnvOrDefault("TOOLHOST_UPSTREAM_ID_TOKEN", ""));
    return cfg;
}

CallerConfig CallerConfig::FromHeaders(const HeaderMap& headers) {
    const CallerConfig env = FromEnvironment();
    CallerConfig cfg;
    cfg.baseUrl = sanitizeUrl(HeaderValue(headers, "x-upstream-url"));
    if (cfg.baseUrl.empty()) cfg.baseUrl = env.baseUrl;
    cfg.apiKey = trimmed(HeaderValue(headers, "x-upstream-api-key"));
    if (cfg.apiKey.empty()) cfg.apiKey = env.apiKey;
    cfg.accessToken = trimmed(HeaderValue(headers, "x-upstream-access-token"));
    if (cfg.accessToken.empty()) {
        cfg.accessToken = env.accessToken.empty() ? bearerToken(headers) : env.accessToken;
    }
    cfg.idToken = trimmed(HeaderValue(headers, "x-upstream-id-token"));
    if (cfg.idToken.empty()) cfg.idToken = env.idToken;
    if (cfg.apiKey.empty()) {
        LOG_WARN("Upstream API key missing after header merge; using environment configuration");
        return env;
    }
    return cfg;
}

SessionContext::SessionContext(std::string sessionId)
    : id(std::move(sessionId)), clientLogLevel(static_cast<int>(Logger::Level::INFO)) {}

CallerConfig SessionContext::CallerConfiguration(const HeaderMap& headers) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!cachedConfig.has_value()) {
        cachedConfig = headers.empty() ? CallerConfig::FromEnvironment() : CallerConfig::FromHeaders(headers);
        LOG_DEBUG("Resolved caller configuration for session {} (url={}, api_key_set={}, access_token={})",
                  id, cachedConfig->baseUrl, !cachedConfig->apiKey.empty(), !cachedConfig->accessToken.empty());
    }
    return *cachedConfig;
}

void SessionContext::SetLatestHeaders(HeaderMap headers) {
    std::lock_guard<std::mutex> lock(mutex);
    latestHeaders = std::move(headers);
}

HeaderMap SessionContext::LatestHeaders() const {
    std::lock_guard<std::mutex> lock(mutex);
    return latestHeaders;
}

void SessionContext::SetClientLogLevel(Logger::Level level) {
    clientLogLevel.store(static_cast<int>(level));
}

Logger::Level SessionContext::ClientLogLevel() const {
    return static_cast<Logger::Level>(clientLogLevel.load());
}

ToolContext::ToolContext(RequestScope& s, JSONRPCId id)
    : scope(s), requestId(std::move(id)) {}

CallerConfig ToolContext::CallerConfiguration() {
    return scope.session.CallerConfiguration(scope.headers);
}

void ToolContext::SendNotification(const std::string& method, JSONValue params) {
    if (!scope.notify) {
        return;
    }
    JSONRPCNotification note(method, std::move(params));
    scope.notify(note);
}

void ToolContext::Log(Logger::Level level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(scope.session.ClientLogLevel())) {
        return;
    }
    JSONValue::Object params;
    params["level"] = std::make_shared<JSONValue>(clientLevelName(level));
    params["logger"] = std::make_shared<JSONValue>("toolhost");
    params["data"] = std::make_shared<JSONValue>(message);
    SendNotification(Methods::Log, JSONValue(std::move(params)));
}

} // namespace toolhost
