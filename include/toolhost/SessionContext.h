//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionContext.h
// Purpose: Per-session state owned by a transport, per-request scope, and the context handed to tools
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

// Request headers with lower-cased names.
using HeaderMap = std::map<std::string, std::string>;

// Lower-cases ASCII letters.
std::string ToLowerAscii(std::string s);

// Returns the header value (name matched case-insensitively) or an empty string.
std::string HeaderValue(const HeaderMap& headers, const std::string& name);

//==========================================================================================================
// CallerConfig
// Purpose: Upstream credentials and base URL a tool should use on behalf of the current caller.
// Notes:
//   - FromHeaders() reads x-upstream-url, x-upstream-api-key, x-upstream-access-token (or an
//     Authorization: Bearer token) and x-upstream-id-token, falling back to FromEnvironment() per field.
//   - When no API key survives the merge, the environment configuration is used as a whole.
//==========================================================================================================
struct CallerConfig {
    std::string baseUrl;
    std::string apiKey;
    std::string accessToken;
    std::string idToken;

    static CallerConfig FromEnvironment();
    static CallerConfig FromHeaders(const HeaderMap& headers);
};

//==========================================================================================================
// SessionContext
// Purpose: Explicit per-session state passed by reference to the dispatcher and to tools.
// Fields:
//   id: Session identifier ("stdio" for the stdio transport, a 32-hex-digit id over HTTP).
//   latest headers: headers of the most recent message the transport accepted for this session.
//   caller configuration cache: resolved once per session.
//   client log level: minimum level of notifications/message sent to this client.
//   stop source: requested when the session is torn down; tools observe it through ToolContext.
// Thread-safety: all members may be used concurrently from worker threads.
//==========================================================================================================
class SessionContext {
public:
    explicit SessionContext(std::string sessionId);

    const std::string& Id() const { return id; }

    //==========================================================================================================
    // CallerConfiguration
    // Purpose: Returns the cached configuration, building it from the given request headers on first use.
    //==========================================================================================================
    CallerConfig CallerConfiguration(const HeaderMap& headers);

    void SetLatestHeaders(HeaderMap headers);
    HeaderMap LatestHeaders() const;

    void SetClientLogLevel(Logger::Level level);
    Logger::Level ClientLogLevel() const;

    std::stop_token StopToken() const { return stopSource.get_token(); }
    void RequestStop() { stopSource.request_stop(); }
    bool StopRequested() const { return stopSource.stop_requested(); }

private:
    std::string id;
    mutable std::mutex mutex;
    std::optional<CallerConfig> cachedConfig;
    HeaderMap latestHeaders;
    std::atomic<int> clientLogLevel;
    std::stop_source stopSource;
};

// Receives notifications related to the request being served (delivered before its response).
using NotificationSink = std::function<void(const JSONRPCNotification&)>;

//==========================================================================================================
// RequestScope
// Purpose: What a transport knows about one inbound message: its session, the request headers,
//          where related notifications go, and the cancellation token for the request.
//==========================================================================================================
struct RequestScope {
    SessionContext& session;
    HeaderMap headers;
    NotificationSink notify;
    std::stop_token stop;
};

//==========================================================================================================
// ToolContext
// Purpose: Engine-injected context for tools that declare a Context parameter.
//==========================================================================================================
class ToolContext {
public:
    ToolContext(RequestScope& scope, JSONRPCId requestId);

    SessionContext& Session() { return scope.session; }
    const JSONRPCId& RequestId() const { return requestId; }
    const HeaderMap& RequestHeaders() const { return scope.headers; }
    std::stop_token StopToken() const { return scope.stop; }
    bool IsCancelled() const { return scope.stop.stop_requested() || scope.session.StopRequested(); }

    // Caller configuration for this session (cached after first use).
    CallerConfig CallerConfiguration();

    //==========================================================================================================
    // SendNotification
    // Purpose: Emits a notification on the stream of the current request. Dropped silently when the
    //          transport has no sink for it.
    //==========================================================================================================
    void SendNotification(const std::string& method, JSONValue params);

    //==========================================================================================================
    // Log
    // Purpose: Sends notifications/message {level, logger, data} when level >= the session's client level.
    //==========================================================================================================
    void Log(Logger::Level level, const std::string& message);

private:
    RequestScope& scope;
    JSONRPCId requestId;
};

} // namespace toolhost
