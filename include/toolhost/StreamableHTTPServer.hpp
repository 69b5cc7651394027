//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPServer.hpp
// Purpose: Coroutine-based streamable HTTP (JSON or SSE) tool server using Boost.Beast
//          (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/Dispatcher.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/SessionContext.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/Transport.h"
#include "toolhost/http/ContentNegotiation.h"
#include "toolhost/http/CorrelationChannel.h"

namespace toolhost {

//==========================================================================================================
// ListenerTimeouts
// Fields:
//   keepAlive: Idle time allowed between requests on a persistent connection.
//   notify: Upper bound for writing one response or stream frame.
//   gracefulShutdown: How long Stop() waits for open connections before forcing the loop down.
//   sessionIdle: Sessions with no traffic and no in-flight request for this long are expired (0 disables).
//==========================================================================================================
struct ListenerTimeouts {
    std::chrono::milliseconds keepAlive{65000};
    std::chrono::milliseconds notify{120000};
    std::chrono::milliseconds gracefulShutdown{120000};
    std::chrono::milliseconds sessionIdle{1800000};
};

// Upper bound for any listener timeout; larger values are clamped so deadlines never overflow the clock.
constexpr std::chrono::milliseconds kMaxListenerTimeout{std::chrono::hours(24 * 365)};

// Clamps each timeout into [0, kMaxListenerTimeout].
ListenerTimeouts ClampListenerTimeouts(const ListenerTimeouts& timeouts);

//==========================================================================================================
// StreamableHTTPServer
// Purpose: Multi-session HTTP acceptor. POST delivers one JSON-RPC message; requests are answered with a
//          single JSON body (json response mode) or a chunked text/event-stream carrying every event of
//          the request up to and including its response.
// Sessions:
//   - initialize creates a session (32 hex digits) returned in the mcp-session-id header; each session
//     owns a Dispatcher over the shared registry.
//   - DELETE terminates a session: its correlation channels close and tool calls observe cancellation.
// Notes:
//   - Hooks (SetAcceptNegotiator, AddPostAlias, SetResponseEventInjector, SetTimeouts) must be set
//     before Start().
//   - Tool handlers run on a worker pool; the listener never blocks on a tool.
//==========================================================================================================
class StreamableHTTPServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see BoundPort())
    //   endpointPath: Main endpoint path (default: /mcp)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   jsonResponse: Answer requests with one JSON body instead of an event stream
    //   workerThreads: Size of the tool worker pool
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8000"};
        std::string endpointPath{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        bool jsonResponse{false};
        std::size_t workerThreads{4};
    };

    //==========================================================================================================
    // ResponseEventInjector
    // Purpose: Supplies one extra frame written after a successful initialize response on an event stream.
    //          Called at most once per session; returning std::nullopt injects nothing.
    //==========================================================================================================
    using ResponseEventInjector =
        std::function<std::optional<http::StreamEvent>(const JSONRPCRequest& request, const HeaderMap& headers)>;

    StreamableHTTPServer(const Options& opts,
                         std::shared_ptr<const ToolRegistry> registry,
                         DispatcherOptions dispatcherOptions);
    ~StreamableHTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; it carries the exception when binding fails.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops accepting, cancels every session, waits up to the graceful-shutdown timeout for open
    // connections, then stops the I/O loop and joins the I/O and worker threads.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetErrorHandler(ITransportAcceptor::ErrorHandler handler) override;

    // Replaces the Accept-header rule (default: NegotiateAcceptStrict).
    void SetAcceptNegotiator(http::AcceptNegotiator negotiator);

    //==========================================================================================================
    // AddPostAlias
    // Purpose: Serves the same protocol on an additional path. On alias paths the session id may also be
    //          given as a "session_id" query parameter (32 hex digits, dashes allowed).
    //==========================================================================================================
    void AddPostAlias(const std::string& path);

    void SetResponseEventInjector(ResponseEventInjector injector);

    // Values outside [0, kMaxListenerTimeout] are clamped.
    void SetTimeouts(const ListenerTimeouts& timeouts);
    ListenerTimeouts GetTimeouts() const;

    const Options& GetOptions() const;

    // Port the listener is bound to (0 before Start()).
    unsigned short BoundPort() const;

    std::size_t SessionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamableHTTPServerFactory
// Purpose: Creates servers from a configuration string:
//            - "http://<address>:<port>[/<path>]"
//            - "https://<address>:<port>[/<path>]?cert=<pem>&key=<pem>"
//            - "...?json=1" enables json response mode
//          If the scheme is omitted, defaults to http. Unknown parameters are ignored.
//==========================================================================================================
class StreamableHTTPServerFactory : public ITransportAcceptorFactory {
public:
    StreamableHTTPServerFactory(std::shared_ptr<const ToolRegistry> registry, DispatcherOptions dispatcherOptions);

    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;

    // Parses a configuration string into server options (exposed for tests).
    static StreamableHTTPServer::Options ParseOptions(const std::string& config);

private:
    std::shared_ptr<const ToolRegistry> registry;
    DispatcherOptions dispatcherOptions;
};

} // namespace toolhost
