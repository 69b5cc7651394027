//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPServer.cpp
// Purpose: Streamable HTTP tool server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/StreamableHTTPServer.hpp"

#include <openssl/ssl.h>

namespace toolhost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
using StringRequest = bhttp::request<bhttp::string_body>;
using StringResponse = bhttp::response<bhttp::string_body>;

constexpr const char* kSessionHeader = "mcp-session-id";
constexpr const char* kProtocolHeader = "mcp-protocol-version";

std::string toStd(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

std::string trimCopy(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

HeaderMap collectHeaders(const StringRequest& req) {
    HeaderMap headers;
    for (const auto& field : req) {
        headers[ToLowerAscii(toStd(field.name_string()))] = toStd(field.value());
    }
    return headers;
}

void splitTarget(const std::string& target, std::string& path, std::string& query) {
    const auto q = target.find('?');
    path = target.substr(0, q);
    query = (q == std::string::npos) ? std::string() : target.substr(q + 1);
}

std::optional<std::string> queryParam(const std::string& query, const std::string& key) {
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        const auto eq = kv.find('=');
        const std::string k = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        if (k == key) {
            return (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
        }
    }
    return std::nullopt;
}

// Accepts 32 hex digits with optional dashes; returns the lower-case compact form.
std::optional<std::string> normalizeSessionId(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (out.size() != 32) return std::nullopt;
    return out;
}

std::string mediaType(const std::string& contentType) {
    std::string m = contentType.substr(0, contentType.find(';'));
    return ToLowerAscii(trimCopy(m));
}

bool isSupportedProtocolVersion(const std::string& version) {
    const auto& versions = SupportedProtocolVersions();
    return std::find(versions.begin(), versions.end(), version) != versions.end();
}

StringResponse errorResponse(const StringRequest& req, bhttp::status status, int code,
                             const std::string& message, const std::string& sessionId = std::string()) {
    StringResponse res{status, req.version()};
    res.set(bhttp::field::content_type, "application/json");
    if (!sessionId.empty()) {
        res.set(kSessionHeader, sessionId);
    }
    res.keep_alive(req.keep_alive());
    res.body() = CreateErrorResponse(nullptr, code, message)->Serialize();
    return res;
}

// True when a serialized terminal frame carries a result (not an error).
bool isSuccessPayload(const std::string& data) {
    try {
        return FindMember(ParseJSON(data), "result") != nullptr;
    } catch (const std::exception& e) {
        LOG_WARN("StreamableHTTPServer: unreadable terminal frame: {}", e.what());
        return false;
    }
}

struct ConnectionCounter {
    std::atomic<int>& count;
    explicit ConnectionCounter(std::atomic<int>& c) : count(c) { ++count; }
    ~ConnectionCounter() { --count; }
};
} // namespace

//==========================================================================================================
// ServerSession
// Purpose: One HTTP session: its context, its dispatcher and the correlation channels of its in-flight
//          requests keyed by request id.
//==========================================================================================================
struct ServerSession {
    SessionContext context;
    Dispatcher dispatcher;
    std::atomic<bool> instructionsDelivered{false};
    std::mutex channelsMutex;
    std::unordered_map<std::string, std::shared_ptr<http::CorrelationChannel>> channels;

    std::atomic<std::chrono::steady_clock::rep> lastActivity{std::chrono::steady_clock::now().time_since_epoch().count()};

    ServerSession(std::string id, std::shared_ptr<const ToolRegistry> registry, DispatcherOptions options)
        : context(std::move(id)), dispatcher(std::move(registry), std::move(options)) {}

    void touch() {
        lastActivity.store(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    // True when nothing is in flight and the last activity is older than limit.
    bool idleLongerThan(std::chrono::milliseconds limit) {
        std::lock_guard<std::mutex> lock(channelsMutex);
        if (!channels.empty()) {
            return false;
        }
        const std::chrono::steady_clock::time_point last{std::chrono::steady_clock::duration(lastActivity.load())};
        return std::chrono::steady_clock::now() - last >= limit;
    }

    void registerChannel(const std::string& key, const std::shared_ptr<http::CorrelationChannel>& channel) {
        std::lock_guard<std::mutex> lock(channelsMutex);
        auto it = channels.find(key);
        if (it != channels.end() && it->second != channel) {
            LOG_WARN("Session {}: request id {} is already in flight; replacing its channel", context.Id(), key);
            it->second->Close();
        }
        channels[key] = channel;
    }

    void releaseChannel(const std::string& key, const std::shared_ptr<http::CorrelationChannel>& channel) {
        touch();
        std::lock_guard<std::mutex> lock(channelsMutex);
        auto it = channels.find(key);
        if (it != channels.end() && it->second == channel) {
            channels.erase(it);
        }
        channel->Close();
    }

    void terminate() {
        context.RequestStop();
        std::lock_guard<std::mutex> lock(channelsMutex);
        for (auto& [key, channel] : channels) {
            channel->Close();
        }
        channels.clear();
    }
};

class StreamableHTTPServer::Impl {
public:
    StreamableHTTPServer::Options opts;
    std::shared_ptr<const ToolRegistry> registry;
    DispatcherOptions dispatcherOptions;
    std::atomic<bool> running{false};

    ListenerTimeouts timeouts;
    http::AcceptNegotiator negotiator{http::NegotiateAcceptStrict};
    std::vector<std::string> aliasPaths;
    ResponseEventInjector injector;
    ITransportAcceptor::ErrorHandler errorHandler;

    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::atomic<int> openConnections{0};
    std::atomic<unsigned short> boundPort{0};
    std::unordered_map<beast::tcp_stream*, bool> liveStreams; // stream -> idle; I/O thread only
    boost::uuids::random_generator uuidGen;                   // I/O thread only

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    mutable std::mutex sessionsMutex;
    std::unordered_map<std::string, std::shared_ptr<ServerSession>> sessions;
    std::unique_ptr<net::thread_pool> workers;
    std::thread ioThread;

    Impl(const StreamableHTTPServer::Options& o, std::shared_ptr<const ToolRegistry> reg, DispatcherOptions dopts)
        : opts(o), registry(std::move(reg)), dispatcherOptions(std::move(dopts)) {
        if (!registry) {
            throw std::invalid_argument("StreamableHTTPServer requires a tool registry");
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("StreamableHTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        running.store(false);
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        if (workers) {
            workers->join();
        }
        std::lock_guard<std::mutex> lock(sessionsMutex);
        sessions.clear();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    // Shutdown-related failures are expected and only traced in debug builds.
    void reportConnectionError(const char* what, const std::string& detail) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("StreamableHTTPServer {} suppressed during shutdown: {}", what, detail);
#endif
            return;
        }
        setError(std::string("StreamableHTTPServer ") + what + " error: " + detail);
    }

    bool isEndpoint(const std::string& path, bool& alias) const {
        alias = false;
        if (path == opts.endpointPath) return true;
        if (std::find(aliasPaths.begin(), aliasPaths.end(), path) != aliasPaths.end()) {
            alias = true;
            return true;
        }
        return false;
    }

    ///////////////////////////////////////// Sessions ///////////////////////////////////////////
    std::shared_ptr<ServerSession> createSession() {
        std::string id = boost::uuids::to_string(uuidGen());
        id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
        auto session = std::make_shared<ServerSession>(id, registry, dispatcherOptions);
        std::lock_guard<std::mutex> lock(sessionsMutex);
        sessions[id] = session;
        LOG_INFO("StreamableHTTPServer: created session {}", id);
        return session;
    }

    std::shared_ptr<ServerSession> findSession(const std::string& id) const {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return nullptr;
        }
        it->second->touch();
        return it->second;
    }

    std::shared_ptr<ServerSession> removeSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) return nullptr;
        auto session = it->second;
        sessions.erase(it);
        return session;
    }

    void expireIdleSessions() {
        std::vector<std::shared_ptr<ServerSession>> expired;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            for (auto it = sessions.begin(); it != sessions.end();) {
                if (it->second->idleLongerThan(timeouts.sessionIdle)) {
                    expired.push_back(it->second);
                    it = sessions.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& session : expired) {
            LOG_INFO("StreamableHTTPServer: session {} expired after {} ms idle", session->context.Id(),
                     timeouts.sessionIdle.count());
            session->terminate();
        }
    }

    // Periodic sweep on the I/O thread; runs until the server stops.
    net::awaitable<void> idleSessionLoop() {
        net::steady_timer timer(ioc);
        const auto interval = std::clamp(timeouts.sessionIdle / 2, std::chrono::milliseconds(10),
                                         std::chrono::milliseconds(30000));
        while (running.load()) {
            timer.expires_after(interval);
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || !running.load()) {
                break;
            }
            expireIdleSessions();
        }
        co_return;
    }

    void terminateAllSessions() {
        std::unordered_map<std::string, std::shared_ptr<ServerSession>> all;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            all.swap(sessions);
        }
        for (auto& [id, session] : all) {
            session->terminate();
        }
        if (!all.empty()) {
            LOG_INFO("StreamableHTTPServer: terminated {} session(s)", all.size());
        }
    }

    //==========================================================================================================
    // Resolves the session id of a request: the mcp-session-id header, or on alias paths the session_id
    // query parameter. Returns false (with an error response) for a malformed query value.
    //==========================================================================================================
    bool requestedSessionId(const StringRequest& req, const HeaderMap& headers, const std::string& query,
                            bool alias, std::string& id, StringResponse& error) const {
        id = HeaderValue(headers, kSessionHeader);
        if (!id.empty() || !alias) {
            return true;
        }
        auto raw = queryParam(query, "session_id");
        if (!raw.has_value()) {
            return true;
        }
        auto normalized = normalizeSessionId(*raw);
        if (!normalized.has_value()) {
            error = errorResponse(req, bhttp::status::bad_request, JSONRPCErrorCodes::InvalidRequest, "Invalid session ID");
            return false;
        }
        id = *normalized;
        return true;
    }

    ///////////////////////////////////////// Dispatch ///////////////////////////////////////////
    void dispatchRequest(const std::shared_ptr<ServerSession>& session, JSONRPCRequest request, HeaderMap headers,
                         const std::shared_ptr<http::CorrelationChannel>& channel) {
        net::post(*workers, [session, request = std::move(request), headers = std::move(headers), channel]() {
            std::unique_ptr<JSONRPCResponse> response;
            try {
                RequestScope scope{session->context, headers,
                                   [channel](const JSONRPCNotification& note) {
                                       channel->Push(http::StreamEvent{"message", note.Serialize(), false});
                                   },
                                   session->context.StopToken()};
                response = session->dispatcher.HandleRequest(request, scope);
            } catch (const std::exception& e) {
                LOG_ERROR("StreamableHTTPServer: request {} failed: {}", IdToString(request.id), e.what());
                response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
            }
            if (!response) {
                response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No response from handler");
            }
            channel->Push(http::StreamEvent{"message", response->Serialize(), true});
        });
    }

    void dispatchNotification(const std::shared_ptr<ServerSession>& session, JSONRPCNotification note, HeaderMap headers) {
        net::post(*workers, [session, note = std::move(note), headers = std::move(headers)]() {
            RequestScope scope{session->context, headers, NotificationSink{}, session->context.StopToken()};
            session->dispatcher.HandleNotification(note, scope);
        });
    }

    ///////////////////////////////////////// HTTP ///////////////////////////////////////////
    template <class Stream>
    net::awaitable<bool> writeResponse(Stream& stream, StringResponse res) {
        res.prepare_payload();
        beast::get_lowest_layer(stream).expires_after(timeouts.notify);
        co_await bhttp::async_write(stream, res, net::use_awaitable);
        co_return res.keep_alive();
    }

    template <class Stream>
    net::awaitable<void> writeChunk(Stream& stream, const std::string& frame) {
        beast::get_lowest_layer(stream).expires_after(timeouts.notify);
        co_await net::async_write(stream, bhttp::make_chunk(net::buffer(frame)), net::use_awaitable);
    }

    template <class Stream>
    net::awaitable<bool> respondBuffered(Stream& stream, const StringRequest& req,
                                         std::shared_ptr<ServerSession> session, std::string key,
                                         std::shared_ptr<http::CorrelationChannel> channel) {
        std::optional<http::StreamEvent> terminal;
        for (;;) {
            auto ev = co_await channel->Receive();
            if (!ev.has_value()) break;
            if (ev->terminal) {
                terminal = std::move(ev);
                break;
            }
            LOG_DEBUG("StreamableHTTPServer: json response mode drops intermediate event for {}", key);
        }
        session->releaseChannel(key, channel);

        const std::string& sid = session->context.Id();
        if (!terminal.has_value()) {
            LOG_ERROR("StreamableHTTPServer: no response message received before stream closed ({})", key);
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::internal_server_error,
                JSONRPCErrorCodes::InternalError, "Error processing request: No response received", sid));
        }
        StringResponse res{bhttp::status::ok, req.version()};
        res.set(bhttp::field::content_type, "application/json");
        res.set(kSessionHeader, sid);
        res.keep_alive(req.keep_alive());
        res.body() = terminal->data;
        co_return co_await writeResponse(stream, std::move(res));
    }

    template <class Stream>
    net::awaitable<bool> respondStream(Stream& stream, const StringRequest& req, const JSONRPCRequest& request,
                                       const HeaderMap& headers, std::shared_ptr<ServerSession> session,
                                       std::string key, std::shared_ptr<http::CorrelationChannel> channel,
                                       bool isInitialize) {
        bhttp::response<bhttp::empty_body> res{bhttp::status::ok, req.version()};
        res.set(bhttp::field::content_type, "text/event-stream");
        res.set(bhttp::field::cache_control, "no-cache, no-transform");
        res.set(bhttp::field::connection, "keep-alive");
        res.set(kSessionHeader, session->context.Id());
        res.chunked(true);
        bhttp::response_serializer<bhttp::empty_body> sr{res};

        try {
            beast::get_lowest_layer(stream).expires_after(timeouts.notify);
            co_await bhttp::async_write_header(stream, sr, net::use_awaitable);
            for (;;) {
                auto ev = co_await channel->Receive();
                if (!ev.has_value()) break;
                const std::string frame = http::FormatSseFrame(*ev);
                co_await writeChunk(stream, frame);
                if (!ev->terminal) {
                    continue;
                }
                if (isInitialize && injector && !session->instructionsDelivered.load() && isSuccessPayload(ev->data)) {
                    auto extra = injector(request, headers);
                    if (extra.has_value() && !session->instructionsDelivered.exchange(true)) {
                        const std::string extraFrame = http::FormatSseFrame(*extra);
                        co_await writeChunk(stream, extraFrame);
                    }
                }
                break;
            }
            beast::get_lowest_layer(stream).expires_after(timeouts.notify);
            co_await net::async_write(stream, bhttp::make_chunk_last(), net::use_awaitable);
        } catch (const std::exception&) {
            session->releaseChannel(key, channel);
            throw;
        }
        session->releaseChannel(key, channel);
        co_return false; // close after the terminal frame
    }

    template <class Stream>
    net::awaitable<bool> handlePost(Stream& stream, const StringRequest& req, const std::string& query, bool alias) {
        HeaderMap headers = collectHeaders(req);

        if (!negotiator(HeaderValue(headers, "accept")).AcceptsBoth()) {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::not_acceptable,
                JSONRPCErrorCodes::InvalidRequest,
                "Not Acceptable: Client must accept both application/json and text/event-stream"));
        }
        if (mediaType(HeaderValue(headers, "content-type")) != "application/json") {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::unsupported_media_type,
                JSONRPCErrorCodes::InvalidRequest, "Unsupported Media Type: Content-Type must be application/json"));
        }

        JSONValue body;
        std::string parseError;
        try {
            body = ParseJSON(req.body());
        } catch (const std::exception& e) {
            parseError = e.what();
        }
        if (!parseError.empty()) {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::bad_request,
                JSONRPCErrorCodes::ParseError, "Parse error: " + parseError));
        }
        const MessageKind kind = ClassifyMessage(body);
        if (kind == MessageKind::Invalid) {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::bad_request,
                JSONRPCErrorCodes::InvalidParams, "Validation error: not a valid JSON-RPC 2.0 message"));
        }

        std::string requestedId;
        StringResponse idError;
        if (!requestedSessionId(req, headers, query, alias, requestedId, idError)) {
            co_return co_await writeResponse(stream, std::move(idError));
        }

        bool isInitialize = false;
        if (kind == MessageKind::Request) {
            const JSONValue* method = FindMember(body, "method");
            isInitialize = method != nullptr && std::get<std::string>(method->value) == Methods::Initialize;
        }

        std::shared_ptr<ServerSession> session;
        if (isInitialize) {
            if (!requestedId.empty()) {
                session = findSession(requestedId);
                if (!session) {
                    co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::not_found,
                        JSONRPCErrorCodes::InvalidRequest, "Not Found: Invalid or expired session ID"));
                }
            } else {
                session = createSession();
            }
        } else {
            if (requestedId.empty()) {
                co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::bad_request,
                    JSONRPCErrorCodes::InvalidRequest, "Bad Request: Missing session ID"));
            }
            session = findSession(requestedId);
            if (!session) {
                co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::not_found,
                    JSONRPCErrorCodes::InvalidRequest, "Not Found: Invalid or expired session ID"));
            }
            const std::string version = HeaderValue(headers, kProtocolHeader);
            if (!version.empty() && !isSupportedProtocolVersion(version)) {
                co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::bad_request,
                    JSONRPCErrorCodes::InvalidRequest, "Bad Request: Unsupported protocol version: " + version,
                    session->context.Id()));
            }
        }
        session->context.SetLatestHeaders(headers);

        if (kind != MessageKind::Request) {
            if (kind == MessageKind::Notification) {
                JSONRPCNotification note;
                if (note.FromJSON(body)) {
                    dispatchNotification(session, std::move(note), std::move(headers));
                }
            } else {
                LOG_DEBUG("StreamableHTTPServer: ignoring client response on session {}", session->context.Id());
            }
            StringResponse res{bhttp::status::accepted, req.version()};
            res.set(kSessionHeader, session->context.Id());
            res.keep_alive(req.keep_alive());
            co_return co_await writeResponse(stream, std::move(res));
        }

        JSONRPCRequest request;
        if (!request.FromJSON(body)) {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::bad_request,
                JSONRPCErrorCodes::InvalidParams, "Validation error: not a valid JSON-RPC 2.0 request"));
        }
        const std::string key = IdToString(request.id);
        LOG_DEBUG("StreamableHTTPServer: session {} request {} ({})", session->context.Id(), key, request.method);

        auto channel = std::make_shared<http::CorrelationChannel>(ioc.get_executor());
        session->registerChannel(key, channel);
        dispatchRequest(session, request, headers, channel);

        if (opts.jsonResponse) {
            co_return co_await respondBuffered(stream, req, session, key, channel);
        }
        co_return co_await respondStream(stream, req, request, headers, session, key, channel, isInitialize);
    }

    StringResponse handleDelete(const StringRequest& req, const std::string& query, bool alias) {
        const HeaderMap headers = collectHeaders(req);
        std::string id;
        StringResponse idError;
        if (!requestedSessionId(req, headers, query, alias, id, idError)) {
            return idError;
        }
        if (id.empty()) {
            return errorResponse(req, bhttp::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                 "Bad Request: Missing session ID");
        }
        auto session = removeSession(id);
        if (!session) {
            return errorResponse(req, bhttp::status::not_found, JSONRPCErrorCodes::InvalidRequest,
                                 "Not Found: Invalid or expired session ID");
        }
        session->terminate();
        LOG_INFO("StreamableHTTPServer: session {} terminated by client", id);
        StringResponse res{bhttp::status::ok, req.version()};
        res.keep_alive(req.keep_alive());
        return res;
    }

    template <class Stream>
    net::awaitable<bool> handleRequest(Stream& stream, const StringRequest& req) {
        std::string path, query;
        splitTarget(toStd(req.target()), path, query);
        bool alias = false;
        if (!isEndpoint(path, alias)) {
            co_return co_await writeResponse(stream, errorResponse(req, bhttp::status::not_found,
                JSONRPCErrorCodes::InvalidRequest, "Not Found"));
        }
        if (req.method() == bhttp::verb::post) {
            co_return co_await handlePost(stream, req, query, alias);
        }
        if (req.method() == bhttp::verb::delete_) {
            co_return co_await writeResponse(stream, handleDelete(req, query, alias));
        }
        StringResponse res = errorResponse(req, bhttp::status::method_not_allowed,
                                           JSONRPCErrorCodes::InvalidRequest, "Method Not Allowed");
        res.set(bhttp::field::allow, "POST, DELETE");
        co_return co_await writeResponse(stream, std::move(res));
    }

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        beast::tcp_stream* lowest = &beast::get_lowest_layer(stream);
        liveStreams[lowest] = true;
        try {
            beast::flat_buffer buffer;
            while (running.load()) {
                StringRequest req;
                liveStreams[lowest] = true;
                lowest->expires_after(timeouts.keepAlive);
                boost::system::error_code ec;
                co_await bhttp::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
                liveStreams[lowest] = false;
                if (ec == bhttp::error::end_of_stream || ec == beast::error::timeout ||
                    ec == net::error::operation_aborted || ec == net::error::eof ||
                    ec == ssl::error::stream_truncated) {
                    break;
                }
                if (ec) {
                    throw boost::system::system_error(ec);
                }
                if (!co_await handleRequest(stream, req)) {
                    break;
                }
            }
        } catch (const std::exception&) {
            liveStreams.erase(lowest);
            throw;
        }
        liveStreams.erase(lowest);
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        ConnectionCounter counter(openConnections);
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            reportConnectionError("plain connection", e.what());
        } catch (const std::exception& e) {
            reportConnectionError("plain connection", e.what());
        }
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        ConnectionCounter counter(openConnections);
        try {
            beast::ssl_stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(timeouts.keepAlive);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            beast::get_lowest_layer(tls).expires_after(timeouts.notify);
            boost::system::error_code ec;
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const boost::system::system_error& e) {
            reportConnectionError("TLS connection", e.what());
        } catch (const std::exception& e) {
            reportConnectionError("TLS connection", e.what());
        }
        co_return;
    }

    void bindAcceptor() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("StreamableHTTPServer invalid port: empty");
        }
        const bool allDigits = std::all_of(opts.port.begin(), opts.port.end(),
                                           [](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5) {
            throw std::invalid_argument("StreamableHTTPServer invalid port (non-numeric): " + opts.port);
        }
        if (std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("StreamableHTTPServer invalid port (out of range): " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, sessionTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, sessionPlain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            reportConnectionError("accept", e.what());
        } catch (const std::exception& e) {
            reportConnectionError("accept", e.what());
        }
        co_return;
    }

    // Runs on the I/O thread: stop accepting and wake idle keep-alive readers.
    void closeListenerAndIdleConnections() {
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        for (auto& [stream, idle] : liveStreams) {
            if (idle) {
                stream->cancel();
            }
        }
    }
};

StreamableHTTPServer::StreamableHTTPServer(const Options& opts,
                                           std::shared_ptr<const ToolRegistry> registry,
                                           DispatcherOptions dispatcherOptions)
    : pImpl(std::make_unique<Impl>(opts, std::move(registry), std::move(dispatcherOptions))) {}

StreamableHTTPServer::~StreamableHTTPServer() = default;

std::future<void> StreamableHTTPServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->bindAcceptor();
    } catch (const std::exception& e) {
        LOG_ERROR("StreamableHTTPServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->setError(std::string("StreamableHTTPServer listen error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->workers = std::make_unique<net::thread_pool>(std::max<std::size_t>(1, pImpl->opts.workerThreads));
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    if (pImpl->timeouts.sessionIdle.count() > 0) {
        net::co_spawn(pImpl->ioc, pImpl->idleSessionLoop(), net::detached);
    }
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("StreamableHTTPServer: I/O loop failed: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    LOG_INFO("StreamableHTTPServer listening on {}://{}:{}{} ({} responses)", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.endpointPath, pImpl->opts.jsonResponse ? "json" : "event-stream");
    ready.set_value();
    return fut;
}

std::future<void> StreamableHTTPServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->running.exchange(false)) {
        done.set_value();
        return fut;
    }
    LOG_INFO("StreamableHTTPServer: shutting down");
    net::post(pImpl->ioc, [impl = pImpl.get()]() { impl->closeListenerAndIdleConnections(); });
    pImpl->terminateAllSessions();

    const auto deadline = std::chrono::steady_clock::now() + pImpl->timeouts.gracefulShutdown;
    while (pImpl->openConnections.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (pImpl->openConnections.load() > 0) {
        LOG_WARN("StreamableHTTPServer: {} connection(s) still open after graceful shutdown timeout",
                 pImpl->openConnections.load());
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    if (pImpl->workers) {
        pImpl->workers->join();
    }
    LOG_INFO("StreamableHTTPServer: stopped");
    done.set_value();
    return fut;
}

void StreamableHTTPServer::SetErrorHandler(ITransportAcceptor::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void StreamableHTTPServer::SetAcceptNegotiator(http::AcceptNegotiator negotiator) {
    pImpl->negotiator = negotiator ? std::move(negotiator) : http::AcceptNegotiator(http::NegotiateAcceptStrict);
}

void StreamableHTTPServer::AddPostAlias(const std::string& path) {
    if (path.empty() || path == pImpl->opts.endpointPath) {
        return;
    }
    if (std::find(pImpl->aliasPaths.begin(), pImpl->aliasPaths.end(), path) == pImpl->aliasPaths.end()) {
        pImpl->aliasPaths.push_back(path);
        LOG_DEBUG("StreamableHTTPServer: POST alias {}", path);
    }
}

void StreamableHTTPServer::SetResponseEventInjector(ResponseEventInjector injector) {
    pImpl->injector = std::move(injector);
}

ListenerTimeouts ClampListenerTimeouts(const ListenerTimeouts& timeouts) {
    auto clamp = [](std::chrono::milliseconds v) {
        return std::clamp(v, std::chrono::milliseconds::zero(), kMaxListenerTimeout);
    };
    ListenerTimeouts out;
    out.keepAlive = clamp(timeouts.keepAlive);
    out.notify = clamp(timeouts.notify);
    out.gracefulShutdown = clamp(timeouts.gracefulShutdown);
    out.sessionIdle = clamp(timeouts.sessionIdle);
    return out;
}

void StreamableHTTPServer::SetTimeouts(const ListenerTimeouts& timeouts) {
    pImpl->timeouts = ClampListenerTimeouts(timeouts);
}

ListenerTimeouts StreamableHTTPServer::GetTimeouts() const {
    return pImpl->timeouts;
}

const StreamableHTTPServer::Options& StreamableHTTPServer::GetOptions() const {
    return pImpl->opts;
}

unsigned short StreamableHTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

std::size_t StreamableHTTPServer::SessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

StreamableHTTPServerFactory::StreamableHTTPServerFactory(std::shared_ptr<const ToolRegistry> reg,
                                                         DispatcherOptions dopts)
    : registry(std::move(reg)), dispatcherOptions(std::move(dopts)) {}

StreamableHTTPServer::Options StreamableHTTPServerFactory::ParseOptions(const std::string& config) {
    StreamableHTTPServer::Options opts;
    std::string cfg = trimCopy(config);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Path component selects the endpoint
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        while (path.size() > 1 && path.back() == '/') path.pop_back();
        if (path != "/") opts.endpointPath = path;
    }
    hostPort = trimCopy(hostPort);

    // Parse host[:port] including IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        opts.address = trimCopy(opts.address);
        opts.port = trimCopy(opts.port);
        if (opts.port.empty()) opts.port = "8000";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
            else if (key == "json") opts.jsonResponse = (val == "1" || val == "true");
        }
    }
    return opts;
}

std::unique_ptr<ITransportAcceptor> StreamableHTTPServerFactory::CreateTransportAcceptor(const std::string& config) {
    return std::make_unique<StreamableHTTPServer>(ParseOptions(config), registry, dispatcherOptions);
}

} // namespace toolhost
