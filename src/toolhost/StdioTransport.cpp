//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <string>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

class StdioTransport::Impl {
public:
    std::istream& in;
    std::ostream& out;
    SessionContext session{"stdio"};
    Dispatcher dispatcher;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    std::mutex writeMutex;
    bool outputBroken{false};

    Impl(std::shared_ptr<const ToolRegistry> registry, DispatcherOptions options, std::istream& i, std::ostream& o)
        : in(i), out(o), dispatcher(std::move(registry), std::move(options)) {}

    bool writeLine(const std::string& line) {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (outputBroken) {
            return false;
        }
        out << line << '\n';
        out.flush();
        if (!out) {
            outputBroken = true;
            LOG_ERROR("StdioTransport: output stream failed; stopping");
            return false;
        }
        return true;
    }

    bool writeError(const JSONRPCId& id, int code, const std::string& message) {
        auto err = CreateErrorResponse(id, code, message);
        return writeLine(err->Serialize());
    }

    bool handleRequest(const JSONValue& message) {
        JSONRPCRequest request;
        if (!request.FromJSON(message)) {
            return writeError(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
        }
        RequestScope scope{session, HeaderMap{}, [this](const JSONRPCNotification& note) {
            (void)writeLine(note.Serialize());
        }, session.StopToken()};

        std::unique_ptr<JSONRPCResponse> response;
        try {
            response = dispatcher.HandleRequest(request, scope);
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: request {} failed: {}", IdToString(request.id), e.what());
            response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (!response) {
            response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No response from handler");
        }
        return writeLine(response->Serialize());
    }

    void handleNotification(const JSONValue& message) {
        JSONRPCNotification notification;
        if (!notification.FromJSON(message)) {
            LOG_WARN("StdioTransport: dropping malformed notification");
            return;
        }
        RequestScope scope{session, HeaderMap{}, NotificationSink{}, session.StopToken()};
        dispatcher.HandleNotification(notification, scope);
    }

    // Best-effort reply for messages that name a method but fail the shape check.
    bool handleInvalid(const JSONValue& message) {
        const JSONValue* method = FindMember(message, "method");
        const JSONValue* id = FindMember(message, "id");
        if (method == nullptr || id == nullptr) {
            LOG_DEBUG("StdioTransport: ignoring line without method/id");
            return true;
        }
        JSONRPCId replyId = nullptr;
        if (id->IsString()) {
            replyId = std::get<std::string>(id->value);
        } else if (std::holds_alternative<int64_t>(id->value)) {
            replyId = std::get<int64_t>(id->value);
        }
        return writeError(replyId, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }

    bool handleLine(const std::string& raw) {
        const auto b = raw.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) {
            return true;
        }
        const auto e = raw.find_last_not_of(" \t\r\n");
        const std::string line = raw.substr(b, e - b + 1);

        JSONValue message;
        try {
            message = ParseJSON(line);
        } catch (const std::exception& ex) {
            LOG_WARN("StdioTransport: parse error: {}", ex.what());
            return writeError(nullptr, JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + ex.what());
        }

        try {
            switch (ClassifyMessage(message, false)) {
                case MessageKind::Request:
                    return handleRequest(message);
                case MessageKind::Notification:
                    handleNotification(message);
                    return true;
                case MessageKind::Response:
                case MessageKind::Error:
                    LOG_DEBUG("StdioTransport: ignoring client response");
                    return true;
                case MessageKind::Invalid:
                    break;
            }
            if (!message.IsObject()) {
                return writeError(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
            }
            return handleInvalid(message);
        } catch (const std::exception& ex) {
            LOG_ERROR("StdioTransport: unexpected failure: {}", ex.what());
            return writeError(nullptr, JSONRPCErrorCodes::InternalError, ex.what());
        }
    }
};

StdioTransport::StdioTransport(std::shared_ptr<const ToolRegistry> registry,
                               DispatcherOptions options,
                               std::istream& in,
                               std::ostream& out) {
    Logger::setStdioMode(true);
    pImpl = std::make_unique<Impl>(std::move(registry), std::move(options), in, out);
}

StdioTransport::~StdioTransport() = default;

void StdioTransport::Run() {
    FUNC_SCOPE();
    pImpl->running.store(true);
    LOG_INFO("StdioTransport: serving on stdin/stdout");
    std::string line;
    while (!pImpl->stopRequested.load() && std::getline(pImpl->in, line)) {
        if (!pImpl->handleLine(line)) {
            break;
        }
    }
    pImpl->session.RequestStop();
    pImpl->running.store(false);
    LOG_INFO("StdioTransport: input closed; exiting loop");
}

void StdioTransport::Stop() {
    pImpl->stopRequested.store(true);
    pImpl->session.RequestStop();
}

bool StdioTransport::IsRunning() const {
    return pImpl->running.load();
}

bool StdioTransport::HandleLine(const std::string& line) {
    return pImpl->handleLine(line);
}

SessionContext& StdioTransport::Session() {
    return pImpl->session;
}

} // namespace toolhost
