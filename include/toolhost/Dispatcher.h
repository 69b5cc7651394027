//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Transport-independent routing of tool protocol requests and notifications
//==========================================================================================================

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/SessionContext.h"
#include "toolhost/ToolRegistry.h"

namespace toolhost {

//==========================================================================================================
// DispatcherOptions
// Purpose: Static server facts reported during initialize.
// Fields:
//   serverInfo: {name, version} reported to clients.
//   instructions: Human-readable instructions; omitted from the result when unset.
//   debug: Advertise the logging capability.
//==========================================================================================================
struct DispatcherOptions {
    Implementation serverInfo;
    std::optional<std::string> instructions;
    bool debug{false};

    DispatcherOptions();
};

//==========================================================================================================
// Dispatcher
// Purpose: Maps one method + params to a result or a structured error.
// State machine:
//   Uninitialized --initialize--> Initialized; tools/list and tools/call require Initialized.
// Methods:
//   initialize, ping, tools/list, tools/call, logging/setLevel; anything else is method-not-found.
// Thread-safety: one instance serves one session and may be called from several threads at once.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const ToolRegistry> registry, DispatcherOptions options);

    //==========================================================================================================
    // HandleRequest
    // Purpose: Dispatches a request. Never throws; every failure becomes an error response carrying the
    //          request id.
    // Args:
    //   request: The request (its id is echoed verbatim).
    //   scope: Session, headers, notification sink and cancellation token of this request.
    // Returns:
    //   Exactly one response.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request, RequestScope& scope);

    //==========================================================================================================
    // HandleNotification
    // Purpose: Applies notification side effects (logging/setLevel); other notifications are ignored.
    //          Never throws.
    //==========================================================================================================
    void HandleNotification(const JSONRPCNotification& notification, RequestScope& scope);

    bool IsInitialized() const { return initialized.load(); }

private:
    JSONValue handleInitialize(const JSONValue::Object& params);
    JSONValue handleToolsList();
    JSONValue handleToolsCall(const JSONRPCRequest& request, const JSONValue::Object& params, RequestScope& scope);
    void applyLogLevel(const JSONValue::Object& params, SessionContext& session);
    void requireInitialized() const;

    static JSONValue::Object bindArguments(const ToolDefinition& tool, const JSONValue::Object& arguments);
    static JSONValue formatToolResult(const JSONValue& result);

    std::shared_ptr<const ToolRegistry> registry;
    DispatcherOptions options;
    std::atomic<bool> initialized{false};
};

} // namespace toolhost
