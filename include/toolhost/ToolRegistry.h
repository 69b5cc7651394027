//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Ordered registry of tool definitions built at startup and shared by all transports
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/SessionContext.h"
#include "toolhost/schema/SchemaInferencer.h"

namespace toolhost {

//==========================================================================================================
// ToolHandler
// Purpose: Tool entry point.
// Args:
//   arguments: Bound arguments: declared parameters (defaults filled in) plus, for tools with a
//              CatchAll parameter, any extra client arguments.
//   ctx: Engine context when the tool declares a Context parameter; nullptr otherwise.
// Returns:
//   Future resolving to the tool result: a string (sent as-is) or any JSON value (sent serialized;
//   objects are also returned as structured content). Failures are reported by throwing:
//   errors::RpcException keeps its code, other exceptions become internal errors.
//==========================================================================================================
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue::Object& arguments, ToolContext* ctx)>;

//==========================================================================================================
// ToolDefinition
// Purpose: Immutable record of one registered tool.
// Fields:
//   name, title, description: Discovery metadata.
//   inputSchema: Normalized schema built from the signature.
//   parameters: Same schema, exposed under a second discovery key.
//   signature: Declared parameters in order.
//   handler: Callable invoked for tools/call.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string title;
    std::string description;
    JSONValue inputSchema;
    JSONValue parameters;
    schema::Signature signature;
    ToolHandler handler;

    bool AcceptsContext() const;
    bool AcceptsExtraArguments() const;
};

// Behavior when a tool name is registered twice.
enum class DuplicatePolicy {
    Allow,  // both are listed; the later registration is the one called
    Reject  // Register throws std::invalid_argument
};

//==========================================================================================================
// ToolRegistry
// Purpose: Owns tool definitions. Populated before transports start; read concurrently afterwards.
//==========================================================================================================
class ToolRegistry {
public:
    explicit ToolRegistry(DuplicatePolicy policy = DuplicatePolicy::Allow);

    //==========================================================================================================
    // Register
    // Purpose: Builds the ToolDefinition (schema via BuildToolSchema) and appends it.
    // Args:
    //   name: Unique tool key (must be non-empty).
    //   title: Human-readable title (also used for annotations.title).
    //   description: Tool description.
    //   signature: Declared parameters; names must be unique; at most one Context and one CatchAll.
    //   handler: Tool entry point (must be set).
    // Returns:
    //   The stored definition.
    // Throws:
    //   std::invalid_argument for invalid input or a duplicate name under DuplicatePolicy::Reject.
    //==========================================================================================================
    std::shared_ptr<const ToolDefinition> Register(const std::string& name,
                                                   const std::string& title,
                                                   const std::string& description,
                                                   schema::Signature signature,
                                                   ToolHandler handler);

    // Definitions in registration order.
    std::vector<std::shared_ptr<const ToolDefinition>> List() const;

    // Definition invoked for a name (latest registration wins), or nullptr.
    std::shared_ptr<const ToolDefinition> Find(const std::string& name) const;

    std::size_t Size() const;

private:
    DuplicatePolicy policy;
    mutable std::mutex registryMutex;
    std::vector<std::shared_ptr<const ToolDefinition>> tools;
};

} // namespace toolhost
