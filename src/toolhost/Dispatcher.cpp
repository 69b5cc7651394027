//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Request routing, tool argument binding and result formatting
//==========================================================================================================

#include "toolhost/Dispatcher.h"

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

namespace {
std::shared_ptr<JSONValue> boxed(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

const JSONValue::Object& emptyObject() {
    static const JSONValue::Object empty;
    return empty;
}
} // namespace

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = boxed(JSONValue(std::move(tools)));
    }
    if (caps.logging.has_value()) {
        obj["logging"] = boxed(JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(obj));
}

DispatcherOptions::DispatcherOptions()
    : serverInfo("toolhost", getVersionString()) {}

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> reg, DispatcherOptions opts)
    : registry(std::move(reg)), options(std::move(opts)) {}

std::unique_ptr<JSONRPCResponse> Dispatcher::HandleRequest(const JSONRPCRequest& request, RequestScope& scope) {
    FUNC_SCOPE();
    try {
        if (request.params.has_value() && !request.params->IsObject() && !request.params->IsNull()) {
            throw errors::RpcException(JSONRPCErrorCodes::InvalidParams, "Params must be an object");
        }
        const JSONValue::Object& params = (request.params.has_value() && request.params->IsObject())
            ? std::get<JSONValue::Object>(request.params->value)
            : emptyObject();

        JSONValue result;
        if (request.method == Methods::Initialize) {
            result = handleInitialize(params);
        } else if (request.method == Methods::Ping) {
            result = JSONValue(JSONValue::Object{});
        } else if (request.method == Methods::ListTools) {
            result = handleToolsList();
        } else if (request.method == Methods::CallTool) {
            result = handleToolsCall(request, params, scope);
        } else if (request.method == Methods::SetLogLevel) {
            applyLogLevel(params, scope.session);
            result = JSONValue(JSONValue::Object{});
        } else {
            errors::RpcError e;
            e.code = JSONRPCErrorCodes::MethodNotFound;
            e.message = "Method '" + request.method + "' not implemented";
            return errors::makeErrorResponse(request.id, e);
        }
        return std::make_unique<JSONRPCResponse>(request.id, std::move(result));
    } catch (const errors::RpcException& e) {
        LOG_DEBUG("Request {} ({}) failed with code {}: {}", IdToString(request.id), request.method, e.code(), e.what());
        return errors::makeErrorResponse(request.id, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Request {} ({}) failed: {}", IdToString(request.id), request.method, e.what());
        errors::RpcError err;
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = e.what();
        return errors::makeErrorResponse(request.id, err);
    } catch (...) {
        LOG_ERROR("Request {} ({}) failed with a non-standard exception", IdToString(request.id), request.method);
        errors::RpcError err;
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = "Internal error";
        return errors::makeErrorResponse(request.id, err);
    }
}

void Dispatcher::HandleNotification(const JSONRPCNotification& notification, RequestScope& scope) {
    FUNC_SCOPE();
    try {
        if (notification.method == Methods::SetLogLevel) {
            if (notification.params.has_value() && notification.params->IsObject()) {
                applyLogLevel(std::get<JSONValue::Object>(notification.params->value), scope.session);
            }
            return;
        }
        LOG_DEBUG("Ignoring notification '{}' for session {}", notification.method, scope.session.Id());
    } catch (const std::exception& e) {
        LOG_WARN("Notification '{}' handling failed: {}", notification.method, e.what());
    } catch (...) {
        LOG_WARN("Notification '{}' handling failed with a non-standard exception", notification.method);
    }
}

void Dispatcher::requireInitialized() const {
    if (!initialized.load()) {
        throw errors::RpcException(JSONRPCErrorCodes::InvalidRequest, "Server not initialized");
    }
}

JSONValue Dispatcher::handleInitialize(const JSONValue::Object& params) {
    std::string protocol = PROTOCOL_VERSION;
    auto it = params.find("protocolVersion");
    if (it != params.end() && it->second && it->second->IsString() &&
        !std::get<std::string>(it->second->value).empty()) {
        protocol = std::get<std::string>(it->second->value);
    }
    initialized.store(true);

    ServerCapabilities caps;
    caps.tools = ToolsCapability{};
    if (options.debug) {
        caps.logging = LoggingCapability{};
    }

    JSONValue::Object serverInfo;
    serverInfo["name"] = boxed(JSONValue(options.serverInfo.name));
    serverInfo["version"] = boxed(JSONValue(options.serverInfo.version));

    JSONValue::Object result;
    result["protocolVersion"] = boxed(JSONValue(protocol));
    result["capabilities"] = boxed(SerializeServerCapabilities(caps));
    result["serverInfo"] = boxed(JSONValue(std::move(serverInfo)));
    if (options.instructions.has_value()) {
        result["instructions"] = boxed(JSONValue(*options.instructions));
    }
    LOG_INFO("Session initialized (protocolVersion={})", protocol);
    return JSONValue(std::move(result));
}

JSONValue Dispatcher::handleToolsList() {
    requireInitialized();
    JSONValue::Array tools;
    for (const auto& tool : registry->List()) {
        JSONValue::Object entry;
        entry["name"] = boxed(JSONValue(tool->name));
        entry["title"] = boxed(JSONValue(tool->title));
        entry["description"] = boxed(JSONValue(tool->description));
        entry["inputSchema"] = boxed(tool->inputSchema);
        entry["parameters"] = boxed(tool->parameters);
        if (!tool->title.empty()) {
            JSONValue::Object annotations;
            annotations["title"] = boxed(JSONValue(tool->title));
            entry["annotations"] = boxed(JSONValue(std::move(annotations)));
        }
        tools.push_back(boxed(JSONValue(std::move(entry))));
    }
    JSONValue::Object result;
    result["tools"] = boxed(JSONValue(std::move(tools)));
    return JSONValue(std::move(result));
}

JSONValue Dispatcher::handleToolsCall(const JSONRPCRequest& request, const JSONValue::Object& params, RequestScope& scope) {
    requireInitialized();

    auto nameIt = params.find("name");
    if (nameIt == params.end() || !nameIt->second || !nameIt->second->IsString()) {
        throw errors::RpcException(JSONRPCErrorCodes::InvalidParams, "Tool name must be a string");
    }
    const std::string& name = std::get<std::string>(nameIt->second->value);

    auto tool = registry->Find(name);
    if (!tool) {
        throw errors::RpcException(JSONRPCErrorCodes::MethodNotFound, "Tool '" + name + "' not found");
    }

    const JSONValue::Object* arguments = &emptyObject();
    auto argsIt = params.find("arguments");
    if (argsIt != params.end() && argsIt->second && !argsIt->second->IsNull()) {
        if (!argsIt->second->IsObject()) {
            throw errors::RpcException(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
        }
        arguments = &std::get<JSONValue::Object>(argsIt->second->value);
    }

    JSONValue::Object bound = bindArguments(*tool, *arguments);

    std::unique_ptr<ToolContext> ctx;
    if (tool->AcceptsContext()) {
        ctx = std::make_unique<ToolContext>(scope, request.id);
    }

    LOG_DEBUG("Calling tool '{}' for request {}", name, IdToString(request.id));
    std::future<JSONValue> pending = tool->handler(bound, ctx.get());
    if (!pending.valid()) {
        throw errors::RpcException(JSONRPCErrorCodes::InternalError, "Tool '" + name + "' returned no result");
    }
    JSONValue value = pending.get();
    return formatToolResult(value);
}

void Dispatcher::applyLogLevel(const JSONValue::Object& params, SessionContext& session) {
    auto it = params.find("level");
    if (it == params.end() || !it->second || !it->second->IsString()) {
        LOG_WARN("logging/setLevel without a string level; ignoring");
        return;
    }
    const std::string& requested = std::get<std::string>(it->second->value);
    auto level = Logger::tryLevelFromString(requested);
    if (!level.has_value()) {
        LOG_WARN("logging/setLevel with unrecognized level '{}'; ignoring", requested);
        return;
    }
    session.SetClientLogLevel(*level);
    Logger::setLogLevel(*level);
    LOG_INFO("Log level set to {} for session {}", requested, session.Id());
}

JSONValue::Object Dispatcher::bindArguments(const ToolDefinition& tool, const JSONValue::Object& arguments) {
    using Kind = schema::ParameterSpec::Kind;
    JSONValue::Object bound;
    std::string contextName;
    for (const auto& p : tool.signature) {
        if (p.kind == Kind::Context) {
            contextName = p.name;
            continue;
        }
        if (p.kind == Kind::CatchAll) {
            continue;
        }
        auto it = arguments.find(p.name);
        if (it != arguments.end()) {
            bound[p.name] = it->second ? it->second : boxed(JSONValue(nullptr));
        } else if (p.defaultValue.has_value()) {
            bound[p.name] = boxed(*p.defaultValue);
        } else {
            throw errors::RpcException(JSONRPCErrorCodes::InvalidParams, "Missing required argument: " + p.name);
        }
    }
    if (tool.AcceptsExtraArguments()) {
        for (const auto& [key, value] : arguments) {
            if (bound.find(key) != bound.end() || key == contextName || key == "ctx") continue;
            bound[key] = value ? value : boxed(JSONValue(nullptr));
        }
    }
    return bound;
}

JSONValue Dispatcher::formatToolResult(const JSONValue& result) {
    std::string text = result.IsString() ? std::get<std::string>(result.value) : SerializeJSON(result);

    JSONValue::Object block;
    block["type"] = boxed(JSONValue("text"));
    block["text"] = boxed(JSONValue(std::move(text)));
    JSONValue::Array content;
    content.push_back(boxed(JSONValue(std::move(block))));

    JSONValue::Object out;
    out["content"] = boxed(JSONValue(std::move(content)));
    out["isError"] = boxed(JSONValue(false));
    if (result.IsObject()) {
        out["structuredContent"] = boxed(result);
    }
    return JSONValue(std::move(out));
}

} // namespace toolhost
