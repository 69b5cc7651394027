//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration with schema inference and duplicate-name policy
//==========================================================================================================

#include "toolhost/ToolRegistry.h"

#include <set>
#include <stdexcept>
#include "logging/Logger.h"

namespace toolhost {

bool ToolDefinition::AcceptsContext() const {
    for (const auto& p : signature) {
        if (p.kind == schema::ParameterSpec::Kind::Context) return true;
    }
    return false;
}

bool ToolDefinition::AcceptsExtraArguments() const {
    for (const auto& p : signature) {
        if (p.kind == schema::ParameterSpec::Kind::CatchAll) return true;
    }
    return false;
}

ToolRegistry::ToolRegistry(DuplicatePolicy p) : policy(p) {}

std::shared_ptr<const ToolDefinition> ToolRegistry::Register(const std::string& name,
                                                             const std::string& title,
                                                             const std::string& description,
                                                             schema::Signature signature,
                                                             ToolHandler handler) {
    FUNC_SCOPE();
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + name + "' has no handler");
    }
    std::set<std::string> seen;
    int contextCount = 0;
    int catchAllCount = 0;
    for (const auto& p : signature) {
        if (!seen.insert(p.name).second) {
            throw std::invalid_argument("Tool '" + name + "' declares parameter '" + p.name + "' twice");
        }
        if (p.kind == schema::ParameterSpec::Kind::Context) ++contextCount;
        if (p.kind == schema::ParameterSpec::Kind::CatchAll) ++catchAllCount;
    }
    if (contextCount > 1 || catchAllCount > 1) {
        throw std::invalid_argument("Tool '" + name + "' declares more than one context or catch-all parameter");
    }

    auto def = std::make_shared<ToolDefinition>();
    def->name = name;
    def->title = title;
    def->description = description;
    def->inputSchema = schema::BuildToolSchema(signature);
    def->parameters = def->inputSchema;
    def->signature = std::move(signature);
    def->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(registryMutex);
    for (const auto& existing : tools) {
        if (existing->name != name) continue;
        if (policy == DuplicatePolicy::Reject) {
            throw std::invalid_argument("Tool '" + name + "' is already registered");
        }
        LOG_WARN("Tool '{}' registered more than once; the latest registration handles calls", name);
        break;
    }
    tools.push_back(def);
    LOG_DEBUG("Registered tool '{}' with {} parameter(s)", name, def->signature.size());
    return def;
}

std::vector<std::shared_ptr<const ToolDefinition>> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return tools;
}

std::shared_ptr<const ToolDefinition> ToolRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    for (auto it = tools.rbegin(); it != tools.rend(); ++it) {
        if ((*it)->name == name) return *it;
    }
    return nullptr;
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return tools.size();
}

} // namespace toolhost
