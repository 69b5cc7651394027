//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Instructions.cpp
// Purpose: Instructions text lookup (environment path, working directory, built-in default)
//==========================================================================================================

#include "toolhost/Instructions.h"

#include <fstream>
#include <sstream>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolhost {

namespace {
std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}
} // namespace

const std::string& DefaultInstructions() {
    static const std::string text =
        "This server exposes a set of tools over the Model Context Protocol.\n\n"
        "Call tools/list to discover the available tools and their input schemas, then tools/call "
        "with arguments that match the schema. Prefer concise summaries in responses and include "
        "identifiers returned by tools so follow-up calls can reference them. Avoid expanding raw JSON "
        "unless explicitly requested.";
    return text;
}

std::string LoadInstructions() {
    std::vector<std::string> candidates;
    if (auto envPath = GetEnvOptional("MCP_INSTRUCTIONS_PATH"); envPath.has_value()) {
        candidates.push_back(*envPath);
    }
    candidates.emplace_back("instructions.md");

    for (const auto& path : candidates) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            continue;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) {
            LOG_WARN("Failed to read instructions from '{}'", path);
            continue;
        }
        std::string content = trimmed(ss.str());
        if (!content.empty()) {
            LOG_INFO("Using instructions from '{}'", path);
            return content;
        }
    }
    LOG_INFO("Using built-in instructions text");
    return DefaultInstructions();
}

} // namespace toolhost
