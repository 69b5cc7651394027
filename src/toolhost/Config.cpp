//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Command-line/environment configuration and endpoint path helpers
//==========================================================================================================

#include "toolhost/Config.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/SessionContext.h"

namespace toolhost {

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

bool HasArgFlag(int argc, char** argv, const std::string& flag) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

std::pair<std::string, std::string> ParseAddress(const std::string& value) {
    const auto colon = value.rfind(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("Address must be in HOST:PORT format");
    }
    std::string host = value.substr(0, colon);
    std::string port = value.substr(colon + 1);
    const bool numeric = !port.empty() && port.size() <= 5 &&
        std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric || std::stoul(port) > 65535ul) {
        throw std::invalid_argument("Port must be an integer: " + port);
    }
    if (host.size() > 1 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return {host, port};
}

std::string NormalizeMountPath(const std::string& basePath) {
    std::string path = basePath.empty() ? std::string("/") : basePath;
    if (path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string JoinPath(const std::string& base, const std::string& segment) {
    std::string basePart = base;
    while (!basePart.empty() && basePart.back() == '/') basePart.pop_back();
    std::string seg = segment;
    const auto b = seg.find_first_not_of('/');
    seg = (b == std::string::npos) ? std::string() : seg.substr(b);
    while (!seg.empty() && seg.back() == '/') seg.pop_back();

    if (seg.empty()) {
        return basePart.empty() ? std::string("/") : basePart;
    }
    if (basePart.empty()) {
        return "/" + seg;
    }
    return basePart + "/" + seg;
}

std::string ResolveEndpointPath(const std::string& path, const std::string& mountPath,
                                const std::string& defaultSegment) {
    const std::string value = path.empty() ? defaultSegment : path;
    std::string resolved = (!value.empty() && value.front() == '/') ? value : JoinPath(mountPath, value);
    while (resolved.size() > 1 && resolved.back() == '/') {
        resolved.pop_back();
    }
    return resolved.empty() ? std::string("/") : resolved;
}

const char* TransportName(ServerConfig::Transport transport) {
    return transport == ServerConfig::Transport::Stdio ? "stdio" : "streamable-http";
}

ServerConfig ServerConfig::FromArgs(int argc, char** argv) {
    ServerConfig cfg;

    auto pick = [&](const char* flag, const char* env, const std::string& def) {
        if (auto v = GetArgValue(argc, argv, flag); v.has_value()) {
            return v.value();
        }
        return GetEnvOptional(env).value_or(def);
    };

    const std::string transport = ToLowerAscii(pick("--transport", "TRANSPORT", "stdio"));
    if (transport == "stdio") {
        cfg.transport = Transport::Stdio;
    } else if (transport == "streamable-http" || transport == "http") {
        cfg.transport = Transport::StreamableHttp;
    } else {
        throw std::invalid_argument("Unknown transport: " + transport + " (expected stdio|streamable-http)");
    }
    if (cfg.transport == Transport::Stdio) {
        Logger::setStdioMode(true);
    }

    const auto address = ParseAddress(pick("--address", "APP_ADDRESS", "localhost:8000"));
    cfg.host = address.first;
    cfg.port = address.second;
    cfg.basePath = pick("--base-path", "BASE_PATH", "/");
    cfg.streamableHttpPath = pick("--streamable-http-path", "STREAMABLE_HTTP_PATH", "mcp");
    cfg.logLevel = pick("--log-level", "TOOLHOST_LOG_LEVEL", "INFO");
    cfg.debug = HasArgFlag(argc, argv, "--debug");
    cfg.jsonResponse = HasArgFlag(argc, argv, "--json-response");
    cfg.showVersion = HasArgFlag(argc, argv, "--version");
    cfg.certFile = GetArgValue(argc, argv, "--cert").value_or("");
    cfg.keyFile = GetArgValue(argc, argv, "--key").value_or("");
    if (cfg.certFile.empty() != cfg.keyFile.empty()) {
        throw std::invalid_argument("--cert and --key must be given together");
    }
    if (!Logger::tryLevelFromString(cfg.logLevel).has_value()) {
        LOG_WARN("Unknown log level '{}'; using INFO", cfg.logLevel);
        cfg.logLevel = "INFO";
    }
    return cfg;
}

void ServerConfig::ApplyLogging() const {
    if (transport == Transport::Stdio) {
        Logger::setStdioMode(true);
    }
    Logger::setLogLevelFromString(logLevel);
}

std::string ServerConfig::MountPath() const {
    return NormalizeMountPath(basePath);
}

std::string ServerConfig::EndpointPath() const {
    return ResolveEndpointPath(streamableHttpPath, MountPath(), "mcp");
}

std::string ServerConfig::AliasPath() const {
    return JoinPath(MountPath(), "sse");
}

} // namespace toolhost
