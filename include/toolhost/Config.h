//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Runtime configuration (CLI flags over environment over defaults) and endpoint path helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace toolhost {

//==========================================================================================================
// GetArgValue
// Purpose: Returns the value of a "--key=value" command-line option.
// Args:
//   argc/argv: Command line.
//   key: Option name including leading dashes (e.g., "--transport").
// Returns:
//   The value when present (possibly empty); std::nullopt otherwise.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

// True when the bare flag (e.g., "--debug") is present.
bool HasArgFlag(int argc, char** argv, const std::string& flag);

//==========================================================================================================
// ParseAddress
// Purpose: Splits "HOST:PORT" at the last colon.
// Throws:
//   std::invalid_argument when there is no colon or the port is not an integer in [0, 65535].
//==========================================================================================================
std::pair<std::string, std::string> ParseAddress(const std::string& value);

// Leading "/" and no trailing "/" (except the root).
std::string NormalizeMountPath(const std::string& basePath);

// Joins a mount path and a segment with exactly one "/".
std::string JoinPath(const std::string& base, const std::string& segment);

//==========================================================================================================
// ResolveEndpointPath
// Purpose: Absolute paths are used as given; relative ones are joined to the mount path. Empty input
//          uses defaultSegment. Trailing "/" is removed except for the root.
//==========================================================================================================
std::string ResolveEndpointPath(const std::string& path, const std::string& mountPath,
                                const std::string& defaultSegment);

//==========================================================================================================
// ServerConfig
// Purpose: Process settings. Precedence: CLI flag > environment > default.
// Fields (flag / environment / default):
//   transport           --transport / TRANSPORT / stdio (stdio | streamable-http)
//   host, port          --address / APP_ADDRESS / localhost:8000
//   basePath            --base-path / BASE_PATH / "/"
//   streamableHttpPath  --streamable-http-path / STREAMABLE_HTTP_PATH / "mcp"
//   logLevel            --log-level / TOOLHOST_LOG_LEVEL / INFO
//   debug               --debug
//   jsonResponse        --json-response
//   certFile, keyFile   --cert / --key (HTTPS when both are set)
//   showVersion         --version
//==========================================================================================================
struct ServerConfig {
    enum class Transport {
        Stdio,
        StreamableHttp
    };

    Transport transport{Transport::Stdio};
    std::string host{"localhost"};
    std::string port{"8000"};
    std::string basePath{"/"};
    std::string streamableHttpPath{"mcp"};
    std::string logLevel{"INFO"};
    bool debug{false};
    bool jsonResponse{false};
    std::string certFile;
    std::string keyFile;
    bool showVersion{false};

    //==========================================================================================================
    // FromArgs
    // Notes:
    //   - Selecting the stdio transport switches the logger to stdio mode before any warning is logged.
    // Throws:
    //   std::invalid_argument for an unknown transport, a malformed address, or only one of --cert/--key.
    //==========================================================================================================
    static ServerConfig FromArgs(int argc, char** argv);

    //==========================================================================================================
    // ApplyLogging
    // Purpose: Applies logLevel and, for the stdio transport, routes console logs to stderr so stdout
    //          carries only protocol lines. Call before anything else logs.
    //==========================================================================================================
    void ApplyLogging() const;

    std::string MountPath() const;
    std::string EndpointPath() const;
    // Alternate POST path kept for clients that still target "<base>/sse".
    std::string AliasPath() const;
    bool UseTls() const { return !certFile.empty() && !keyFile.empty(); }
};

// "stdio" or "streamable-http".
const char* TransportName(ServerConfig::Transport transport);

} // namespace toolhost
