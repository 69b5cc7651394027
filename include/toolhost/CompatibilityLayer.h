//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CompatibilityLayer.h
// Purpose: Idempotent overrides applied to a StreamableHTTPServer at startup (lenient Accept handling,
//          listener timeouts from the environment, POST alias, one-time instructions injection)
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "toolhost/SessionContext.h"
#include "toolhost/StreamableHTTPServer.hpp"
#include "toolhost/http/CorrelationChannel.h"

namespace toolhost {

//==========================================================================================================
// LoadListenerTimeoutsFromEnv
// Purpose: Reads listener timeouts (seconds, fractional allowed):
//            MCP_STREAMABLE_HTTP_TIMEOUT_KEEP_ALIVE       (default 65)
//            MCP_STREAMABLE_HTTP_TIMEOUT_NOTIFY           (default 120)
//            MCP_STREAMABLE_HTTP_TIMEOUT_GRACEFUL_SHUTDOWN (default max(notify, 120))
//          Invalid values are logged and replaced by the default.
//==========================================================================================================
ListenerTimeouts LoadListenerTimeoutsFromEnv();

//==========================================================================================================
// ResolveRequestInstructions
// Purpose: Picks the instructions text for one initialize request, first match wins:
//            1. x-preprompt-id header -> env MCP_PREPROMPT_<ID> (upper-cased, '-' -> '_')
//            2. x-tenant header       -> env MCP_PREPROMPT_TENANT_<TENANT>
//            3. x-preprompt header text
//            4. defaultText
//          Every candidate is trimmed; empty candidates are skipped.
// Returns:
//   The text, or std::nullopt when nothing applies.
//==========================================================================================================
std::optional<std::string> ResolveRequestInstructions(const HeaderMap& headers, const std::string& defaultText);

// Frame carrying {"type":"session.update","session":{"instructions":text}}.
http::StreamEvent BuildSessionUpdateEvent(const std::string& instructions);

//==========================================================================================================
// CompatibilityLayer
// Purpose: Owns the "already applied" state of each override so repeated installation is a no-op.
// Notes:
//   - Install* calls must happen before the server is started.
//   - SetInstructions() may be called at any time; the injector reads the current text per session.
//==========================================================================================================
class CompatibilityLayer {
public:
    CompatibilityLayer();

    void InstallLenientAccept(StreamableHTTPServer& server);
    void ApplyListenerTimeoutsFromEnv(StreamableHTTPServer& server);
    void InstallPostAlias(StreamableHTTPServer& server, const std::string& aliasPath);
    void InstallInstructionsInjection(StreamableHTTPServer& server);

    // Applies every override above.
    void InstallAll(StreamableHTTPServer& server, const std::string& aliasPath);

    // Stores the default instructions text (trimmed); an empty value disables injection.
    void SetInstructions(const std::string& text);
    std::string Instructions() const;

    bool LenientAcceptInstalled() const { return lenientAcceptApplied; }
    bool TimeoutsApplied() const { return timeoutsApplied; }
    bool PostAliasInstalled() const { return postAliasApplied; }
    bool InstructionsInjectionInstalled() const { return instructionsApplied; }

private:
    struct InstructionsState {
        mutable std::mutex mutex;
        std::string text;
    };

    std::shared_ptr<InstructionsState> instructions;
    bool lenientAcceptApplied{false};
    bool timeoutsApplied{false};
    bool postAliasApplied{false};
    bool instructionsApplied{false};
};

} // namespace toolhost
