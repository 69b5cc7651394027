//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Line-delimited JSON-RPC transport over stdin/stdout for a single local peer
//==========================================================================================================
#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "toolhost/Dispatcher.h"
#include "toolhost/SessionContext.h"
#include "toolhost/ToolRegistry.h"

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: Blocking read-dispatch-write loop. One JSON-RPC message per line in each direction.
// Behavior:
//   - Blank lines are skipped.
//   - Unparseable lines get a -32700 error with id null.
//   - Notifications are dispatched without a reply; client responses are ignored.
//   - Each request gets exactly one response line with the same id before the next line is read.
//   - Notifications emitted by a tool are written inline, before the response of that request.
// Notes:
//   - Construction switches the Logger to stdio mode so stdout carries protocol lines only.
//   - Streams are injectable for tests; the defaults are std::cin / std::cout.
//==========================================================================================================
class StdioTransport {
public:
    StdioTransport(std::shared_ptr<const ToolRegistry> registry,
                   DispatcherOptions options,
                   std::istream& in = std::cin,
                   std::ostream& out = std::cout);
    ~StdioTransport();

    //==========================================================================================================
    // Run
    // Purpose: Processes lines until end of input, a write failure, or Stop().
    //==========================================================================================================
    void Run();

    // Requests the loop to exit after the current line.
    void Stop();

    bool IsRunning() const;

    //==========================================================================================================
    // HandleLine
    // Purpose: Processes a single inbound line and writes any reply. Never throws.
    // Returns:
    //   false when the output stream failed and the transport should stop.
    //==========================================================================================================
    bool HandleLine(const std::string& line);

    SessionContext& Session();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
