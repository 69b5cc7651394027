//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport acceptor interfaces
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace toolhost {

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side acceptor which owns the listen lifecycle and routes inbound JSON-RPC messages to
//          per-session dispatchers.
// Notes:
//   - Implementations bind/listen in Start() and tear down in Stop().
//   - Errors that do not belong to a single request are reported through the error handler.
//==========================================================================================================
class ITransportAcceptor {
public:
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Returns:
    //   Future that completes when the accept loop is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the acceptor: stops accepting, cancels open sessions and releases resources.
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    //==========================================================================================================
    // Registers an error handler to receive acceptor errors.
    // Args:
    //   handler: Callback receiving error strings.
    //==========================================================================================================
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportAcceptorFactory
// Purpose: Creates server-side acceptors from configuration strings.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;

    //==========================================================================================================
    // Creates an acceptor instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g., "http://127.0.0.1:8000/mcp").
    // Returns:
    //   A unique_ptr to a newly created ITransportAcceptor.
    //==========================================================================================================
    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) = 0;
};

} // namespace toolhost
