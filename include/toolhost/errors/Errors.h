//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error record, the RpcException carrier and error Response builders
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Typed error representation.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// RpcException
// Purpose: Exception carrying a JSON-RPC error code. Thrown by dispatch stages and by tool handlers
//          that want a specific code; the dispatch boundary turns it into an error Response.
//==========================================================================================================
class RpcException : public std::runtime_error {
public:
    RpcException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const noexcept { return code_; }
    const std::optional<JSONValue>& data() const noexcept { return data_; }

private:
    int code_;
    std::optional<JSONValue> data_;
};

// Convenience: Create a JSONRPCResponse error from RpcError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from a caught RpcException.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcException& ex) {
    return CreateErrorResponse(id, ex.code(), ex.what(), ex.data());
}

} // namespace errors
} // namespace toolhost
