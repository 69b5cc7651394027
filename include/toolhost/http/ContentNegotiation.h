//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentNegotiation.h
// Purpose: Accept-header negotiation for the streamable HTTP endpoint
//==========================================================================================================

#pragma once

#include <functional>
#include <string>

namespace toolhost {
namespace http {

//==========================================================================================================
// AcceptResult
// Purpose: What the client can read: a JSON body and/or an event stream.
//==========================================================================================================
struct AcceptResult {
    bool hasJson{false};
    bool hasSse{false};

    bool AcceptsBoth() const { return hasJson && hasSse; }
};

// Pluggable negotiation rule used by StreamableHTTPServer.
using AcceptNegotiator = std::function<AcceptResult(const std::string& acceptHeader)>;

//==========================================================================================================
// NegotiateAcceptStrict
// Purpose: Strict rule: application/json and text/event-stream must each be named explicitly
//          (parameters such as ";q=0.9" are ignored).
//==========================================================================================================
AcceptResult NegotiateAcceptStrict(const std::string& acceptHeader);

//==========================================================================================================
// NegotiateAcceptLenient
// Purpose: Lenient rule:
//   - empty header, "*" or "*/*" -> both
//   - JSON: application/json, application/* or any "+json" suffix
//   - SSE: text/event-stream or text/*
//   - SSE without JSON -> JSON is assumed readable as well
//==========================================================================================================
AcceptResult NegotiateAcceptLenient(const std::string& acceptHeader);

} // namespace http
} // namespace toolhost
