//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentNegotiation.cpp
// Purpose: Strict and lenient Accept-header rules
//==========================================================================================================

#include "toolhost/http/ContentNegotiation.h"

#include <sstream>
#include <vector>

#include "toolhost/SessionContext.h"

namespace toolhost {
namespace http {

namespace {
// Media ranges, lower-cased, without parameters; empty entries dropped.
std::vector<std::string> mediaRanges(const std::string& header) {
    std::vector<std::string> out;
    std::stringstream ss(header);
    std::string part;
    while (std::getline(ss, part, ',')) {
        auto semi = part.find(';');
        if (semi != std::string::npos) part.erase(semi);
        const auto b = part.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        const auto e = part.find_last_not_of(" \t");
        out.push_back(ToLowerAscii(part.substr(b, e - b + 1)));
    }
    return out;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

AcceptResult NegotiateAcceptStrict(const std::string& acceptHeader) {
    AcceptResult r;
    for (const auto& m : mediaRanges(acceptHeader)) {
        if (m == "application/json") r.hasJson = true;
        if (m == "text/event-stream") r.hasSse = true;
    }
    return r;
}

AcceptResult NegotiateAcceptLenient(const std::string& acceptHeader) {
    const auto ranges = mediaRanges(acceptHeader);
    if (ranges.empty()) {
        return AcceptResult{true, true};
    }
    AcceptResult r;
    for (const auto& m : ranges) {
        if (m == "*/*" || m == "*") {
            return AcceptResult{true, true};
        }
        if (m == "application/json" || m == "application/*" || endsWith(m, "+json")) {
            r.hasJson = true;
        }
        if (m == "text/event-stream" || m == "text/*") {
            r.hasSse = true;
        }
    }
    if (r.hasSse && !r.hasJson) {
        r.hasJson = true;
    }
    return r;
}

} // namespace http
} // namespace toolhost
