//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_negotiation.cpp
// Purpose: GoogleTests for strict and lenient Accept-header negotiation
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/http/ContentNegotiation.h"

using namespace toolhost::http;

TEST(AcceptStrict, RequiresBothExplicitTypes) {
    EXPECT_TRUE(NegotiateAcceptStrict("application/json, text/event-stream").AcceptsBoth());
    EXPECT_TRUE(NegotiateAcceptStrict("text/event-stream;q=0.9,APPLICATION/JSON").AcceptsBoth());
    EXPECT_FALSE(NegotiateAcceptStrict("application/json").AcceptsBoth());
    EXPECT_FALSE(NegotiateAcceptStrict("*/*").AcceptsBoth());
    EXPECT_FALSE(NegotiateAcceptStrict("").AcceptsBoth());
}

TEST(AcceptLenient, WildcardsAndMissingHeader) {
    EXPECT_TRUE(NegotiateAcceptLenient("").AcceptsBoth());
    EXPECT_TRUE(NegotiateAcceptLenient("*/*").AcceptsBoth());
    EXPECT_TRUE(NegotiateAcceptLenient("text/html, */*;q=0.1").AcceptsBoth());
    EXPECT_TRUE(NegotiateAcceptLenient("application/*, text/*").AcceptsBoth());
}

TEST(AcceptLenient, EventStreamImpliesJson) {
    AcceptResult r = NegotiateAcceptLenient("text/event-stream");
    EXPECT_TRUE(r.hasSse);
    EXPECT_TRUE(r.hasJson);
}

TEST(AcceptLenient, JsonSuffixCountsAsJson) {
    AcceptResult r = NegotiateAcceptLenient("application/vnd.api+json, text/event-stream");
    EXPECT_TRUE(r.AcceptsBoth());
}

TEST(AcceptLenient, JsonOnlyStillRejected) {
    AcceptResult r = NegotiateAcceptLenient("application/json");
    EXPECT_TRUE(r.hasJson);
    EXPECT_FALSE(r.hasSse);
    EXPECT_FALSE(r.AcceptsBoth());
}

TEST(AcceptLenient, UnrelatedTypesRejected) {
    EXPECT_FALSE(NegotiateAcceptLenient("image/png").AcceptsBoth());
}
