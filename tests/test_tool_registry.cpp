//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: GoogleTests for tool registration, ordering and duplicate-name policies
//==========================================================================================================

#include <gtest/gtest.h>
#include <future>
#include <stdexcept>
#include "toolhost/ToolRegistry.h"

using namespace toolhost;
using namespace toolhost::schema;

namespace {

ToolHandler constantHandler(const std::string& text) {
    return [text](const JSONValue::Object&, ToolContext*) {
        std::promise<JSONValue> p;
        p.set_value(JSONValue{text});
        return p.get_future();
    };
}

} // namespace

TEST(ToolRegistry, ListsInRegistrationOrder) {
    ToolRegistry registry;
    registry.Register("b", "B", "second letter", {}, constantHandler("b"));
    registry.Register("a", "A", "first letter", {}, constantHandler("a"));
    registry.Register("c", "C", "third letter", {}, constantHandler("c"));

    auto tools = registry.List();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]->name, "b");
    EXPECT_EQ(tools[1]->name, "a");
    EXPECT_EQ(tools[2]->name, "c");
    EXPECT_EQ(registry.Size(), 3u);
}

TEST(ToolRegistry, SchemaAndParametersAreIdentical) {
    ToolRegistry registry;
    auto def = registry.Register("search", "Search", "Search things",
        {ParameterSpec::Required("query", TypeDescriptor::String())}, constantHandler("ok"));
    EXPECT_TRUE(JSONEquals(def->inputSchema, def->parameters));
    EXPECT_FALSE(def->AcceptsContext());
    EXPECT_FALSE(def->AcceptsExtraArguments());
}

TEST(ToolRegistry, DuplicateAllowedLatestWins) {
    ToolRegistry registry(DuplicatePolicy::Allow);
    registry.Register("dup", "First", "", {}, constantHandler("first"));
    registry.Register("dup", "Second", "", {}, constantHandler("second"));

    EXPECT_EQ(registry.List().size(), 2u);
    auto found = registry.Find("dup");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->title, "Second");
    auto value = found->handler(JSONValue::Object{}, nullptr).get();
    EXPECT_EQ(std::get<std::string>(value.value), "second");
}

TEST(ToolRegistry, DuplicateRejected) {
    ToolRegistry registry(DuplicatePolicy::Reject);
    registry.Register("dup", "First", "", {}, constantHandler("first"));
    EXPECT_THROW(registry.Register("dup", "Second", "", {}, constantHandler("second")), std::invalid_argument);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(ToolRegistry, InvalidRegistrations) {
    ToolRegistry registry;
    EXPECT_THROW(registry.Register("", "", "", {}, constantHandler("x")), std::invalid_argument);
    EXPECT_THROW(registry.Register("nohandler", "", "", {}, ToolHandler{}), std::invalid_argument);
    EXPECT_THROW(registry.Register("twice", "", "",
        {ParameterSpec::Required("x", TypeDescriptor::Integer()), ParameterSpec::Required("x", TypeDescriptor::String())},
        constantHandler("x")), std::invalid_argument);
    EXPECT_THROW(registry.Register("twoctx", "", "",
        {ParameterSpec::Context("a"), ParameterSpec::Context("b")}, constantHandler("x")), std::invalid_argument);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ToolRegistry, FindUnknownIsNull) {
    ToolRegistry registry;
    EXPECT_EQ(registry.Find("missing"), nullptr);
}
