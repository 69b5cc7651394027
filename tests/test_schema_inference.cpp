//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_inference.cpp
// Purpose: GoogleTests for type annotation parsing, schema inference and schema normalization
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/schema/SchemaInferencer.h"
#include "toolhost/schema/TypeDescriptor.h"

using namespace toolhost;
using namespace toolhost::schema;

namespace {

std::string typeOf(const JSONValue& schema) {
    const JSONValue* t = FindMember(schema, "type");
    return (t != nullptr && t->IsString()) ? std::get<std::string>(t->value) : std::string();
}

const JSONValue& property(const JSONValue& schema, const std::string& name) {
    const JSONValue* props = FindMember(schema, "properties");
    EXPECT_NE(props, nullptr);
    const JSONValue* p = FindMember(*props, name);
    EXPECT_NE(p, nullptr);
    return *p;
}

std::vector<std::string> requiredNames(const JSONValue& schema) {
    std::vector<std::string> out;
    const JSONValue* req = FindMember(schema, "required");
    if (req == nullptr) return out;
    for (const auto& v : std::get<JSONValue::Array>(req->value)) {
        out.push_back(std::get<std::string>(v->value));
    }
    return out;
}

} // namespace

TEST(TypeAnnotation, ParsesScalarsAndContainers) {
    EXPECT_EQ(ParseTypeAnnotation("str").kind(), TypeDescriptor::Kind::String);
    EXPECT_EQ(ParseTypeAnnotation("int").kind(), TypeDescriptor::Kind::Integer);
    EXPECT_EQ(ParseTypeAnnotation("float").kind(), TypeDescriptor::Kind::Number);
    EXPECT_EQ(ParseTypeAnnotation("bool").kind(), TypeDescriptor::Kind::Boolean);
    EXPECT_EQ(ParseTypeAnnotation("dict[str, int]").kind(), TypeDescriptor::Kind::Object);
    EXPECT_EQ(ParseTypeAnnotation("typing.List[str]").ToString(), "list[string]");
    EXPECT_EQ(ParseTypeAnnotation("Optional[list[int]]").ToString(), "Optional[list[integer]]");
    EXPECT_EQ(ParseTypeAnnotation("int | str | None").ToString(), "Union[integer, string, None]");
}

TEST(TypeAnnotation, UnknownOrMalformedIsAny) {
    EXPECT_EQ(ParseTypeAnnotation("SomeCustomClass").kind(), TypeDescriptor::Kind::Any);
    EXPECT_EQ(ParseTypeAnnotation("list[int").kind(), TypeDescriptor::Kind::Any);
    EXPECT_EQ(ParseTypeAnnotation("").kind(), TypeDescriptor::Kind::Any);
}

TEST(SchemaInference, RequiredAndDefaultedParameters) {
    Signature sig{
        ParameterSpec::Required("query", TypeDescriptor::String()),
        ParameterSpec::WithDefault("limit", TypeDescriptor::Integer(), JSONValue{static_cast<int64_t>(10)}),
        ParameterSpec::Context(),
    };
    JSONValue schema = BuildToolSchema(sig);
    EXPECT_EQ(typeOf(schema), "object");
    EXPECT_EQ(typeOf(property(schema, "query")), "string");
    EXPECT_EQ(typeOf(property(schema, "limit")), "integer");
    EXPECT_EQ(FindMember(*FindMember(schema, "properties"), "ctx"), nullptr);
    EXPECT_EQ(requiredNames(schema), std::vector<std::string>{"query"});
}

TEST(SchemaInference, NoRequiredListWhenAllDefaulted) {
    Signature sig{ParameterSpec::WithDefault("x", TypeDescriptor::Boolean(), JSONValue{false})};
    JSONValue schema = BuildToolSchema(sig);
    EXPECT_EQ(FindMember(schema, "required"), nullptr);
}

TEST(SchemaInference, OptionalUnwrapsToInnerType) {
    JSONValue s = InferSchema(ParseTypeAnnotation("Optional[int]"));
    EXPECT_EQ(typeOf(s), "integer");
    JSONValue u = InferSchema(ParseTypeAnnotation("int | None"));
    EXPECT_EQ(typeOf(u), "integer");
}

TEST(SchemaInference, UnionBecomesAnyOf) {
    JSONValue s = InferSchema(ParseTypeAnnotation("Union[int, str]"));
    const JSONValue* anyOf = FindMember(s, "anyOf");
    ASSERT_NE(anyOf, nullptr);
    const auto& options = std::get<JSONValue::Array>(anyOf->value);
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(typeOf(*options[0]), "integer");
    EXPECT_EQ(typeOf(*options[1]), "string");
}

TEST(SchemaInference, TypedArrayKeepsItems) {
    Signature sig{ParameterSpec::Required("labels", ParseTypeAnnotation("list[str]"))};
    JSONValue schema = BuildToolSchema(sig);
    const JSONValue& labels = property(schema, "labels");
    EXPECT_EQ(typeOf(labels), "array");
    const JSONValue* items = FindMember(labels, "items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(typeOf(*items), "string");
}

TEST(SchemaInference, UntypedArrayGetsFallbackItems) {
    Signature sig{ParameterSpec::Required("values", ParseTypeAnnotation("list"))};
    JSONValue schema = BuildToolSchema(sig);
    const JSONValue& values = property(schema, "values");
    const JSONValue* items = FindMember(values, "items");
    ASSERT_NE(items, nullptr);
    EXPECT_TRUE(JSONEquals(*items, FallbackItemsSchema()));
    // The fallback itself never contains "array", so it needs no further items
    const auto& types = std::get<JSONValue::Array>(FindMember(*items, "type")->value);
    for (const auto& t : types) {
        EXPECT_NE(std::get<std::string>(t->value), "array");
    }
}

TEST(SchemaInference, MixedArrayUsesAnyOfItems) {
    JSONValue s = InferSchema(ParseTypeAnnotation("list[int, str]"));
    const JSONValue* items = FindMember(s, "items");
    ASSERT_NE(items, nullptr);
    ASSERT_NE(FindMember(*items, "anyOf"), nullptr);
}

TEST(SchemaInference, UntypedParameterIsEmptySchema) {
    Signature sig{ParameterSpec::Required("anything", TypeDescriptor::Any())};
    JSONValue schema = BuildToolSchema(sig);
    const JSONValue& anything = property(schema, "anything");
    ASSERT_TRUE(anything.IsObject());
}

TEST(SchemaNormalization, ObjectsAlwaysCarryProperties) {
    JSONValue normalized = NormalizeSchema(ParseJSON(R"({"type":"object"})"));
    const JSONValue* props = FindMember(normalized, "properties");
    ASSERT_NE(props, nullptr);
    EXPECT_TRUE(props->IsObject());
}

TEST(SchemaNormalization, NestedArrayItemsAndTypeLists) {
    JSONValue input = ParseJSON(R"({
        "type":"object",
        "properties":{
            "matrix":{"type":"array","items":{"type":"array"}},
            "maybe":{"type":["array","null"]}
        },
        "required":["matrix", 3]
    })");
    JSONValue out = NormalizeSchema(input);

    const JSONValue& matrix = property(out, "matrix");
    const JSONValue* inner = FindMember(matrix, "items");
    ASSERT_NE(inner, nullptr);
    ASSERT_NE(FindMember(*inner, "items"), nullptr);

    const JSONValue& maybe = property(out, "maybe");
    ASSERT_NE(FindMember(maybe, "items"), nullptr);

    EXPECT_EQ(requiredNames(out), std::vector<std::string>{"matrix"});
}

TEST(SchemaNormalization, MissingTypeDefaultsToObject) {
    JSONValue out = NormalizeSchema(ParseJSON(R"({"description":"free form"})"));
    EXPECT_EQ(typeOf(out), "object");
    ASSERT_NE(FindMember(out, "properties"), nullptr);

    JSONValue combinator = NormalizeSchema(ParseJSON(R"({"anyOf":[{"type":"array"},{"type":"string"}]})"));
    EXPECT_EQ(FindMember(combinator, "type"), nullptr);
    const auto& options = std::get<JSONValue::Array>(FindMember(combinator, "anyOf")->value);
    ASSERT_EQ(options.size(), 2u);
    ASSERT_NE(FindMember(*options[0], "items"), nullptr);
}

TEST(SchemaNormalization, NonObjectBecomesEmptyObjectSchema) {
    JSONValue out = NormalizeSchema(JSONValue{true});
    EXPECT_EQ(typeOf(out), "object");
}
