//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: GoogleTests for the JSON codec and JSON-RPC message classification
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include "toolhost/JSONRPCTypes.h"

using namespace toolhost;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,2.5,"x"],"c":{"d":"e"}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(std::get<int64_t>(a->value), 1);

    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->IsArray());
    const auto& arr = std::get<JSONValue::Array>(b->value);
    ASSERT_EQ(arr.size(), 4u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->IsNull());
    EXPECT_DOUBLE_EQ(std::get<double>(arr[2]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[3]->value), "x");

    const JSONValue* c = FindMember(v, "c");
    ASSERT_NE(c, nullptr);
    const JSONValue* d = FindMember(*c, "d");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(std::get<std::string>(d->value), "e");
}

TEST(JSONParser, DecodesEscapesAndUnicode) {
    JSONValue v = ParseJSON(R"("line\nbreak \"q\" é 😀")");
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nbreak \"q\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONParser, SerializeEscapesControlCharacters) {
    JSONValue::Object o;
    o["k"] = std::make_shared<JSONValue>(std::string("a\"b\\c\n"));
    EXPECT_EQ(SerializeJSON(JSONValue{o}), R"({"k":"a\"b\\c\n"})");
}

TEST(JSONParser, EqualityComparesNumbersByValue) {
    EXPECT_TRUE(JSONEquals(ParseJSON("[1, 2.0]"), ParseJSON("[1.0, 2]")));
    EXPECT_TRUE(JSONEquals(ParseJSON(R"({"a":1,"b":2})"), ParseJSON(R"({"b":2,"a":1})")));
    EXPECT_FALSE(JSONEquals(ParseJSON(R"({"a":1})"), ParseJSON(R"({"a":"1"})")));
}

TEST(JSONRPCClassify, RequestNotificationResponseAndError) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":"a","method":"x","params":{}})")), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")),
              MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"result":{}})")), MessageKind::Response);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":null,"error":{"code":-1,"message":"m"}})")),
              MessageKind::Error);
}

TEST(JSONRPCClassify, NullParamsCountAsAbsent) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":3,"method":"ping","params":null})")),
              MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized","params":null})")),
              MessageKind::Notification);
}

TEST(JSONRPCClassify, VersionCheckCanBeRelaxed) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"id":2,"method":"ping"})"), false), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"method":"notifications/initialized"})"), false), MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"id":2,"method":"ping","params":[1]})"), false), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"id":2,"method":7})"), false), MessageKind::Invalid);
}

TEST(JSONRPCClassify, InvalidShapes) {
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"id":1,"method":"ping"})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"1.0","id":1,"method":"ping"})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":5})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"x","params":[1]})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON(R"({"jsonrpc":"2.0","id":{},"method":"x"})")), MessageKind::Invalid);
    EXPECT_EQ(ClassifyMessage(ParseJSON("[1,2]")), MessageKind::Invalid);
}

TEST(JSONRPCMessages, RequestEchoesIdKind) {
    JSONRPCRequest req;
    ASSERT_TRUE(req.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list"})"));
    ASSERT_TRUE(std::holds_alternative<std::string>(req.id));
    EXPECT_EQ(std::get<std::string>(req.id), "abc");

    JSONRPCResponse resp(req.id, JSONValue{JSONValue::Object{}});
    JSONValue out = ParseJSON(resp.Serialize());
    const JSONValue* id = FindMember(out, "id");
    ASSERT_NE(id, nullptr);
    ASSERT_TRUE(id->IsString());
    EXPECT_EQ(std::get<std::string>(id->value), "abc");
}

TEST(JSONRPCMessages, ErrorResponseShape) {
    auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error: bad");
    JSONValue out = ParseJSON(err->Serialize());
    EXPECT_TRUE(FindMember(out, "id")->IsNull());
    const JSONValue* e = FindMember(out, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(*e, "code")->value), -32700);
    EXPECT_EQ(std::get<std::string>(FindMember(*e, "message")->value), "Parse error: bad");
    EXPECT_EQ(FindMember(*e, "data"), nullptr);
}
