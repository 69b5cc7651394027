//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaInferencer.h
// Purpose: Converts declared tool signatures into normalized JSON-Schema-shaped input schemas
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/schema/TypeDescriptor.h"

namespace toolhost {
namespace schema {

//==========================================================================================================
// ParameterSpec
// Purpose: One declared tool parameter.
// Fields:
//   name: Argument key as sent by the client.
//   type: Declared type.
//   defaultValue: Present when the parameter has a default; such parameters are not required.
//   kind: Regular parameters appear in the schema. Context parameters receive the engine-injected
//         ToolContext. CatchAll parameters accept any extra client arguments.
//==========================================================================================================
struct ParameterSpec {
    enum class Kind {
        Regular,
        Context,
        CatchAll
    };

    std::string name;
    TypeDescriptor type;
    std::optional<JSONValue> defaultValue;
    Kind kind{Kind::Regular};

    bool IsRequired() const { return kind == Kind::Regular && !defaultValue.has_value(); }

    static ParameterSpec Required(std::string name, TypeDescriptor type);
    static ParameterSpec WithDefault(std::string name, TypeDescriptor type, JSONValue defaultValue);
    static ParameterSpec Context(std::string name = "ctx");
    static ParameterSpec CatchAll(std::string name = "kwargs");
};

using Signature = std::vector<ParameterSpec>;

//==========================================================================================================
// InferSchema
// Purpose: Raw schema for one declared type before normalization.
// Rules:
//   Any -> {} ; scalars -> {type: ...} ; Optional[T] -> schema(T)
//   Array -> {type: array, items: schema(T)}; items omitted when the element type is unknown
//   Array of several element types -> items {anyOf: [...]}
//   Object -> {type: object, properties: {field: schema, ...}}
//   Union -> the only non-null alternative, or {anyOf: [...]} of the non-empty alternative schemas
//==========================================================================================================
JSONValue InferSchema(const TypeDescriptor& type);

//==========================================================================================================
// NormalizeSchema
// Purpose: Recursively rewrites a schema node so every node is a well-formed object:
//   - non-object nodes become {type: object, properties: {}}
//   - arrays always carry items (normalized object/list, else FallbackItemsSchema())
//   - objects always carry a normalized properties map
//   - a node whose type is neither a string nor a list becomes an object
//   - anyOf/oneOf/allOf entries are normalized; non-object entries are dropped
//   - required is filtered to strings and removed when empty
// Never throws.
//==========================================================================================================
JSONValue NormalizeSchema(const JSONValue& node);

// Permissive items schema: {type: [boolean, integer, number, string, object, null]}.
JSONValue FallbackItemsSchema();

//==========================================================================================================
// BuildToolSchema
// Purpose: Normalized top-level input schema {type: object, properties: {...}, required?: [...]}.
//          required lists Regular parameters without defaults in declaration order and is omitted when
//          empty. Context and CatchAll parameters are excluded.
//==========================================================================================================
JSONValue BuildToolSchema(const Signature& signature);

} // namespace schema
} // namespace toolhost
