//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaInferencer.cpp
// Purpose: Schema inference from TypeDescriptor signatures and recursive schema normalization
//==========================================================================================================

#include "toolhost/schema/SchemaInferencer.h"

#include "logging/Logger.h"

namespace toolhost {
namespace schema {

namespace {

std::shared_ptr<JSONValue> str(const char* s) {
    return std::make_shared<JSONValue>(std::string(s));
}

JSONValue typed(const char* type) {
    JSONValue::Object o;
    o["type"] = str(type);
    return JSONValue(std::move(o));
}

bool isEmptyObject(const JSONValue& v) {
    return v.IsObject() && std::get<JSONValue::Object>(v.value).empty();
}

JSONValue untypedObject() {
    JSONValue::Object o;
    o["type"] = str("object");
    o["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue(std::move(o));
}

JSONValue::Array nonEmptySchemas(const std::vector<TypeDescriptor>& types) {
    JSONValue::Array out;
    for (const auto& t : types) {
        JSONValue s = InferSchema(t);
        if (!isEmptyObject(s)) {
            out.push_back(std::make_shared<JSONValue>(std::move(s)));
        }
    }
    return out;
}

void normalizeItems(JSONValue::Object& node) {
    auto it = node.find("items");
    if (it != node.end() && it->second && it->second->IsArray()) {
        JSONValue::Array items;
        for (const auto& item : std::get<JSONValue::Array>(it->second->value)) {
            items.push_back(std::make_shared<JSONValue>(item ? NormalizeSchema(*item) : untypedObject()));
        }
        node["items"] = items.empty() ? std::make_shared<JSONValue>(FallbackItemsSchema())
                                      : std::make_shared<JSONValue>(std::move(items));
        return;
    }
    if (it != node.end() && it->second && it->second->IsObject()) {
        node["items"] = std::make_shared<JSONValue>(NormalizeSchema(*it->second));
        return;
    }
    node["items"] = std::make_shared<JSONValue>(FallbackItemsSchema());
}

void normalizeProperties(JSONValue::Object& node) {
    JSONValue::Object props;
    auto it = node.find("properties");
    if (it != node.end() && it->second && it->second->IsObject()) {
        for (const auto& [key, value] : std::get<JSONValue::Object>(it->second->value)) {
            props[key] = std::make_shared<JSONValue>(value ? NormalizeSchema(*value) : untypedObject());
        }
    }
    node["properties"] = std::make_shared<JSONValue>(std::move(props));
}

bool listContains(const JSONValue::Array& list, const std::string& needle) {
    for (const auto& v : list) {
        if (v && v->IsString() && std::get<std::string>(v->value) == needle) return true;
    }
    return false;
}

} // namespace

ParameterSpec ParameterSpec::Required(std::string name, TypeDescriptor type) {
    ParameterSpec p;
    p.name = std::move(name);
    p.type = std::move(type);
    return p;
}

ParameterSpec ParameterSpec::WithDefault(std::string name, TypeDescriptor type, JSONValue defaultValue) {
    ParameterSpec p;
    p.name = std::move(name);
    p.type = std::move(type);
    p.defaultValue = std::move(defaultValue);
    return p;
}

ParameterSpec ParameterSpec::Context(std::string name) {
    ParameterSpec p;
    p.name = std::move(name);
    p.kind = Kind::Context;
    return p;
}

ParameterSpec ParameterSpec::CatchAll(std::string name) {
    ParameterSpec p;
    p.name = std::move(name);
    p.kind = Kind::CatchAll;
    return p;
}

JSONValue FallbackItemsSchema() {
    // No "array" member: an array entry here would itself need items
    JSONValue::Array types;
    for (const char* t : {"boolean", "integer", "number", "string", "object", "null"}) {
        types.push_back(str(t));
    }
    JSONValue::Object o;
    o["type"] = std::make_shared<JSONValue>(std::move(types));
    return JSONValue(std::move(o));
}

JSONValue InferSchema(const TypeDescriptor& type) {
    using Kind = TypeDescriptor::Kind;
    switch (type.kind()) {
        case Kind::Any:
            return JSONValue(JSONValue::Object{});
        case Kind::String:
            return typed("string");
        case Kind::Integer:
            return typed("integer");
        case Kind::Number:
            return typed("number");
        case Kind::Boolean:
            return typed("boolean");
        case Kind::Null:
            return typed("null");
        case Kind::Optional:
            return type.children().empty() ? JSONValue(JSONValue::Object{}) : InferSchema(type.children().front());
        case Kind::Array: {
            JSONValue::Object o;
            o["type"] = str("array");
            if (type.children().size() == 1) {
                JSONValue items = InferSchema(type.children().front());
                if (!isEmptyObject(items)) {
                    o["items"] = std::make_shared<JSONValue>(std::move(items));
                }
            } else if (type.children().size() > 1) {
                JSONValue::Array options = nonEmptySchemas(type.children());
                if (!options.empty()) {
                    JSONValue::Object anyOf;
                    anyOf["anyOf"] = std::make_shared<JSONValue>(std::move(options));
                    o["items"] = std::make_shared<JSONValue>(std::move(anyOf));
                }
            }
            return JSONValue(std::move(o));
        }
        case Kind::Object: {
            JSONValue::Object props;
            const auto& names = type.fieldNames();
            for (std::size_t i = 0; i < names.size() && i < type.children().size(); ++i) {
                props[names[i]] = std::make_shared<JSONValue>(InferSchema(type.children()[i]));
            }
            JSONValue::Object o;
            o["type"] = str("object");
            o["properties"] = std::make_shared<JSONValue>(std::move(props));
            return JSONValue(std::move(o));
        }
        case Kind::Union: {
            std::vector<TypeDescriptor> present;
            for (const auto& alt : type.children()) {
                if (alt.kind() != Kind::Null) present.push_back(alt);
            }
            JSONValue::Array schemas = nonEmptySchemas(present);
            if (schemas.empty()) {
                return JSONValue(JSONValue::Object{});
            }
            if (present.size() == 1) {
                return *schemas.front();
            }
            JSONValue::Object o;
            o["anyOf"] = std::make_shared<JSONValue>(std::move(schemas));
            return JSONValue(std::move(o));
        }
    }
    return JSONValue(JSONValue::Object{});
}

JSONValue NormalizeSchema(const JSONValue& node) {
    if (!node.IsObject()) {
        return untypedObject();
    }
    JSONValue::Object normalized = std::get<JSONValue::Object>(node.value);

    bool hasCombinator = false;
    for (const char* key : {"anyOf", "oneOf", "allOf"}) {
        auto it = normalized.find(key);
        if (it == normalized.end()) continue;
        if (!it->second || !it->second->IsArray()) {
            normalized.erase(it);
            continue;
        }
        JSONValue::Array options;
        for (const auto& option : std::get<JSONValue::Array>(it->second->value)) {
            if (option && option->IsObject()) {
                options.push_back(std::make_shared<JSONValue>(NormalizeSchema(*option)));
            }
        }
        it->second = std::make_shared<JSONValue>(std::move(options));
        hasCombinator = true;
    }

    auto typeIt = normalized.find("type");
    const JSONValue* typeVal = (typeIt != normalized.end() && typeIt->second) ? typeIt->second.get() : nullptr;
    if (typeVal != nullptr && typeVal->IsArray()) {
        if (listContains(std::get<JSONValue::Array>(typeVal->value), "array")) {
            normalizeItems(normalized);
        }
    } else if (typeVal != nullptr && typeVal->IsString()) {
        const std::string& t = std::get<std::string>(typeVal->value);
        if (t == "array") {
            normalizeItems(normalized);
        } else if (t == "object") {
            normalizeProperties(normalized);
        }
    } else if (typeVal != nullptr || !hasCombinator) {
        normalized["type"] = str("object");
        normalizeProperties(normalized);
    }

    auto reqIt = normalized.find("required");
    if (reqIt != normalized.end()) {
        JSONValue::Array names;
        if (reqIt->second && reqIt->second->IsArray()) {
            for (const auto& n : std::get<JSONValue::Array>(reqIt->second->value)) {
                if (n && n->IsString()) names.push_back(n);
            }
        }
        if (names.empty()) {
            normalized.erase(reqIt);
        } else {
            reqIt->second = std::make_shared<JSONValue>(std::move(names));
        }
    }
    return JSONValue(std::move(normalized));
}

JSONValue BuildToolSchema(const Signature& signature) {
    FUNC_SCOPE();
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : signature) {
        if (p.kind != ParameterSpec::Kind::Regular) {
            continue;
        }
        properties[p.name] = std::make_shared<JSONValue>(InferSchema(p.type));
        if (p.IsRequired()) {
            required.push_back(std::make_shared<JSONValue>(p.name));
        }
    }
    JSONValue::Object root;
    root["type"] = str("object");
    root["properties"] = std::make_shared<JSONValue>(std::move(properties));
    if (!required.empty()) {
        root["required"] = std::make_shared<JSONValue>(std::move(required));
    }
    return NormalizeSchema(JSONValue(std::move(root)));
}

} // namespace schema
} // namespace toolhost
