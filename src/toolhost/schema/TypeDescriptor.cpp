//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TypeDescriptor.cpp
// Purpose: TypeDescriptor factories and the textual annotation parser
//==========================================================================================================

#include "toolhost/schema/TypeDescriptor.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include "logging/Logger.h"

namespace toolhost {
namespace schema {

TypeDescriptor TypeDescriptor::ArrayOf(TypeDescriptor element) {
    TypeDescriptor t(Kind::Array);
    t.children_.push_back(std::move(element));
    return t;
}

TypeDescriptor TypeDescriptor::ArrayOfEach(std::vector<TypeDescriptor> elements) {
    TypeDescriptor t(Kind::Array);
    t.children_ = std::move(elements);
    return t;
}

TypeDescriptor TypeDescriptor::ObjectWith(std::vector<std::string> names, std::vector<TypeDescriptor> fields) {
    TypeDescriptor t(Kind::Object);
    // Extra names or extra types are ignored
    const std::size_t n = std::min(names.size(), fields.size());
    names.resize(n);
    fields.resize(n);
    t.fieldNames_ = std::move(names);
    t.children_ = std::move(fields);
    return t;
}

TypeDescriptor TypeDescriptor::Optional(TypeDescriptor inner) {
    TypeDescriptor t(Kind::Optional);
    t.children_.push_back(std::move(inner));
    return t;
}

TypeDescriptor TypeDescriptor::Union(std::vector<TypeDescriptor> alternatives) {
    TypeDescriptor t(Kind::Union);
    t.children_ = std::move(alternatives);
    return t;
}

std::string TypeDescriptor::ToString() const {
    auto joinChildren = [this]() {
        std::string out;
        for (std::size_t i = 0; i < children_.size(); ++i) {
            if (i > 0) out += ", ";
            if (i < fieldNames_.size()) out += fieldNames_[i] + ": ";
            out += children_[i].ToString();
        }
        return out;
    };
    switch (kind_) {
        case Kind::Any: return "Any";
        case Kind::String: return "string";
        case Kind::Integer: return "integer";
        case Kind::Number: return "number";
        case Kind::Boolean: return "boolean";
        case Kind::Null: return "None";
        case Kind::Array: return children_.empty() ? "list" : "list[" + joinChildren() + "]";
        case Kind::Object: return children_.empty() ? "dict" : "object{" + joinChildren() + "}";
        case Kind::Optional: return "Optional[" + joinChildren() + "]";
        case Kind::Union: return "Union[" + joinChildren() + "]";
    }
    return "Any";
}

namespace {

//==========================================================================================================
// AnnotationParser
// Purpose: Recursive-descent parser over the annotation grammar:
//   union := term ('|' term)*
//   term  := name ('[' union (',' union)* ']')?
// Failures are reported through std::nullopt so the caller can degrade to Any.
//==========================================================================================================
struct AnnotationParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit AnnotationParser(const std::string& text) : s(text) {}

    void skipWs() {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    std::string parseName() {
        skipWs();
        std::size_t start = i;
        while (i < s.size()) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            if (std::isalnum(c) || c == '_' || c == '.') { ++i; } else { break; }
        }
        std::string name = s.substr(start, i - start);
        // Drop module qualifiers such as "typing." or "collections.abc."
        auto dot = name.rfind('.');
        if (dot != std::string::npos) name = name.substr(dot + 1);
        for (auto& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return name;
    }

    std::optional<TypeDescriptor> parseUnion() {
        if (++depth > 32) return std::nullopt;
        std::vector<TypeDescriptor> alternatives;
        auto first = parseTerm();
        if (!first) return std::nullopt;
        alternatives.push_back(std::move(*first));
        while (match('|')) {
            auto next = parseTerm();
            if (!next) return std::nullopt;
            alternatives.push_back(std::move(*next));
        }
        --depth;
        if (alternatives.size() == 1) return std::move(alternatives.front());
        return TypeDescriptor::Union(std::move(alternatives));
    }

    std::optional<TypeDescriptor> parseTerm() {
        std::string name = parseName();
        if (name.empty()) return std::nullopt;
        std::vector<TypeDescriptor> args;
        bool hasArgs = false;
        if (match('[')) {
            hasArgs = true;
            if (!match(']')) {
                do {
                    auto arg = parseUnion();
                    if (!arg) return std::nullopt;
                    args.push_back(std::move(*arg));
                } while (match(','));
                if (!match(']')) return std::nullopt;
            }
        }
        return build(name, hasArgs, std::move(args));
    }

    static TypeDescriptor build(const std::string& name, bool hasArgs, std::vector<TypeDescriptor> args) {
        if (name == "str" || name == "string") return TypeDescriptor::String();
        if (name == "int" || name == "integer") return TypeDescriptor::Integer();
        if (name == "float" || name == "double" || name == "number") return TypeDescriptor::Number();
        if (name == "bool" || name == "boolean") return TypeDescriptor::Boolean();
        if (name == "none" || name == "nonetype") return TypeDescriptor::Null();
        if (name == "list" || name == "sequence") {
            if (!hasArgs || args.empty()) return TypeDescriptor::Array();
            if (args.size() == 1) return TypeDescriptor::ArrayOf(std::move(args.front()));
            return TypeDescriptor::ArrayOfEach(std::move(args));
        }
        if (name == "dict" || name == "mapping") return TypeDescriptor::Object();
        if (name == "optional") {
            if (args.size() != 1) return TypeDescriptor::Any();
            return TypeDescriptor::Optional(std::move(args.front()));
        }
        if (name == "union") {
            if (args.empty()) return TypeDescriptor::Any();
            return TypeDescriptor::Union(std::move(args));
        }
        return TypeDescriptor::Any();
    }
};

} // namespace

TypeDescriptor ParseTypeAnnotation(const std::string& text) {
    AnnotationParser parser(text);
    auto parsed = parser.parseUnion();
    parser.skipWs();
    if (!parsed || parser.i != text.size()) {
        LOG_DEBUG("Unresolvable type annotation '{}'; using untyped schema", text);
        return TypeDescriptor::Any();
    }
    return std::move(*parsed);
}

} // namespace schema
} // namespace toolhost
