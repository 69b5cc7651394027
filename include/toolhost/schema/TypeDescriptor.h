//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TypeDescriptor.h
// Purpose: Declared parameter types for tools (tagged union) and a parser for textual annotations
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace toolhost {
namespace schema {

//==========================================================================================================
// TypeDescriptor
// Purpose: Small tagged union describing a tool parameter's declared type.
// Kinds:
//   Any       - no usable type information.
//   String, Integer, Number, Boolean, Null - scalars.
//   Array     - children() holds zero (unknown element), one (element) or several (mixed elements) types.
//   Object    - fieldNames()/children() hold named fields; both empty for an untyped mapping.
//   Optional  - children()[0] is the wrapped type; absence is expressed by the parameter default.
//   Union     - children() holds the alternatives.
//==========================================================================================================
class TypeDescriptor {
public:
    enum class Kind {
        Any,
        String,
        Integer,
        Number,
        Boolean,
        Null,
        Array,
        Object,
        Optional,
        Union
    };

    TypeDescriptor() = default;

    static TypeDescriptor Any() { return TypeDescriptor(Kind::Any); }
    static TypeDescriptor String() { return TypeDescriptor(Kind::String); }
    static TypeDescriptor Integer() { return TypeDescriptor(Kind::Integer); }
    static TypeDescriptor Number() { return TypeDescriptor(Kind::Number); }
    static TypeDescriptor Boolean() { return TypeDescriptor(Kind::Boolean); }
    static TypeDescriptor Null() { return TypeDescriptor(Kind::Null); }

    // Array with unknown element type
    static TypeDescriptor Array() { return TypeDescriptor(Kind::Array); }
    static TypeDescriptor ArrayOf(TypeDescriptor element);
    // Sequence whose elements may be any of the given types
    static TypeDescriptor ArrayOfEach(std::vector<TypeDescriptor> elements);

    // Untyped mapping
    static TypeDescriptor Object() { return TypeDescriptor(Kind::Object); }
    static TypeDescriptor ObjectWith(std::vector<std::string> names, std::vector<TypeDescriptor> fields);

    static TypeDescriptor Optional(TypeDescriptor inner);
    static TypeDescriptor Union(std::vector<TypeDescriptor> alternatives);

    Kind kind() const { return kind_; }
    const std::vector<TypeDescriptor>& children() const { return children_; }
    const std::vector<std::string>& fieldNames() const { return fieldNames_; }

    // Readable form for logs, e.g. "Optional[list[string]]"
    std::string ToString() const;

private:
    explicit TypeDescriptor(Kind k) : kind_(k) {}

    Kind kind_{Kind::Any};
    std::vector<TypeDescriptor> children_;
    std::vector<std::string> fieldNames_;
};

//==========================================================================================================
// ParseTypeAnnotation
// Purpose: Parses a textual annotation into a TypeDescriptor.
// Accepted forms (case-insensitive, optional "typing." or other dotted module prefix):
//   str|string, int|integer, float|double|number, bool|boolean, None, Any,
//   list, sequence, list[T], sequence[T], list[A, B], dict, mapping, dict[K, V], mapping[K, V],
//   Optional[T], Union[A, B, ...], A | B | None
// Returns:
//   The parsed descriptor. Unknown names and malformed text yield Any; never throws.
//==========================================================================================================
TypeDescriptor ParseTypeAnnotation(const std::string& text);

} // namespace schema
} // namespace toolhost
