//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include "toolhost/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace toolhost {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Combine UTF-16 surrogate pairs; lone surrogates become U+FFFD
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                appendUtf8(out, 0xFFFD);
                                code = low;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid number fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid number exponent");
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 keep their magnitude as a double
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
            } else {
                out += fmt::format("{}", v);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            bool first = true;
            for (const auto& item : v) {
                if (!first) out.push_back(',');
                first = false;
                if (item) { serializeInto(out, *item); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { serializeInto(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

bool isRpcId(const JSONValue& v) {
    return std::holds_alternative<std::string>(v.value) || std::holds_alternative<int64_t>(v.value);
}

JSONRPCId idFromJSON(const JSONValue* v) {
    if (v == nullptr) return nullptr;
    if (std::holds_alternative<std::string>(v->value)) return std::get<std::string>(v->value);
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    return nullptr;
}

void putMember(JSONValue::Object& obj, const char* key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Unexpected trailing characters");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

bool JSONEquals(const JSONValue& a, const JSONValue& b) {
    const bool aNum = std::holds_alternative<int64_t>(a.value) || std::holds_alternative<double>(a.value);
    const bool bNum = std::holds_alternative<int64_t>(b.value) || std::holds_alternative<double>(b.value);
    if (aNum && bNum) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        auto asDouble = [](const JSONValue& v) {
            return std::holds_alternative<int64_t>(v.value) ? static_cast<double>(std::get<int64_t>(v.value))
                                                            : std::get<double>(v.value);
        };
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.IsArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t k = 0; k < x.size(); ++k) {
            JSONValue nullValue;
            const JSONValue& l = x[k] ? *x[k] : nullValue;
            const JSONValue& r = y[k] ? *y[k] : nullValue;
            if (!JSONEquals(l, r)) return false;
        }
        return true;
    }
    if (a.IsObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            JSONValue nullValue;
            if (!JSONEquals(val ? *val : nullValue, it->second ? *it->second : nullValue)) return false;
        }
        return true;
    }
    if (a.IsString()) return std::get<std::string>(a.value) == std::get<std::string>(b.value);
    if (std::holds_alternative<bool>(a.value)) return std::get<bool>(a.value) == std::get<bool>(b.value);
    return true; // both null
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    if (!object.IsObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::string IdToString(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return std::get<std::string>(id);
    if (std::holds_alternative<int64_t>(id)) return std::to_string(std::get<int64_t>(id));
    return "null";
}

JSONValue IdToJSON(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return JSONValue(std::get<std::string>(id));
    if (std::holds_alternative<int64_t>(id)) return JSONValue(std::get<int64_t>(id));
    return JSONValue(nullptr);
}

MessageKind ClassifyMessage(const JSONValue& message, bool requireVersion) {
    if (!message.IsObject()) {
        return MessageKind::Invalid;
    }
    if (requireVersion) {
        const JSONValue* version = FindMember(message, "jsonrpc");
        if (version == nullptr || !version->IsString() || std::get<std::string>(version->value) != "2.0") {
            return MessageKind::Invalid;
        }
    }
    const JSONValue* method = FindMember(message, "method");
    const JSONValue* id = FindMember(message, "id");
    if (method != nullptr) {
        if (!method->IsString()) return MessageKind::Invalid;
        const JSONValue* params = FindMember(message, "params");
        if (params != nullptr && !params->IsObject() && !params->IsNull()) return MessageKind::Invalid;
        if (id == nullptr) return MessageKind::Notification;
        return isRpcId(*id) ? MessageKind::Request : MessageKind::Invalid;
    }
    if (id == nullptr) {
        return MessageKind::Invalid;
    }
    const JSONValue* result = FindMember(message, "result");
    const JSONValue* error = FindMember(message, "error");
    if (result != nullptr && error == nullptr && isRpcId(*id)) {
        return MessageKind::Response;
    }
    if (error != nullptr && result == nullptr && (isRpcId(*id) || id->IsNull())) {
        const JSONValue* code = FindMember(*error, "code");
        const JSONValue* msg = FindMember(*error, "message");
        if (code != nullptr && std::holds_alternative<int64_t>(code->value) && msg != nullptr && msg->IsString()) {
            return MessageKind::Error;
        }
    }
    return MessageKind::Invalid;
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCMessage
//----------------------------------------------------------------------------------------------------------
std::string JSONRPCMessage::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    putMember(obj, "jsonrpc", JSONValue(jsonrpc));
    putMember(obj, "id", IdToJSON(id));
    putMember(obj, "method", JSONValue(method));
    if (params.has_value()) {
        putMember(obj, "params", params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    const JSONValue* m = FindMember(value, "method");
    const JSONValue* i = FindMember(value, "id");
    if (m == nullptr || !m->IsString() || i == nullptr) {
        return false;
    }
    method = std::get<std::string>(m->value);
    id = idFromJSON(i);
    const JSONValue* p = FindMember(value, "params");
    if (p != nullptr) { params = *p; } else { params.reset(); }
    return !method.empty();
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    putMember(obj, "jsonrpc", JSONValue(jsonrpc));
    putMember(obj, "id", IdToJSON(id));
    if (error.has_value()) {
        putMember(obj, "error", error.value());
    } else {
        putMember(obj, "result", result.has_value() ? result.value() : JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    if (!value.IsObject()) {
        return false;
    }
    id = idFromJSON(FindMember(value, "id"));
    const JSONValue* r = FindMember(value, "result");
    const JSONValue* e = FindMember(value, "error");
    if (r != nullptr) { result = *r; } else { result.reset(); }
    if (e != nullptr) { error = *e; } else { error.reset(); }
    return result.has_value() != error.has_value();
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    putMember(obj, "jsonrpc", JSONValue(jsonrpc));
    putMember(obj, "method", JSONValue(method));
    if (params.has_value()) {
        putMember(obj, "params", params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    const JSONValue* m = FindMember(value, "method");
    if (m == nullptr || !m->IsString()) {
        return false;
    }
    method = std::get<std::string>(m->value);
    const JSONValue* p = FindMember(value, "params");
    if (p != nullptr) { params = *p; } else { params.reset(); }
    return !method.empty();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(errorObj);
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolhost
