//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "websearch/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace websearch {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
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

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!lhs[i] || !rhs[i]) { if (lhs[i] != rhs[i]) return false; continue; }
                if (*lhs[i] != *rhs[i]) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) return false;
            auto itL = lhs.begin();
            auto itR = rhs.begin();
            for (; itL != lhs.end(); ++itL, ++itR) {
                if (itL->first != itR->first) return false;
                if (!itL->second || !itR->second) { if (itL->second != itR->second) return false; continue; }
                if (*itL->second != *itR->second) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int MaxNestingDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("JSON parse error at offset {}: {}", i, what));
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
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
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
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
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
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double like most JSON libraries
                isFloat = true;
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            fail("invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            fail("invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            fail("invalid literal");
        }
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

std::optional<JSONRPCId> idFromJSONValue(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (std::holds_alternative<std::string>(v.value)) return JSONRPCId{std::get<std::string>(v.value)};
    if (std::holds_alternative<std::nullptr_t>(v.value)) return JSONRPCId{nullptr};
    return std::nullopt;
}

bool hasValidVersion(const JSONValue& obj) {
    auto version = getStringMember(obj, "jsonrpc");
    return version.has_value() && version.value() == "2.0";
}
} // namespace

JSONValue parseJSONValue(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    std::string out;
    serializeInto(out, value);
    return out;
}

void setMember(JSONValue::Object& obj, const std::string& key, JSONValue value) {
    obj[key] = std::make_shared<JSONValue>(std::move(value));
}

std::optional<std::string> getStringMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> getIntegerMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr) return std::nullopt;
    if (v->isInteger()) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) {
        // Accept integral doubles such as 5.0
        double d = std::get<double>(v->value);
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::optional<bool> getBoolMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr || !std::holds_alternative<bool>(v->value)) return std::nullopt;
    return std::get<bool>(v->value);
}

std::string idToString(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { out = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { out = std::to_string(v); }
        else { out = "null"; }
    }, id);
    return out;
}

JSONValue idToJSONValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) { return JSONValue(nullptr); }
        else { return JSONValue(v); }
    }, id);
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return Deserialize(parseJSONValue(json));
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSONValue() const {
    JSONValue::Object obj;
    setMember(obj, "jsonrpc", JSONValue(jsonrpc));
    setMember(obj, "id", idToJSONValue(id));
    setMember(obj, "method", JSONValue(method));
    if (params.has_value()) {
        setMember(obj, "params", params.value());
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    return serializeJSONValue(ToJSONValue());
}

bool JSONRPCRequest::Deserialize(const JSONValue& value) {
    FUNC_SCOPE();
    if (!value.isObject() || !hasValidVersion(value)) return false;
    auto m = getStringMember(value, "method");
    const JSONValue* idVal = value.find("id");
    if (!m.has_value() || m->empty() || idVal == nullptr) return false;
    auto parsedId = idFromJSONValue(*idVal);
    if (!parsedId.has_value()) return false;
    id = std::move(parsedId.value());
    method = std::move(m.value());
    const JSONValue* p = value.find("params");
    if (p != nullptr) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSONValue() const {
    JSONValue::Object obj;
    setMember(obj, "jsonrpc", JSONValue(jsonrpc));
    setMember(obj, "id", idToJSONValue(id));
    if (error.has_value()) {
        setMember(obj, "error", error.value());
    } else {
        setMember(obj, "result", result.has_value() ? result.value() : JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    return serializeJSONValue(ToJSONValue());
}

bool JSONRPCResponse::Deserialize(const JSONValue& value) {
    FUNC_SCOPE();
    if (!value.isObject() || !hasValidVersion(value)) return false;
    const JSONValue* idVal = value.find("id");
    if (idVal == nullptr) return false;
    auto parsedId = idFromJSONValue(*idVal);
    if (!parsedId.has_value()) return false;
    const JSONValue* r = value.find("result");
    const JSONValue* e = value.find("error");
    // Exactly one of result / error
    if ((r == nullptr) == (e == nullptr)) return false;
    if (e != nullptr && !e->isObject()) return false;
    id = std::move(parsedId.value());
    result.reset();
    error.reset();
    if (r != nullptr) result = *r;
    if (e != nullptr) error = *e;
    return true;
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSONValue() const {
    JSONValue::Object obj;
    setMember(obj, "jsonrpc", JSONValue(jsonrpc));
    setMember(obj, "method", JSONValue(method));
    if (params.has_value()) {
        setMember(obj, "params", params.value());
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    return serializeJSONValue(ToJSONValue());
}

bool JSONRPCNotification::Deserialize(const JSONValue& value) {
    FUNC_SCOPE();
    if (!value.isObject() || !hasValidVersion(value)) return false;
    if (value.find("id") != nullptr) return false;
    auto m = getStringMember(value, "method");
    if (!m.has_value() || m->empty()) return false;
    method = std::move(m.value());
    const JSONValue* p = value.find("params");
    if (p != nullptr) {
        params = *p;
    } else {
        params.reset();
    }
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    setMember(errorObj, "code", JSONValue(static_cast<int64_t>(code)));
    setMember(errorObj, "message", JSONValue(message));
    if (data.has_value()) {
        setMember(errorObj, "data", data.value());
    }
    return JSONValue(std::move(errorObj));
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

} // namespace websearch
