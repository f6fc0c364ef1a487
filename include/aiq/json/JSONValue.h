//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: In-memory JSON document model and strict parser for service response bodies
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace aiq::json {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON text (RFC 8259) into out. Trailing non-whitespace is an error.
// Args:
//   text: Document text.
//   out: Receives the parsed value on success; untouched on failure.
//   errorOut: Receives a short reason on failure.
// Returns:
//   true on success.
//==========================================================================================================
bool ParseJSON(const std::string& text, JSONValue& out, std::string& errorOut);

} // namespace aiq::json
