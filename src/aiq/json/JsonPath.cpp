//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/aiq/json/JsonPath.cpp
// Purpose: Field-path lookup of scalar text values inside parsed JSON documents
//==========================================================================================================

#include "aiq/json/JsonPath.hpp"

#include <sstream>
#include <type_traits>

namespace aiq::json {

using errors::ErrorCategory;
using errors::Result;

std::string JoinPath(const JsonPath& path) {
    std::string out;
    for (std::size_t k = 0; k < path.size(); ++k) {
        if (k > 0) {
            out.push_back('.');
        }
        out += path[k];
    }
    return out;
}

static std::string doubleToText(double d) {
    std::ostringstream oss;
    oss.precision(17);
    oss << d;
    return oss.str();
}

Result<std::string> ExtractText(const JSONValue& root, const JsonPath& path) {
    const JSONValue* node = &root;
    for (const auto& field : path) {
        if (!node->IsObject()) {
            return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
                std::string("Field not found in the response: ") + JoinPath(path));
        }
        const auto& obj = std::get<JSONValue::Object>(node->value);
        auto it = obj.find(field);
        if (it == obj.end() || !it->second) {
            return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
                std::string("Field not found in the response: ") + JoinPath(path));
        }
        node = it->second.get();
    }

    std::optional<std::string> text = std::visit([](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return doubleToText(v);
        } else {
            return std::nullopt;
        }
    }, node->get());

    if (!text.has_value()) {
        return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
            std::string("Field is not a text value in the response: ") + JoinPath(path));
    }
    return Result<std::string>::Ok(std::move(*text));
}

Result<std::string> ExtractTextFromBody(const std::string& body, const JsonPath& path) {
    JSONValue doc;
    std::string err;
    if (!ParseJSON(body, doc, err)) {
        return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
            std::string("Response is not valid JSON: ") + err);
    }
    return ExtractText(doc, path);
}

} // namespace aiq::json
