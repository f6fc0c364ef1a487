//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/aiq/json/JsonPath.hpp
// Purpose: Field-path lookup of scalar text values inside parsed JSON documents
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "aiq/errors/Errors.h"
#include "aiq/json/JSONValue.h"

namespace aiq::json {

using JsonPath = std::vector<std::string>;

// Dotted rendering of a path for messages, e.g. "links.token".
std::string JoinPath(const JsonPath& path);

//==========================================================================================================
// ExtractText
// Purpose: Descends object members named by path and returns the terminal scalar as text.
// Notes:
//   - Strings are returned verbatim; integers, doubles and booleans are rendered as text.
//   - A missing member, a non-object intermediate, or a null/object/array terminal all fail with
//     MalformedResponse. An empty path addresses the root itself.
//   - Stateless and reentrant.
//==========================================================================================================
errors::Result<std::string> ExtractText(const JSONValue& root, const JsonPath& path);

//==========================================================================================================
// ExtractTextFromBody
// Purpose: Parses body as JSON then applies ExtractText. Unparsable bodies fail with MalformedResponse.
//==========================================================================================================
errors::Result<std::string> ExtractTextFromBody(const std::string& body, const JsonPath& path);

} // namespace aiq::json
