//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/aiq/uri/UriBuilder.hpp
// Purpose: URL validation, percent-encoding, and integration supervisor action URI construction
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "aiq/errors/Errors.h"

namespace aiq::uri {

//==========================================================================================================
// UrlParts
// Purpose: Components of an absolute http(s) URL.
// Fields:
//   scheme: "http" or "https" (lower-case)
//   host: Host name or IP literal (IPv6 without brackets)
//   port: Explicit port, or "80"/"443" from the scheme
//   path: Path component, "/" when absent
//   query: Query without the leading '?'
//   target: Request target sent on the wire (path plus "?query" when present)
//   serverName: TLS SNI and Host header name
//   hasQuery/hasFragment: Whether '?' / '#' appeared in the URL
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string target;
    std::string serverName;
    bool hasQuery{false};
    bool hasFragment{false};
};

// A query parameter; lists of these keep caller order and may repeat names.
struct QueryParam {
    std::string name;
    std::string value;
};

// True when s is empty or consists only of whitespace/control characters (<= 0x20).
bool IsBlank(const std::string& s);

//==========================================================================================================
// ParseAbsoluteUrl
// Purpose: Validates and splits an absolute http/https URL.
// Args:
//   url: Candidate URL.
//   out: Filled on success.
//   errorOut: Short reason on failure.
// Returns:
//   true when url is well-formed: known scheme, non-empty host, numeric port in 1..65535, no whitespace
//   or control characters, no userinfo, valid percent-escapes.
//==========================================================================================================
bool ParseAbsoluteUrl(const std::string& url, UrlParts& out, std::string& errorOut);

// RFC 3986 path segment encoding: unreserved characters kept, every other byte as %XX.
std::string PercentEncodePathSegment(const std::string& s);

// application/x-www-form-urlencoded encoding: unreserved characters kept, space as '+', others %XX.
std::string UrlEncodeForm(const std::string& s);

//==========================================================================================================
// PercentDecode
// Purpose: Decodes %XX escapes (and '+' as space when plusAsSpace). Returns false on a truncated or
//          non-hex escape.
//==========================================================================================================
bool PercentDecode(const std::string& s, bool plusAsSpace, std::string& out);

//==========================================================================================================
// BuildActionUri
// Purpose: Builds <base>/integration/<org>/<action>[?name=value&...] for the integration supervisor.
// Args:
//   baseUrl: Supervisor base URL; a trailing '/' is tolerated. Must not carry a query or fragment.
//   orgName: Organization name, must not be blank.
//   action: Action name, must not be blank.
//   params: Query parameters appended in the given order; may be empty.
// Returns:
//   The absolute URI, or InvalidInput.
//==========================================================================================================
errors::Result<std::string> BuildActionUri(const std::string& baseUrl,
                                           const std::string& orgName,
                                           const std::string& action,
                                           const std::vector<QueryParam>& params = {});

//==========================================================================================================
// BuildDiscoveryUrl
// Purpose: Builds the token discovery URL <base>?orgName=<org>. Appends with '&' when baseUrl already
//          carries a query. Fails with InvalidInput on a blank org or an invalid base URL.
//==========================================================================================================
errors::Result<std::string> BuildDiscoveryUrl(const std::string& baseUrl, const std::string& orgName);

} // namespace aiq::uri
