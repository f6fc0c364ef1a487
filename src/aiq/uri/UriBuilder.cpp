//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/aiq/uri/UriBuilder.cpp
// Purpose: URL validation, percent-encoding, and integration supervisor action URI construction
//==========================================================================================================

#include "aiq/uri/UriBuilder.hpp"

#include <cctype>
#include <sstream>

#include "logging/Logger.h"

namespace aiq::uri {

using errors::ErrorCategory;
using errors::Result;

static const char* kIntegrationPrefix = "integration/";

static bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

static int hexValue(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

static std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

static std::string percentEncode(const std::string& s, bool spaceAsPlus) {
    std::ostringstream oss;
    const char* hex = "0123456789ABCDEF";
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (isUnreserved(c)) {
            oss << static_cast<char>(c);
        } else if (c == ' ' && spaceAsPlus) {
            oss << '+';
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

// Escapes must be %XX; characters outside the RFC 3986 set are rejected.
static bool validComponent(const std::string& s, std::string& errorOut) {
    static const std::string kAllowed = "-._~!$&'()*+,;=:@/?";
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '%') {
            if (i + 2 >= s.size()) {
                errorOut = "truncated percent-escape";
                return false;
            }
            if (hexValue(s[i + 1]) < 0 || hexValue(s[i + 2]) < 0) {
                errorOut = "invalid percent-escape";
                return false;
            }
            i += 2;
            continue;
        }
        if (std::isalnum(c) || kAllowed.find(static_cast<char>(c)) != std::string::npos) {
            continue;
        }
        errorOut = std::string("illegal character '") + static_cast<char>(c) + std::string("'");
        return false;
    }
    return true;
}

static bool validHost(const std::string& host, bool ipv6) {
    if (host.empty()) {
        return false;
    }
    for (char ch : host) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (ipv6) {
            if (!(std::isxdigit(c) || c == ':' || c == '.')) {
                return false;
            }
        } else if (!(std::isalnum(c) || c == '-' || c == '.' || c == '_')) {
            return false;
        }
    }
    return true;
}

bool IsBlank(const std::string& s) {
    for (char ch : s) {
        if (static_cast<unsigned char>(ch) > 0x20) {
            return false;
        }
    }
    return true;
}

bool ParseAbsoluteUrl(const std::string& url, UrlParts& out, std::string& errorOut) {
    out = UrlParts{};
    for (char ch : url) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7F) {
            errorOut = "URL contains whitespace or control characters";
            return false;
        }
    }

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        errorOut = "URL is not absolute";
        return false;
    }
    out.scheme = toLower(url.substr(0, schemeEnd));
    if (out.scheme != std::string("http") && out.scheme != std::string("https")) {
        errorOut = std::string("unsupported scheme '") + out.scheme + std::string("'");
        return false;
    }

    std::size_t pos = schemeEnd + 3;
    std::size_t authEnd = url.find_first_of("/?#", pos);
    if (authEnd == std::string::npos) {
        authEnd = url.size();
    }
    std::string hostPort = url.substr(pos, authEnd - pos);
    if (hostPort.find('@') != std::string::npos) {
        errorOut = "URL must not carry user information";
        return false;
    }

    std::string portStr;
    bool ipv6 = false;
    if (!hostPort.empty() && hostPort[0] == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            errorOut = "unterminated IPv6 literal";
            return false;
        }
        ipv6 = true;
        out.host = hostPort.substr(1, close - 1);
        std::string rest = hostPort.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                errorOut = "malformed authority";
                return false;
            }
            portStr = rest.substr(1);
            if (portStr.empty()) {
                errorOut = "empty port";
                return false;
            }
        }
    } else {
        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            out.host = hostPort;
        } else {
            out.host = hostPort.substr(0, colon);
            portStr = hostPort.substr(colon + 1);
            if (portStr.empty()) {
                errorOut = "empty port";
                return false;
            }
        }
    }
    if (!validHost(out.host, ipv6)) {
        errorOut = "missing or invalid host";
        return false;
    }

    if (portStr.empty()) {
        out.port = (out.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        if (portStr.size() > 5 || portStr.find_first_not_of("0123456789") != std::string::npos) {
            errorOut = "invalid port";
            return false;
        }
        unsigned long p = std::stoul(portStr);
        if (p == 0 || p > 65535) {
            errorOut = "port out of range";
            return false;
        }
        out.port = portStr;
    }

    std::string rest = url.substr(authEnd);
    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        out.hasFragment = true;
        rest = rest.substr(0, hash);
    }
    std::size_t qmark = rest.find('?');
    if (qmark != std::string::npos) {
        out.hasQuery = true;
        out.query = rest.substr(qmark + 1);
        rest = rest.substr(0, qmark);
    }
    out.path = rest.empty() ? std::string("/") : rest;

    if (!validComponent(out.path, errorOut) || !validComponent(out.query, errorOut)) {
        return false;
    }

    out.target = out.path;
    if (out.hasQuery) {
        out.target += std::string("?") + out.query;
    }
    out.serverName = out.host;
    return true;
}

std::string PercentEncodePathSegment(const std::string& s) {
    return percentEncode(s, false);
}

std::string UrlEncodeForm(const std::string& s) {
    return percentEncode(s, true);
}

bool PercentDecode(const std::string& s, bool plusAsSpace, std::string& out) {
    out.clear();
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) {
                return false;
            }
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return true;
}

Result<std::string> BuildActionUri(const std::string& baseUrl,
                                   const std::string& orgName,
                                   const std::string& action,
                                   const std::vector<QueryParam>& params) {
    if (IsBlank(baseUrl)) {
        return Result<std::string>::Fail(errors::InvalidInput("URL"));
    }
    if (IsBlank(orgName)) {
        return Result<std::string>::Fail(errors::InvalidInput("organization"));
    }
    if (IsBlank(action)) {
        return Result<std::string>::Fail(errors::InvalidInput("action"));
    }

    UrlParts parts;
    std::string err;
    if (!ParseAbsoluteUrl(baseUrl, parts, err)) {
        return Result<std::string>::Fail(ErrorCategory::InvalidInput, std::string("Invalid URL: ") + err);
    }
    if (parts.hasQuery || parts.hasFragment) {
        return Result<std::string>::Fail(ErrorCategory::InvalidInput,
            std::string("Invalid URL: base URL must not carry a query or fragment"));
    }

    std::string uri = baseUrl;
    while (!uri.empty() && uri.back() == '/') {
        uri.pop_back();
    }
    uri += std::string("/") + kIntegrationPrefix;
    uri += PercentEncodePathSegment(orgName);
    uri.push_back('/');
    uri += PercentEncodePathSegment(action);

    for (std::size_t k = 0; k < params.size(); ++k) {
        uri.push_back(k == 0 ? '?' : '&');
        uri += UrlEncodeForm(params[k].name);
        uri.push_back('=');
        uri += UrlEncodeForm(params[k].value);
    }

    LOG_DEBUG("Built action URI {}", uri);
    return Result<std::string>::Ok(std::move(uri));
}

Result<std::string> BuildDiscoveryUrl(const std::string& baseUrl, const std::string& orgName) {
    if (IsBlank(baseUrl)) {
        return Result<std::string>::Fail(errors::InvalidInput("URL"));
    }
    if (IsBlank(orgName)) {
        return Result<std::string>::Fail(errors::InvalidInput("organization"));
    }
    UrlParts parts;
    std::string err;
    if (!ParseAbsoluteUrl(baseUrl, parts, err)) {
        return Result<std::string>::Fail(ErrorCategory::InvalidInput, std::string("Invalid URL: ") + err);
    }
    if (parts.hasFragment) {
        return Result<std::string>::Fail(ErrorCategory::InvalidInput,
            std::string("Invalid URL: base URL must not carry a fragment"));
    }
    std::string url = baseUrl;
    url += parts.hasQuery ? std::string("&") : std::string("?");
    url += std::string("orgName=") + UrlEncodeForm(orgName);
    return Result<std::string>::Ok(std::move(url));
}

} // namespace aiq::uri
