//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/aiq/auth/IntegrationAuthClient.cpp
// Purpose: Token discovery and password-grant exchange against the integration supervisor
//==========================================================================================================

#include "aiq/auth/IntegrationAuthClient.hpp"

#include <cctype>
#include <sstream>
#include <utility>

#include "aiq/errors/ErrorClassifier.hpp"
#include "aiq/uri/UriBuilder.hpp"
#include "logging/Logger.h"

namespace aiq::auth {

using errors::ErrorCategory;
using errors::Result;

static const char* kAccessTokenField = "access_token";
static const char* kFormContentType = "application/x-www-form-urlencoded";

// RFC 6750 b64token: 1*( ALPHA / DIGIT / "-" / "." / "_" / "~" / "+" / "/" ) *"="
static bool isBearerToken(const std::string& token) {
    std::size_t i = 0;
    while (i < token.size()) {
        const unsigned char c = static_cast<unsigned char>(token[i]);
        if (!(std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '+' || c == '/')) {
            break;
        }
        ++i;
    }
    if (i == 0) {
        return false;
    }
    while (i < token.size() && token[i] == '=') {
        ++i;
    }
    return i == token.size();
}

IntegrationAuthClient::IntegrationAuthClient()
    : executor(std::make_shared<http::BeastHttpExecutor>()) {}

IntegrationAuthClient::IntegrationAuthClient(std::shared_ptr<const http::IHttpExecutor> executor)
    : executor(std::move(executor)) {}

std::string IntegrationAuthClient::BuildPasswordGrantForm(const Credentials& credentials) {
    std::ostringstream form;
    form << "grant_type=password";
    form << "&scope=integration";
    form << "&username=" << uri::UrlEncodeForm(credentials.username);
    form << "&password=" << uri::UrlEncodeForm(credentials.password);
    return form.str();
}

std::string IntegrationAuthClient::BearerHeaderValue(const std::string& token) {
    return std::string("BEARER ") + token;
}

Result<std::string> IntegrationAuthClient::ReadResponseValue(const http::HttpRequest& request,
                                                             const json::JsonPath& path) const {
    if (!executor) {
        return Result<std::string>::Fail(errors::ClassifyTransportFailure("no HTTP executor configured"));
    }
    auto response = executor->Execute(request);
    if (response.IsError()) {
        return Result<std::string>::Fail(response.Error());
    }
    const http::HttpResponse& res = response.Value();
    if (auto failure = errors::ClassifyHttpFailure(res.status, res.reason, res.body)) {
        return Result<std::string>::Fail(std::move(*failure));
    }
    return json::ExtractTextFromBody(res.body, path);
}

Result<std::string> IntegrationAuthClient::DiscoverTokenUrl(const std::string& baseUrl, const std::string& orgName) const {
    FUNC_SCOPE();
    auto discoveryUrl = uri::BuildDiscoveryUrl(baseUrl, orgName);
    if (discoveryUrl.IsError()) {
        return discoveryUrl;
    }

    http::HttpRequest request;
    request.method = http::Method::Get;
    request.url = discoveryUrl.Value();

    auto tokenUrl = ReadResponseValue(request, {"links", "token"});
    if (tokenUrl.IsError()) {
        return tokenUrl;
    }

    uri::UrlParts parts;
    std::string err;
    if (tokenUrl.Value().empty() || !uri::ParseAbsoluteUrl(tokenUrl.Value(), parts, err)) {
        return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
            std::string("Token link is not an absolute URL: [") + tokenUrl.Value() + std::string("]"));
    }
    LOG_DEBUG("Discovered token endpoint {}", tokenUrl.Value());
    return tokenUrl;
}

Result<std::string> IntegrationAuthClient::ExchangeCredentials(const std::string& tokenUrl,
                                                               const Credentials& credentials) const {
    FUNC_SCOPE();
    if (uri::IsBlank(credentials.username)) {
        return Result<std::string>::Fail(errors::InvalidInput("username"));
    }
    if (uri::IsBlank(credentials.password)) {
        return Result<std::string>::Fail(errors::InvalidInput("password"));
    }
    uri::UrlParts parts;
    std::string err;
    if (!uri::ParseAbsoluteUrl(tokenUrl, parts, err)) {
        return Result<std::string>::Fail(ErrorCategory::InvalidInput, std::string("Invalid token URL: ") + err);
    }

    http::HttpRequest request;
    request.method = http::Method::Post;
    request.url = tokenUrl;
    request.headers.push_back(http::HeaderKV{"Content-Type", kFormContentType});
    request.body = BuildPasswordGrantForm(credentials);

    auto token = ReadResponseValue(request, {kAccessTokenField});
    if (token.IsError()) {
        return token;
    }
    if (token.Value().empty()) {
        return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
            std::string("Empty access token in the response"));
    }
    if (!isBearerToken(token.Value())) {
        // Never echo the value: it is a credential and may carry CR/LF
        return Result<std::string>::Fail(ErrorCategory::MalformedResponse,
            std::string("Access token in the response is not a valid bearer token"));
    }
    return token;
}

Result<std::string> IntegrationAuthClient::FetchAccessToken(const std::string& baseUrl,
                                                            const std::string& username,
                                                            const std::string& password,
                                                            const std::string& orgName) const {
    FUNC_SCOPE();
    if (uri::IsBlank(baseUrl)) {
        return Result<std::string>::Fail(errors::InvalidInput("URL"));
    }
    if (uri::IsBlank(username)) {
        return Result<std::string>::Fail(errors::InvalidInput("username"));
    }
    if (uri::IsBlank(password)) {
        return Result<std::string>::Fail(errors::InvalidInput("password"));
    }
    if (uri::IsBlank(orgName)) {
        return Result<std::string>::Fail(errors::InvalidInput("organization"));
    }

    // Discovery -> Exchange; the token URL is the only state carried between them
    auto tokenUrl = DiscoverTokenUrl(baseUrl, orgName);
    if (tokenUrl.IsError()) {
        return tokenUrl;
    }

    LOG_DEBUG("Authenticating user [{}] in org [{}]", username, orgName);
    return ExchangeCredentials(tokenUrl.Value(), Credentials{username, password});
}

Result<std::string> FetchAccessToken(const std::string& baseUrl,
                                     const std::string& username,
                                     const std::string& password,
                                     const std::string& orgName) {
    IntegrationAuthClient client;
    return client.FetchAccessToken(baseUrl, username, password, orgName);
}

} // namespace aiq::auth
