//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/aiq/auth/IntegrationAuthClient.hpp
// Purpose: Token discovery and password-grant exchange against the integration supervisor
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>

#include "aiq/errors/Errors.h"
#include "aiq/http/HttpExecutor.hpp"
#include "aiq/json/JsonPath.hpp"

namespace aiq::auth {

// Username/password pair for one authentication attempt. Never logged.
struct Credentials {
    std::string username;
    std::string password;
};

//==========================================================================================================
// IntegrationAuthClient
// Purpose: Runs Discovery (GET <base>?orgName=..., read links.token) then Exchange (POST password grant to
//          the discovered URL, read access_token). One attempt per call: no retries and no caching.
// Notes:
//   - Holds only a shared, immutable executor; concurrent calls are safe when the executor is.
//   - Parameter validation happens before any request is issued.
//==========================================================================================================
class IntegrationAuthClient {
public:
    // Uses a BeastHttpExecutor configured from the environment.
    IntegrationAuthClient();
    explicit IntegrationAuthClient(std::shared_ptr<const http::IHttpExecutor> executor);

    //======================================================================================================
    // FetchAccessToken
    // Purpose: Authenticates username within orgName at baseUrl and returns the access token.
    // Returns:
    //   Non-empty token, or InvalidInput / TransportFailure / AuthenticationRejected / MalformedResponse.
    //======================================================================================================
    errors::Result<std::string> FetchAccessToken(const std::string& baseUrl,
                                                 const std::string& username,
                                                 const std::string& password,
                                                 const std::string& orgName) const;

    //======================================================================================================
    // AddAuthenticationHeader
    // Purpose: Fetches a token and sets "Authorization: BEARER <token>" on request. On failure the request is
    //          left unchanged and the error is returned.
    //======================================================================================================
    template <class Body, class Fields>
    std::optional<errors::AuthError> AddAuthenticationHeader(boost::beast::http::request<Body, Fields>& request,
                                                             const std::string& baseUrl,
                                                             const std::string& username,
                                                             const std::string& password,
                                                             const std::string& orgName) const {
        auto token = FetchAccessToken(baseUrl, username, password, orgName);
        if (token.IsError()) {
            return token.Error();
        }
        request.set(boost::beast::http::field::authorization, BearerHeaderValue(token.Value()));
        return std::nullopt;
    }

    // Discovery step: returns the absolute token URL advertised at links.token.
    errors::Result<std::string> DiscoverTokenUrl(const std::string& baseUrl, const std::string& orgName) const;

    // Exchange step: posts the password grant to tokenUrl and returns the non-empty access_token.
    errors::Result<std::string> ExchangeCredentials(const std::string& tokenUrl, const Credentials& credentials) const;

    // Form body "grant_type=password&scope=integration&username=<u>&password=<p>" (form-encoded values).
    static std::string BuildPasswordGrantForm(const Credentials& credentials);

    // "BEARER <token>"
    static std::string BearerHeaderValue(const std::string& token);

private:
    // Shared response routine: 200 -> extract path from the JSON body, otherwise classify.
    errors::Result<std::string> ReadResponseValue(const http::HttpRequest& request, const json::JsonPath& path) const;

    std::shared_ptr<const http::IHttpExecutor> executor;
};

//==========================================================================================================
// Free-function conveniences backed by a default IntegrationAuthClient.
//==========================================================================================================
errors::Result<std::string> FetchAccessToken(const std::string& baseUrl,
                                             const std::string& username,
                                             const std::string& password,
                                             const std::string& orgName);

template <class Body, class Fields>
std::optional<errors::AuthError> AddAuthenticationHeader(boost::beast::http::request<Body, Fields>& request,
                                                         const std::string& baseUrl,
                                                         const std::string& username,
                                                         const std::string& password,
                                                         const std::string& orgName) {
    IntegrationAuthClient client;
    return client.AddAuthenticationHeader(request, baseUrl, username, password, orgName);
}

} // namespace aiq::auth
