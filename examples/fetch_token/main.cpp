//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line caller that obtains an integration access token or prints an action URI
//==========================================================================================================

#include "logging/Logger.h"
#include "aiq/auth/IntegrationAuthClient.hpp"
#include "aiq/http/HttpExecutor.hpp"
#include "aiq/uri/UriBuilder.hpp"
#include "aiq/version.h"
#include "env/EnvVars.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace aiq;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--url")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

// All --param=name=value options, in command-line order.
static std::vector<uri::QueryParam> getQueryParams(int argc, char** argv) {
    std::vector<uri::QueryParam> params;
    const std::string prefix = "--param=";
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        if (a.rfind(prefix, 0) != 0) {
            continue;
        }
        std::string nv = a.substr(prefix.size());
        auto eq = nv.find('=');
        if (eq == std::string::npos) {
            params.push_back(uri::QueryParam{nv, std::string()});
        } else {
            params.push_back(uri::QueryParam{nv.substr(0, eq), nv.substr(eq + 1)});
        }
    }
    return params;
}

static int exitCodeFor(errors::ErrorCategory category) {
    switch (category) {
        case errors::ErrorCategory::InvalidInput: return 2;
        case errors::ErrorCategory::TransportFailure: return 3;
        case errors::ErrorCategory::AuthenticationRejected: return 4;
        case errors::ErrorCategory::MalformedResponse: return 5;
    }
    return 1;
}

static void printUsage() {
    std::cerr << "aiq_fetch_token " << getVersionString() << "\n"
              << "Usage:\n"
              << "  aiq_fetch_token --url=<token base URL> --org=<org> --user=<user> [--password=<pw>] [--httpcfg=<k=v;...>]\n"
              << "  aiq_fetch_token --url=<supervisor base URL> --org=<org> --action=<action> [--param=<name>=<value> ...]\n"
              << "The password is read from AIQ_PASSWORD when --password is not given.\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();

    const auto url = getArgValue(argc, argv, "--url");
    const auto org = getArgValue(argc, argv, "--org");
    if (!url.has_value() || !org.has_value()) {
        printUsage();
        return 2;
    }

    if (auto action = getArgValue(argc, argv, "--action"); action.has_value()) {
        auto uriResult = uri::BuildActionUri(*url, *org, *action, getQueryParams(argc, argv));
        if (uriResult.IsError()) {
            LOG_ERROR("{}", errors::Describe(uriResult.Error()));
            return exitCodeFor(uriResult.Error().category);
        }
        std::cout << uriResult.Value() << std::endl;
        return 0;
    }

    const std::string user = getArgValue(argc, argv, "--user").value_or(std::string());
    const std::string password = getArgValue(argc, argv, "--password").value_or(GetEnvOrDefault("AIQ_PASSWORD", ""));

    http::HttpExecutorFactory factory;
    std::shared_ptr<const http::IHttpExecutor> executor =
        factory.CreateExecutor(getArgValue(argc, argv, "--httpcfg").value_or(std::string()));
    auth::IntegrationAuthClient client(executor);

    auto token = client.FetchAccessToken(*url, user, password, *org);
    if (token.IsError()) {
        LOG_ERROR("{}", errors::Describe(token.Error()));
        return exitCodeFor(token.Error().category);
    }
    std::cout << token.Value() << std::endl;
    return 0;
}
