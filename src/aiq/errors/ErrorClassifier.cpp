//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/aiq/errors/ErrorClassifier.cpp
// Purpose: Maps HTTP outcomes of the integration supervisor to typed AuthError values
//==========================================================================================================

#include "aiq/errors/ErrorClassifier.hpp"

#include "aiq/json/JsonPath.hpp"
#include "logging/Logger.h"

namespace aiq::errors {

static const char* kErrorDescriptionField = "error_description";

std::optional<AuthError> ClassifyHttpFailure(int status, const std::string& reasonPhrase, const std::string& body) {
    if (status == kHttpOk) {
        return std::nullopt;
    }

    std::string message = reasonPhrase;
    if (status == kHttpBadRequest) {
        auto described = json::ExtractTextFromBody(body, {kErrorDescriptionField});
        if (!described.IsError() && !described.Value().empty()) {
            message = described.Value();
        } else {
            LOG_DEBUG("400 response without usable {}: {}", kErrorDescriptionField, described.IsError() ? described.Error().message : std::string("empty"));
        }
    }

    AuthError err{ErrorCategory::AuthenticationRejected, std::move(message), status};
    LOG_WARN("{}", Describe(err));
    return err;
}

AuthError ClassifyTransportFailure(const std::string& what) {
    return AuthError{ErrorCategory::TransportFailure, what, 0};
}

} // namespace aiq::errors
