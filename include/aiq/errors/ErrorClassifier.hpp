//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/aiq/errors/ErrorClassifier.hpp
// Purpose: Maps HTTP outcomes of the integration supervisor to typed AuthError values
//==========================================================================================================
#pragma once

#include <optional>
#include <string>

#include "aiq/errors/Errors.h"

namespace aiq::errors {

constexpr int kHttpOk = 200;
constexpr int kHttpBadRequest = 400;

//==========================================================================================================
// ClassifyHttpFailure
// Purpose: Decide whether a completed HTTP exchange is a failure and describe it.
// Args:
//   status: HTTP status code.
//   reasonPhrase: Status line reason phrase (fallback message).
//   body: Response body; consulted only for status 400.
// Returns:
//   std::nullopt for 200. Otherwise AuthenticationRejected carrying status and a message taken from the
//   body's "error_description" (400 only, when present and text) or the reason phrase.
//==========================================================================================================
std::optional<AuthError> ClassifyHttpFailure(int status, const std::string& reasonPhrase, const std::string& body);

// Wraps a transport-level failure reason as TransportFailure.
AuthError ClassifyTransportFailure(const std::string& what);

} // namespace aiq::errors
