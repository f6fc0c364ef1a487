//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// WARN by default so library callers see only problems unless AIQ_LOG_LEVEL asks for more
LogLevel Logger::sLogLevel = LogLevel::LOG_WARN_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
