//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial level from TOOLHOST_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
LogLevel Logger::sLogLevel = Logger::toLogLevel(
    Logger::tryLevelFromString(GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "INFO")).value_or(Logger::Level::INFO));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
