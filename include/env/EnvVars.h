//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables (strings, flags and durations) with defaults.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>
#include <optional>
#include <cmath>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvOptional
// Purpose: Returns the value of the environment variable when it is set and non-empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Interprets "1", "true", "TRUE", "yes", "on" as enabled.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    auto v = GetEnvOptional(name);
    if (!v.has_value()) {
        return defaultValue;
    }
    return (*v == "1" || *v == "true" || *v == "TRUE" || *v == "yes" || *v == "on");
}

//==========================================================================================================
// GetEnvSeconds
// Purpose: Parses a non-negative floating point number of seconds from the environment.
// Args:
//   name: Environment variable name.
// Returns:
//   The parsed value; std::nullopt when unset, unparsable, negative or not finite.
//==========================================================================================================
inline std::optional<double> GetEnvSeconds(const char* name) {
    auto v = GetEnvOptional(name);
    if (!v.has_value()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double parsed = std::strtod(v->c_str(), &end);
    if (end == v->c_str()) {
        return std::nullopt;
    }
    while (*end == ' ' || *end == '\t') { ++end; }
    if (*end != '\0' || !std::isfinite(parsed) || parsed < 0.0) {
        return std::nullopt;
    }
    return parsed;
}
