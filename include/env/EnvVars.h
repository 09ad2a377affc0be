//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables used by the gateway configuration.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnv
// Purpose: Returns the value of the environment variable, or std::nullopt when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns std::nullopt.
// Returns:
//   The value as set, including an empty string.
//==========================================================================================================
inline std::optional<std::string> GetEnv(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    return std::string(v);
}

// Accepts 1/true/TRUE/yes/on as enabled; anything else is disabled.
inline bool IsTruthy(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}
