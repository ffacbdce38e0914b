//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (string, boolean and numeric forms).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

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
// GetEnvFlag
// Purpose: Interprets an environment variable as a boolean switch ("1", "true", "TRUE", "yes").
// Args:
//   name: Variable name.
//   defaultValue: Value used when the variable is unset.
// Returns:
//   true when the variable holds a truthy value.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const char* v = (name && *name) ? std::getenv(name) : nullptr;
    if (v == nullptr) {
        return defaultValue;
    }
    const std::string s(v);
    return s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on";
}

// Parses a non-negative decimal integer; nullopt when the text is empty, signed or not fully numeric.
inline std::optional<std::uint64_t> ParseUnsigned(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t out = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        out = out * 10u + static_cast<std::uint64_t>(c - '0');
    }
    return out;
}
