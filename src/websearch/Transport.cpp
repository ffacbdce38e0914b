//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Shared transport configuration parsing
//==========================================================================================================

#include "websearch/Transport.h"

namespace websearch {

std::map<std::string, std::string> parseTransportConfig(const std::string& config) {
    std::map<std::string, std::string> out;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq != std::string::npos && eq > 0) {
            out[token.substr(0, eq)] = token.substr(eq + 1);
        }
    }
    return out;
}

} // namespace websearch
