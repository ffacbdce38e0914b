//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SerperClient.hpp
// Purpose: Search provider interface and the Serper HTTPS client (Boost.Beast, TLS 1.3)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace websearch {

// Raw HTTP outcome of one provider request.
struct ProviderReply {
    unsigned status{0};
    std::string body;
};

// Thrown by a provider when the request exceeded its deadline.
class ProviderTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ISearchProvider {
public:
    virtual ~ISearchProvider() = default;

    //==========================================================================================================
    // Post
    // Purpose: Sends one search request for `query`, asking for `num` organic results.
    // Returns:
    //   Status code and body as received (non-200 is not an exception).
    // Throws:
    //   ProviderTimeout on deadline expiry; std::runtime_error on network/TLS failures.
    //==========================================================================================================
    virtual ProviderReply Post(const std::string& query, std::int64_t num) = 0;
};

class SerperClient : public ISearchProvider {
public:
    struct Options {
        std::string endpoint{"https://google.serper.dev/search"};
        std::string apiKey;
        std::chrono::milliseconds timeout{30000};
        std::string caFile;  // optional, otherwise the system trust store
    };

    explicit SerperClient(Options opts);
    ~SerperClient() override;

    ProviderReply Post(const std::string& query, std::int64_t num) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace websearch
