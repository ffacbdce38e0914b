//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/websearch/SerperClient.cpp
// Purpose: Serper search client using Boost.Beast coroutines (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include "websearch/SerperClient.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/JSONRPCTypes.h"

namespace websearch {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Adequate for scheme://host[:port]/path
UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "https";
    }
    std::size_t pathStart = url.find('/', pos);
    std::string authority = url.substr(pos, pathStart == std::string::npos ? std::string::npos : pathStart - pos);
    parts.target = pathStart == std::string::npos ? std::string("/") : url.substr(pathStart);
    std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    } else {
        parts.host = authority;
        parts.port = parts.scheme == "https" ? "443" : "80";
    }
    if (parts.host.empty()) {
        throw std::invalid_argument(fmt::format("search endpoint has no host: '{}'", url));
    }
    return parts;
}

bool isTimeout(const boost::system::system_error& e) {
    return e.code() == boost::beast::error::timeout || e.code() == net::error::timed_out;
}

} // namespace

class SerperClient::Impl {
public:
    SerperClient::Options opts;
    UrlParts url;
    std::unique_ptr<ssl::context> sslCtx;

    explicit Impl(SerperClient::Options o) : opts(std::move(o)), url(parseUrl(opts.endpoint)) {
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            if (!opts.caFile.empty()) {
                sslCtx->load_verify_file(opts.caFile);
            } else {
                boost::system::error_code ec;
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_WARN("SerperClient: set_default_verify_paths failed: {}", ec.message());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    http::request<http::string_body> buildRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.target, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.set("X-API-KEY", opts.apiKey);
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: POST the JSON body and return status + body
    net::awaitable<ProviderReply> coPost(const std::string body) {
        auto req = buildRequest(body);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
        LOG_DEBUG("SerperClient: resolved {}:{}", url.host, url.port);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                throw std::runtime_error("HTTPS: failed to set SNI hostname");
            }
            ::SSL_set1_host(stream.native_handle(), url.host.c_str());
            // One deadline covers connect, handshake, write and read
            stream.next_layer().expires_after(opts.timeout);
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(opts.timeout);
            co_await stream.async_connect(results, net::use_awaitable);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return ProviderReply{res.result_int(), res.body()};
    }
};

SerperClient::SerperClient(Options opts) : pImpl(std::make_unique<Impl>(std::move(opts))) {}

SerperClient::~SerperClient() = default;

ProviderReply SerperClient::Post(const std::string& query, std::int64_t num) {
    FUNC_SCOPE();
    JSONValue::Object payload;
    setMember(payload, "q", JSONValue(query));
    setMember(payload, "num", JSONValue(static_cast<int64_t>(num)));
    const std::string body = serializeJSONValue(JSONValue(std::move(payload)));

    net::io_context ioc;
    auto fut = net::co_spawn(ioc, pImpl->coPost(body), net::use_future);
    ioc.run();
    try {
        ProviderReply reply = fut.get();
        LOG_DEBUG("SerperClient: HTTP {} ({} bytes)", reply.status, reply.body.size());
        return reply;
    } catch (const boost::system::system_error& e) {
        if (isTimeout(e)) {
            throw ProviderTimeout(e.what());
        }
        throw std::runtime_error(e.what());
    }
}

} // namespace websearch
