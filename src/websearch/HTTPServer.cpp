//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/websearch/HTTPServer.cpp
// Purpose: HTTP/HTTPS route server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/HTTPServer.hpp"
#include "websearch/JSONRPCTypes.h"

namespace websearch {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
std::string errorBody(const std::string& message, const std::string& type) {
    JSONValue::Object obj;
    setMember(obj, "status", JSONValue("error"));
    setMember(obj, "error", JSONValue(message));
    setMember(obj, "error_type", JSONValue(type));
    return serializeJSONValue(JSONValue(std::move(obj)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;
    net::thread_pool handlers;
    std::atomic<std::uint16_t> boundPort{0};

    // path -> (method -> handler)
    std::map<std::string, std::map<std::string, RouteHandler>> routes;
    std::function<void(const std::string&)> errorHandler;

    explicit Impl(const HTTPServer::Options& o)
        : opts(o), handlers(std::max<std::size_t>(1u, o.handlerThreads)) {}

    ~Impl() {
        running.store(false);
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        handlers.join();
    }

    void setError(const std::string& msg) {
        LOG_WARN("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        try {
            sslCtx->use_certificate_chain_file(opts.certFile);
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
            throw;
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    HttpReply dispatch(const HttpRequest& req) {
        auto pit = routes.find(req.path);
        if (pit == routes.end()) {
            return HttpReply{404, errorBody("Not found", "not_found")};
        }
        auto mit = pit->second.find(req.method);
        if (mit == pit->second.end()) {
            return HttpReply{405, errorBody("Method not allowed", "method_not_allowed")};
        }
        try {
            return mit->second(req);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: handler for {} {} threw: {}", req.method, req.path, e.what());
            return HttpReply{500, errorBody(e.what(), "internal_error")};
        }
    }

    static HttpRequest toRequest(const http::request<http::string_body>& req) {
        HttpRequest in;
        in.method = std::string(req.method_string());
        in.target = std::string(req.target());
        auto q = in.target.find('?');
        in.path = q == std::string::npos ? in.target : in.target.substr(0, q);
        in.body = req.body();
        for (const auto& field : req) {
            in.headers[toLower(std::string(field.name_string()))] = std::string(field.value());
        }
        return in;
    }

    // Runs on the handler pool. The request is owned by the coroutine frame.
    net::awaitable<HttpReply> dispatchOnPool(HttpRequest in) {
        co_return dispatch(in);
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                                   const HttpRequest& in, HttpReply out) {
        LOG_INFO("HTTPServer: {} {} -> {}", in.method, in.target, out.status);

        http::response<http::string_body> res{static_cast<http::status>(out.status), req.version()};
        res.set(http::field::server, "websearch-bridge");
        res.set(http::field::content_type, out.contentType);
        if (out.status == 405) {
            std::string allow;
            for (const auto& [method, handler] : routes.at(in.path)) {
                if (!allow.empty()) allow += ", ";
                allow += method;
            }
            res.set(http::field::allow, allow);
        }
        res.keep_alive(false);
        res.body() = std::move(out.body);
        res.prepare_payload();
        return res;
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        HttpRequest in = toRequest(req);
        // Resumes on this I/O thread once the handler has finished on the pool
        HttpReply out = co_await net::co_spawn(handlers, dispatchOnPool(in), net::use_awaitable);
        auto res = makeResponse(req, in, std::move(out));
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Shutdown-related errors are expected
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
            return;
        }
        setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    // Throws on resolve/bind/listen failure.
    void bind() {
        if (opts.port.empty() || !ParseUnsigned(opts.port).has_value() || ParseUnsigned(opts.port).value() > 65535u) {
            throw std::runtime_error("HTTPServer invalid port: '" + opts.port + "'");
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() {
    if (!pImpl->ioThreads.empty()) {
        Stop().get();
    }
}

void HTTPServer::Route(const std::string& method, const std::string& path, RouteHandler handler) {
    pImpl->routes[path][method] = std::move(handler);
}

std::future<void> HTTPServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        if (pImpl->opts.scheme == "https") {
            pImpl->initTls();
        }
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer: failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    const unsigned n = std::max(1u, pImpl->opts.threads);
    for (unsigned i = 0; i < n; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        });
    }
    LOG_INFO("HTTPServer listening on {}://{}:{} ({} I/O threads, {} handler threads)", pImpl->opts.scheme,
             pImpl->opts.address, pImpl->boundPort.load(), n, std::max(1u, pImpl->opts.handlerThreads));
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        // The acceptor belongs to the I/O threads; close it on one of them
        net::post(pImpl->ioc, [this]() {
            boost::system::error_code ec;
            pImpl->acceptor->close(ec);
        });
    }
    pImpl->ioc.stop();
    for (auto& t : pImpl->ioThreads) {
        if (t.joinable()) t.join();
    }
    pImpl->ioThreads.clear();
    // Queued handlers are dropped; running ones finish first
    pImpl->handlers.stop();
    pImpl->handlers.join();
    done.set_value();
    return fut;
}

std::uint16_t HTTPServer::BoundPort() const { return pImpl->boundPort.load(); }

void HTTPServer::SetErrorHandler(std::function<void(const std::string&)> handler) {
    pImpl->errorHandler = std::move(handler);
}

HTTPServer::Options HTTPServer::OptionsFromUri(const std::string& uri) {
    Options opts;
    std::string cfg = uri;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    std::string hostPort = hostPortPath.substr(0, hostPortPath.find('/'));
    trim(hostPort);

    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        if (opts.port.empty()) opts.port = opts.scheme == "https" ? "443" : "8000";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace websearch
