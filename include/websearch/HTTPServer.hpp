//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS route server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace websearch {

struct HttpRequest {
    std::string method;  // "GET", "POST", ...
    std::string target;  // raw request target, including any query
    std::string path;    // target without the query
    std::string body;
    std::map<std::string, std::string> headers;  // lower-cased names
};

struct HttpReply {
    unsigned status{200};
    std::string body;
    std::string contentType{"application/json"};
};

using RouteHandler = std::function<HttpReply(const HttpRequest&)>;

//==========================================================================================================
// HTTPServer
// Purpose: Dispatches requests by (method, path) to registered handlers. One request per connection.
// Notes:
//   - Handlers run on a separate pool of Options::handlerThreads threads and may block; the I/O
//     threads only accept, read and write, so a slow handler never holds up other connections.
//   - Stop() waits for handlers that are already running.
//   - Unknown path: 404. Known path with another method: 405. A throwing handler: 500.
//==========================================================================================================
class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port, "0" picks an ephemeral port (default: 8000)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   threads: I/O threads running the io_context
//   handlerThreads: Pool running the route handlers (default: 32)
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        unsigned threads{4};
        unsigned handlerThreads{32};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // OptionsFromUri
    // Purpose: Parses "http://<address>:<port>" or "https://<address>:<port>?cert=<pem>&key=<pem>".
    //          [v6addr]:port is accepted. Unknown parameters are ignored; a missing scheme means http.
    //==========================================================================================================
    static Options OptionsFromUri(const std::string& uri);

    // Must be called before Start().
    void Route(const std::string& method, const std::string& path, RouteHandler handler);

    //==========================================================================================================
    // Start
    // Purpose: Binds and listens synchronously, then serves on Options::threads background threads.
    // Returns:
    //   Ready future; holds the bind/listen or TLS setup failure when the server could not start.
    //==========================================================================================================
    std::future<void> Start();

    // Closes the listener, stops the I/O threads and joins them.
    std::future<void> Stop();

    // Actual listening port (useful with port "0"); 0 before Start().
    std::uint16_t BoundPort() const;

    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace websearch
