//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: websearch bridge: HTTP façade in front of a supervised MCP tool host
//==========================================================================================================

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <string>

#include "logging/Logger.h"
#include "websearch/Config.h"
#include "websearch/HTTPServer.hpp"
#include "websearch/ProcessTransport.hpp"
#include "websearch/SearchFacade.h"
#include "websearch/ToolInvoker.h"
#include "websearch/version.h"

using namespace websearch;

int main() {
    FUNC_SCOPE();
    const std::size_t loaded = LoadDotEnv(".env");
    const BridgeConfig config = BridgeConfig::FromEnvironment();
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }
    LOG_INFO("websearch bridge {} starting ({} variables from .env)", getVersionString(), loaded);

    if (!config.serperApiKey.has_value()) {
        LOG_WARN("SERPER_API_KEY is not set; the tool host will refuse to start");
    }

    auto factory = std::make_shared<ProcessTransportFactory>(config.ToolHostSpec());
    const std::string transportConfig = config.transportConfig;
    ToolInvoker invoker([factory, transportConfig]() { return factory->CreateTransport(transportConfig); },
                        config.InvokerOptions());

    // The façade keeps serving /health even if the first handshake fails
    try {
        invoker.Warmup();
        LOG_INFO("Tool host ready");
    } catch (const std::exception& e) {
        LOG_ERROR("Tool host failed to start: {}", e.what());
    }

    FacadeOptions facadeOptions;
    facadeOptions.maxResultsCap = config.maxResults;
    facadeOptions.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.requestTimeout);
    SearchFacade facade(invoker, facadeOptions);

    HTTPServer::Options httpOptions;
    try {
        httpOptions = HTTPServer::OptionsFromUri(config.listenUri);
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid WEBSEARCH_LISTEN '{}': {}", config.listenUri, e.what());
        invoker.Close();
        return 1;
    }
    if (config.port.has_value()) {
        httpOptions.port = std::to_string(config.port.value());
    }
    httpOptions.threads = config.httpThreads;
    httpOptions.handlerThreads = config.handlerThreads;

    HTTPServer server(httpOptions);
    server.SetErrorHandler([](const std::string& err) { LOG_WARN("HTTP: {}", err); });
    facade.RegisterRoutes(server);
    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP server failed to start: {}", e.what());
        invoker.Close();
        return 1;
    }
    LOG_INFO("Listening on {}://{}:{}", httpOptions.scheme, httpOptions.address, server.BoundPort());

    boost::asio::io_context signals;
    boost::asio::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    signals.run();

    server.Stop().get();
    invoker.Close();
    LOG_INFO("websearch bridge stopped");
    return 0;
}
