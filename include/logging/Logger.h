//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional log file and {fmt} runtime formatting.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

// Log level enum used by the filtering macros
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by the bridge, the tool host and the tests.
// Notes:
//   - Lines look like "2025-06-01 12:00:00.123 [INFO] t:7f3a Session.cpp:88: message".
//   - Console output goes to stdout, or to stderr in stdio mode (tool host: stdout carries frames).
//   - WEBSEARCH_LOG_COLOR=0 disables the ANSI label colors.
//==========================================================================================================
class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to INFO.
    static Level levelFromString(const std::string& lvl);

    // Variadic logging using fmt::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (format: {})", e.what(), fmtStr);
        }
        log(level, buffer, file, line);
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static void setLogLevel(Level level);
    static void setLogLevelFromString(const std::string& lvl) { setLogLevel(levelFromString(lvl)); }

    // Appends to filePath in addition to the console. A file that cannot be opened is reported on stderr.
    static void setLogFile(const std::string& filePath);

    // Forces console output to stderr regardless of WEBSEARCH_STDIO_MODE.
    static void setStdioMode(bool enabled);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static bool sStdioMode;
};

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
// Logs unconditionally and terminates the process without unwinding
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Scope-based entry/exit tracing, compiled in for _DEBUG builds only
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
