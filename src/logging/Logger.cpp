//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state and line formatting
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <functional>
#include <iostream>
#include <thread>

#include "env/EnvVars.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
bool Logger::sStdioMode = false;

namespace {

const char* baseName(const char* path) {
    const char* slash = ::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// Local wall-clock time with milliseconds
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return fmt::format("{}.{:03}", buf, ms);
}

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) return "\033[38;5;88m";
    if (::strncmp(level, "WARN", 4) == 0) return "\033[33m";
    if (::strncmp(level, "DEBUG", 5) == 0) return "\033[36m";
    return "\033[35m";
}

} // namespace

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return Level::DEBUG;
    if (s == "INFO")  return Level::INFO;
    if (s == "WARN" || s == "WARNING")  return Level::WARN;
    if (s == "ERROR") return Level::ERROR;
    if (s == "FATAL" || s == "CRITICAL") return Level::FATAL;
    return Level::INFO;
}

void Logger::setLogLevel(Level level) {
    switch (level) {
        case Level::DEBUG: sLogLevel = LogLevel::LOG_DEBUG_LEVEL; break;
        case Level::INFO:  sLogLevel = LogLevel::LOG_INFO_LEVEL; break;
        case Level::WARN:  sLogLevel = LogLevel::LOG_WARN_LEVEL; break;
        case Level::ERROR: sLogLevel = LogLevel::LOG_ERROR_LEVEL; break;
        case Level::FATAL: sLogLevel = LogLevel::LOG_FATAL_LEVEL; break;
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
}

void Logger::setStdioMode(bool enabled) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sStdioMode = enabled;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvFlag("WEBSEARCH_LOG_COLOR", true);
    static const bool stdioFromEnv = GetEnvFlag("WEBSEARCH_STDIO_MODE", false);

    const std::size_t tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffffu;
    const std::string prefix = timestamp();
    const std::string tail = fmt::format(" t:{:04x} {}:{}: {}\n", tid, baseName(file), line, msg);
    const std::string plain = fmt::format("{} [{}]{}", prefix, level, tail);

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = (sStdioMode || stdioFromEnv) ? std::cerr : std::cout;
    if (colorEnabled) {
        console << prefix << " [" << labelColor(level) << level << "\033[0m]" << tail << std::flush;
    } else {
        console << plain << std::flush;
    }
    if (sLogFile.is_open()) {
        sLogFile << plain;
        sLogFile.flush();
    }
}
