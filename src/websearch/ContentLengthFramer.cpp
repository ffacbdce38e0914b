//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length framer (LSP-style headers) and framer selection helpers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "websearch/ContentFramer.h"

namespace websearch {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) const override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) const override {
        static const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            // A header block cannot legitimately grow without bound
            if (buffer.size() > MaxHeaderBytes) {
                LOG_WARN("Content-Length header block exceeds {} bytes without terminator", MaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
                if (name == "content-length") {
                    auto v64 = ParseUnsigned(value);
                    if (!v64.has_value()) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64.value() > maxContentLength || v64.value() > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64.value(), maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                    contentLength = static_cast<std::size_t>(v64.value());
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) const override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    static constexpr std::size_t MaxHeaderBytes = 8 * 1024;
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingKind kind, std::size_t maxFrameBytes) {
    switch (kind) {
        case FramingKind::ContentLength: return MakeContentLengthFramer(maxFrameBytes);
        case FramingKind::NewlineDelimited: break;
    }
    return MakeNewlineFramer(maxFrameBytes);
}

const char* toString(FramingKind kind) {
    return kind == FramingKind::ContentLength ? "content-length" : "newline";
}

std::optional<FramingKind> parseFramingKind(const std::string& text) {
    if (text == "newline" || text == "ndjson") return FramingKind::NewlineDelimited;
    if (text == "content-length" || text == "lsp") return FramingKind::ContentLength;
    return std::nullopt;
}

} // namespace websearch
