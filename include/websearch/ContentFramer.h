//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on byte streams (newline-delimited and Content-Length)
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace websearch {

// Default upper bound for a single frame payload (4 MiB).
constexpr std::size_t DefaultMaxFrameBytes = 4u * 1024u * 1024u;

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer, for every status
    };
    virtual std::string encode(const std::string& payload) const = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) const = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) const = 0;
};

//==========================================================================================================
// FramingKind
// Purpose: Selects the self-delimiting encoding used on a stdio byte stream.
//   NewlineDelimited: one compact JSON object per line (MCP stdio convention).
//   ContentLength:    "Content-Length: N\r\n\r\n" header followed by N bytes.
//==========================================================================================================
enum class FramingKind {
    NewlineDelimited,
    ContentLength
};

const char* toString(FramingKind kind);

// Accepts "newline", "ndjson", "content-length" and "lsp" (case-sensitive). nullopt otherwise.
std::optional<FramingKind> parseFramingKind(const std::string& text);

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = DefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = DefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeFramer(FramingKind kind, std::size_t maxFrameBytes = DefaultMaxFrameBytes);

} // namespace websearch
