//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer (default MCP stdio framing)
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "websearch/ContentFramer.h"

namespace websearch {

namespace {
bool isBlank(const std::string& buffer, std::size_t from, std::size_t to) {
    for (std::size_t k = from; k < to; ++k) {
        char c = buffer[k];
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    // Payloads are compact JSON, which never contains a raw '\n'.
    std::string encode(const std::string& payload) const override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) const override {
        std::size_t pos = 0;
        while (true) {
            std::size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) {
                if (buffer.size() - pos > maxLineLength) {
                    LOG_WARN("Unterminated line exceeds {} bytes; dropping {} buffered bytes", maxLineLength, buffer.size());
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Leading blank lines are consumed even when the next frame is not complete yet
                return { DecodeStatus::Incomplete, std::nullopt, pos };
            }
            if (isBlank(buffer, pos, nl)) {
                pos = nl + 1;
                continue;
            }
            std::size_t end = nl;
            if (end > pos && buffer[end - 1] == '\r') {
                --end;
            }
            if (end - pos > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds max {}", end - pos, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, nl + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(pos, end - pos), nl + 1 };
        }
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
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

} // namespace websearch
