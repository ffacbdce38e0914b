//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Message classification and framing on top of the content framers
//==========================================================================================================

#include "websearch/MessageCodec.h"

#include <algorithm>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/errors/Errors.h"

namespace websearch {

namespace {
std::string preview(const std::string& payload) {
    constexpr std::size_t limit = 120;
    if (payload.size() <= limit) {
        return payload;
    }
    return payload.substr(0, limit) + "...";
}
} // namespace

const char* messageKindName(const Message& message) {
    switch (message.index()) {
        case 0: return "request";
        case 1: return "response";
        default: return "notification";
    }
}

MessageCodec::MessageCodec(FramingKind framingKind, std::size_t maxBytes)
    : framing(framingKind), maxFrameBytes(maxBytes), framer(MakeFramer(framingKind, maxBytes)) {}

std::string MessageCodec::Serialize(const Message& message) {
    return std::visit([](const auto& m) { return m.Serialize(); }, message);
}

std::string MessageCodec::Encode(const Message& message) const {
    return framer->encode(Serialize(message));
}

void MessageCodec::Feed(const char* data, std::size_t size) {
    buffer.append(data, size);
}

void MessageCodec::Feed(const std::string& bytes) {
    buffer.append(bytes);
}

Message MessageCodec::Decode(const std::string& payload) {
    JSONValue doc;
    try {
        doc = parseJSONValue(payload);
    } catch (const std::exception& e) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed,
                                    fmt::format("invalid JSON frame: {}", e.what()));
    }
    if (!doc.isObject()) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed, "frame is not a JSON object");
    }

    // Classification: method+id -> request, method alone -> notification, id+result|error -> response
    const bool hasMethod = doc.find("method") != nullptr;
    const bool hasId = doc.find("id") != nullptr;
    if (hasMethod && hasId) {
        JSONRPCRequest req;
        if (req.Deserialize(doc)) {
            return Message{std::move(req)};
        }
    } else if (hasMethod) {
        JSONRPCNotification note;
        if (note.Deserialize(doc)) {
            return Message{std::move(note)};
        }
    } else if (hasId) {
        JSONRPCResponse resp;
        if (resp.Deserialize(doc)) {
            return Message{std::move(resp)};
        }
    }
    throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed,
                                fmt::format("not a valid JSON-RPC 2.0 message: {}", preview(payload)));
}

std::optional<Message> MessageCodec::Next() {
    auto r = framer->tryDecodeEx(buffer);
    if (r.bytesConsumed > 0) {
        buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
    }
    switch (r.status) {
        case IContentFramer::DecodeStatus::Incomplete:
            return std::nullopt;
        case IContentFramer::DecodeStatus::BodyTooLarge:
            throw errors::ProtocolError(errors::ProtocolErrorKind::FrameTooLarge,
                                        fmt::format("frame exceeds {} bytes", maxFrameBytes));
        case IContentFramer::DecodeStatus::InvalidHeader:
            throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed, "invalid frame header");
        case IContentFramer::DecodeStatus::Ok:
            break;
    }
    LOG_DEBUG("Decoded frame ({} bytes)", r.payload ? r.payload->size() : 0u);
    return Decode(r.payload.value());
}

} // namespace websearch
