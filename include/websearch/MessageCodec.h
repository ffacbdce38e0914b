//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Transport codec turning protocol messages into framed bytes and back
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "websearch/ContentFramer.h"
#include "websearch/JSONRPCTypes.h"

namespace websearch {

//==========================================================================================================
// Message
// Purpose: Closed set of protocol messages carried on a stream.
//==========================================================================================================
using Message = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

// "request", "response" or "notification"
const char* messageKindName(const Message& message);

//==========================================================================================================
// MessageCodec
// Purpose: Stateful stream codec. Encode() is stateless and may be called from any thread; Feed()/Next()
//          keep partial input buffered between reads and must be driven by a single reader.
// Notes:
//   - Next() drops an offending frame before throwing errors::ProtocolError, so the codec itself can
//     continue; transports treat the error as fatal for their session.
//==========================================================================================================
class MessageCodec {
public:
    explicit MessageCodec(FramingKind framing = FramingKind::NewlineDelimited,
                          std::size_t maxFrameBytes = DefaultMaxFrameBytes);

    //==========================================================================================================
    // Encode
    // Purpose: Serializes and frames one message.
    // Returns:
    //   Bytes ready to be written to the stream.
    //==========================================================================================================
    std::string Encode(const Message& message) const;

    //==========================================================================================================
    // Feed
    // Purpose: Appends raw bytes read from the stream.
    //==========================================================================================================
    void Feed(const char* data, std::size_t size);
    void Feed(const std::string& bytes);

    //==========================================================================================================
    // Next
    // Purpose: Pull-based decoding of the next complete message.
    // Returns:
    //   The message, or nullopt when more bytes are needed.
    // Throws:
    //   errors::ProtocolError(FrameTooLarge) for a frame beyond the limit,
    //   errors::ProtocolError(Malformed) for invalid JSON, bad headers or non JSON-RPC 2.0 objects.
    //==========================================================================================================
    std::optional<Message> Next();

    std::size_t Buffered() const { return buffer.size(); }
    FramingKind Framing() const { return framing; }
    std::size_t MaxFrameBytes() const { return maxFrameBytes; }

    // Classifies one frame payload (request, notification or response). Throws ProtocolError(Malformed).
    static Message Decode(const std::string& payload);
    static std::string Serialize(const Message& message);

private:
    FramingKind framing;
    std::size_t maxFrameBytes;
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
};

} // namespace websearch
