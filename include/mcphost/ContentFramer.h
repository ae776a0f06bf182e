//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on tool server byte streams
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcphost {

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
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

enum class FramingMode {
    NewlineDelimited,  // one JSON document per line (MCP stdio)
    ContentLength      // LSP-style "Content-Length: N\r\n\r\n" headers
};

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxMessageBytes);

} // namespace mcphost
