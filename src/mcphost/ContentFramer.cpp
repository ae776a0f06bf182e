//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Newline-delimited and Content-Length framers for tool server byte streams
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphost/ContentFramer.h"

namespace mcphost {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame;
        frame.reserve(payload.size() + 1);
        for (char c : payload) {
            // serialized JSON never carries raw newlines; drop any so the frame stays one line
            if (c != '\n' && c != '\r') frame.push_back(c);
        }
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Line exceeds limit (max={}); discarding {} bytes", maxLineLength, buffer.size());
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') --end;
            std::string line = buffer.substr(start, end - start);
            const bool blank = std::all_of(line.begin(), line.end(),
                                           [](unsigned char c) { return std::isspace(c) != 0; });
            if (blank) {
                start = eol + 1;
                continue;
            }
            if (line.size() > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds limit (max={})", line.size(), maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, std::make_optional(std::move(line)), eol + 1 };
        }
    }

private:
    std::size_t maxLineLength;
};

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

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
                if (name == "content-length") {
                    unsigned long long v64 = 0;
                    try {
                        v64 = std::stoull(value);
                    } catch (const std::exception&) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerEnd + sep.size() };
                    }
                    if (v64 > maxContentLength) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerEnd + sep.size() };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerEnd + sep.size() };
        }

        const std::size_t frameTotal = headerEnd + sep.size() + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        std::string payload = buffer.substr(headerEnd + sep.size(), contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxMessageBytes) {
    if (mode == FramingMode::ContentLength) {
        return MakeContentLengthFramer(maxMessageBytes);
    }
    return MakeNewlineFramer(maxMessageBytes);
}

} // namespace mcphost
