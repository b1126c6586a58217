/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "GrpcWeb.hpp"
#include <ctype.h>

namespace xpcd {

constexpr size_t frameHeaderSize = 5;
constexpr uint8_t trailerFlag = 0x80;

std::string
grpcWebEncode(const std::string &message)
{
    const uint32_t size = message.size();

    std::string out;
    out.reserve(frameHeaderSize + size);
    out += char(0); // Uncompressed data frame
    out += char(size >> 24 & 0xff);
    out += char(size >> 16 & 0xff);
    out += char(size >> 8 & 0xff);
    out += char(size & 0xff);
    out += message;
    return out;
}

Status
grpcWebDecode(std::string &result, const std::string &body,
              const HeaderMap &headers)
{
    // Trailers-only replies carry their status in the headers:
    HeaderMap trailers = headers;
    std::string message;
    bool messageOk = false;

    size_t i = 0;
    while (i < body.size())
    {
        if (body.size() - i < frameHeaderSize)
            return XPC_ERROR(XPC_CC_NetworkError, "Truncated gRPC-Web frame header");

        const uint8_t flags = body[i];
        const uint32_t size =
            uint32_t(uint8_t(body[i + 1])) << 24 |
            uint32_t(uint8_t(body[i + 2])) << 16 |
            uint32_t(uint8_t(body[i + 3])) << 8 |
            uint32_t(uint8_t(body[i + 4]));
        i += frameHeaderSize;

        if (body.size() - i < size)
            return XPC_ERROR(XPC_CC_NetworkError, "Truncated gRPC-Web frame");

        if (flags & trailerFlag)
        {
            grpcWebHeaderParse(trailers, body.substr(i, size));
        }
        else if (!messageOk)
        {
            message = body.substr(i, size);
            messageOk = true;
        }
        i += size;
    }

    auto status = trailers.find("grpc-status");
    if (trailers.end() == status)
        return XPC_ERROR(XPC_CC_NetworkError, "Missing gRPC status");
    if ("0" != status->second)
    {
        std::string error = "gRPC status " + status->second;
        auto details = trailers.find("grpc-message");
        if (trailers.end() != details)
            error += ": " + details->second;
        return XPC_ERROR(XPC_CC_NetworkError, error);
    }

    if (!messageOk)
        return XPC_ERROR(XPC_CC_NetworkError, "Missing reply body");

    result = std::move(message);
    return Status();
}

void
grpcWebHeaderParse(HeaderMap &result, const std::string &text)
{
    size_t start = 0;
    while (start < text.size())
    {
        auto end = text.find('\n', start);
        if (std::string::npos == end)
            end = text.size();
        std::string line = text.substr(start, end - start);
        start = end + 1;

        while (!line.empty() && isspace(uint8_t(line.back())))
            line.pop_back();

        // Status lines and blank lines have no colon:
        auto colon = line.find(':');
        if (std::string::npos == colon)
            continue;

        std::string name = line.substr(0, colon);
        for (auto &c: name)
            c = tolower(uint8_t(c));

        auto valueStart = line.find_first_not_of(" \t", colon + 1);
        result[name] = std::string::npos == valueStart ?
                       "" : line.substr(valueStart);
    }
}

} // namespace xpcd
