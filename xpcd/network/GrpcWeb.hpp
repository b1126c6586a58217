/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * gRPC-Web message framing, as spoken over plain HTTP/1.1.
 */

#ifndef XPCD_NETWORK_GRPC_WEB_HPP
#define XPCD_NETWORK_GRPC_WEB_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <map>

namespace xpcd {

constexpr auto grpcWebContentType = "application/grpc-web+proto";

/**
 * HTTP headers or gRPC trailers, with lowercased names.
 */
typedef std::map<std::string, std::string> HeaderMap;

/**
 * Wraps a serialized protobuf message in a gRPC-Web data frame.
 */
std::string
grpcWebEncode(const std::string &message);

/**
 * Extracts the reply message from a gRPC-Web response body.
 * The call status comes from the trailer frame,
 * or from the HTTP headers for trailers-only replies.
 * Any non-zero status, a truncated frame, or a missing data frame
 * is a network error.
 */
Status
grpcWebDecode(std::string &result, const std::string &body,
              const HeaderMap &headers);

/**
 * Parses `name: value` lines into a map, lowercasing the names.
 */
void
grpcWebHeaderParse(HeaderMap &result, const std::string &text);

} // namespace xpcd

#endif
