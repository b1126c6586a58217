/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Context.hpp"
#include "ledger/Address.hpp"
#include "network/GrpcNetworkClient.hpp"
#include "network/LegacyNetworkClient.hpp"
#include "util/Debug.hpp"
#include <stdlib.h>
#include <string.h>

namespace xpcd {

std::string
configPath()
{
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

    return std::string(home) + "/.config/xpcore/xpcore.conf";
}

Context::~Context()
{
    if (logging_)
        debugTerminate();
}

Status
Context::create(std::unique_ptr<Context> &result, const ConfigJson &config)
{
    std::unique_ptr<Context> out(new Context());

    const std::string backend = config.backend();
    if ("grpc" == backend)
        out->legacy_ = false;
    else if ("legacy" == backend)
        out->legacy_ = true;
    else
        return XPC_ERROR(XPC_CC_Error, "Unknown backend " + backend);

    const std::string network = config.network();
    if ("main" == network)
        out->testnet_ = false;
    else if ("test" == network)
        out->testnet_ = true;
    else
        return XPC_ERROR(XPC_CC_Error, "Unknown network " + network);

    if (config.timeout() <= 0)
        return XPC_ERROR(XPC_CC_Error, "The timeout must be positive");
    out->timeout_ = std::chrono::seconds(config.timeout());

    out->endpoint_ = out->legacy_ ? config.legacyEndpoint() : config.endpoint();
    if (out->endpoint_.empty())
        return XPC_ERROR(XPC_CC_Error, "No endpoint given");
    out->certPath_ = config.certPath();

    if (config.logDirOk())
    {
        XPC_CHECK(debugInitialize(config.logDir()));
        out->logging_ = true;
    }

    XPC_DebugLog("Using %s backend at %s",
                 backend.c_str(), out->endpoint_.c_str());

    result = std::move(out);
    return Status();
}

std::unique_ptr<INetworkClient>
Context::networkClient() const
{
    if (legacy_)
        return std::unique_ptr<INetworkClient>(
                   new LegacyNetworkClient(endpoint_, certPath_));
    return std::unique_ptr<INetworkClient>(new GrpcNetworkClient(endpoint_));
}

Status
Context::addressCheck(const std::string &address) const
{
    XAddress decoded;
    XPC_CHECK(xAddressDecode(decoded, address));
    if (decoded.testnet != testnet_)
        return XPC_ERROR(XPC_CC_InvalidAddress, decoded.testnet ?
                         "This is a test network address" :
                         "This is a main network address");
    return Status();
}

} // namespace xpcd
