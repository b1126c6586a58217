/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_CONTEXT_HPP
#define XPCD_CONTEXT_HPP

#include "json/JsonObject.hpp"
#include "network/INetworkClient.hpp"
#include <memory>

namespace xpcd {

/**
 * The on-disk settings file.
 * Missing keys take the defaults shown here.
 */
struct ConfigJson:
    public JsonObject
{
    XPC_JSON_CONSTRUCTORS(ConfigJson, JsonObject)
    XPC_JSON_STRING(endpoint, "endpoint", XPC_DEFAULT_GRPC_ENDPOINT)
    XPC_JSON_STRING(legacyEndpoint, "legacyEndpoint", XPC_DEFAULT_LEGACY_ENDPOINT)
    XPC_JSON_STRING(backend, "backend", "grpc")
    XPC_JSON_STRING(network, "network", "test")
    XPC_JSON_STRING(logDir, "logDir", nullptr)
    XPC_JSON_INTEGER(timeout, "timeout", 30)
    XPC_JSON_STRING(certPath, "certPath", "")
};

/**
 * Returns the usual settings file location,
 * `~/.config/xpcore/xpcore.conf`.
 */
std::string
configPath();

/**
 * An object holding app-wide information, such as which server to use.
 */
class Context
{
public:
    ~Context();

    /**
     * Checks the settings and starts the debug log, if one is configured.
     */
    static Status
    create(std::unique_ptr<Context> &result, const ConfigJson &config);

    const std::string &endpoint() const { return endpoint_; }
    const std::string &certPath() const { return certPath_; }
    bool legacy() const { return legacy_; }
    bool testnet() const { return testnet_; }
    SleepTime timeout() const { return timeout_; }

    /**
     * Prepares the configured backend. Does not connect.
     */
    std::unique_ptr<INetworkClient>
    networkClient() const;

    /**
     * Verifies that an X-Address belongs to the configured network.
     */
    Status
    addressCheck(const std::string &address) const;

private:
    std::string endpoint_;
    std::string certPath_;
    bool legacy_ = false;
    bool testnet_ = true;
    SleepTime timeout_;
    bool logging_ = false;

    Context() {}
};

} // namespace xpcd

#endif
