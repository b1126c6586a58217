/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include "Command.hpp"
#include "../xpcd/network/EventLoop.hpp"

using namespace xpcd;

Status
OfflineSigner::sign(DataChunk &result, const rpc::Transaction &transaction,
                    const Wallet &wallet)
{
    return XPC_ERROR(XPC_CC_SigningFailure, "No signing keys available");
}

Status
sessionWait(Session &session, const bool &done)
{
    return eventLoopRun(*session.network, done, session.context->timeout());
}
