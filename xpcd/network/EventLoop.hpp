/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_NETWORK_EVENT_LOOP_HPP
#define XPCD_NETWORK_EVENT_LOOP_HPP

#include "INetworkClient.hpp"

namespace xpcd {

/**
 * Wakes the client until the `done` flag goes true.
 * Callbacks run on this thread, and are expected to set the flag.
 * @param timeout how long to wait before giving up with `XPC_CC_Timeout`.
 */
Status
eventLoopRun(INetworkClient &client, const bool &done, SleepTime timeout);

} // namespace xpcd

#endif
