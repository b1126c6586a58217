/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "EventLoop.hpp"
#include <thread>

namespace xpcd {

Status
eventLoopRun(INetworkClient &client, const bool &done, SleepTime timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        SleepTime sleep;
        XPC_CHECK(client.wakeup(sleep));
        if (done)
            break;

        // Nobody is left to set the flag:
        if (!sleep.count())
            return XPC_ERROR(XPC_CC_Error, "No outstanding network work");

        const auto now = std::chrono::steady_clock::now();
        if (deadline <= now)
            return XPC_ERROR(XPC_CC_Timeout, "Timeout waiting for " +
                             client.uri());

        const auto left =
            std::chrono::duration_cast<SleepTime>(deadline - now);
        std::this_thread::sleep_for(left < sleep ? left : sleep);
    }

    return Status();
}

} // namespace xpcd
