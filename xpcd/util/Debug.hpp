/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_UTIL_DEBUG_HPP
#define XPCD_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define XPC_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        XPC_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace xpcd {

/**
 * Starts writing the log to `xpc.log` in the given directory,
 * moving any previous log out of the way.
 */
Status
debugInitialize(const std::string &logDir);

void
debugTerminate();

void XPC_DebugLog(const char *format, ...);

} // namespace xpcd

#endif
