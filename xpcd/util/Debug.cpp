/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace xpcd {

#define MAX_LOG_SIZE (1 << 19) // Max size 512 KiB

static std::mutex gDebugMutex;
static FILE *gLogFile = nullptr;
static std::string gLogDir;

static std::string
debugLogPath()
{
    return gLogDir + "xpc.log";
}

static std::string
debugLogOldPath()
{
    return gLogDir + "xpc-prev.log";
}

static Status
debugLogRotate()
{
    if (gLogFile)
        fclose(gLogFile);

    auto path = debugLogPath();
    rename(path.c_str(), debugLogOldPath().c_str());

    gLogFile = fopen(path.c_str(), "w");
    if (!gLogFile)
        return XPC_ERROR(XPC_CC_SysError, "Cannot open " + path);

    return Status();
}

Status
debugInitialize(const std::string &logDir)
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    gLogDir = logDir;
    if (!gLogDir.empty() && '/' != gLogDir.back())
        gLogDir += '/';
    XPC_CHECK(debugLogRotate());

    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

void XPC_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    time_t t = time(nullptr);
    struct tm *utc = gmtime(&t);

    std::stringstream date;
    date << std::setfill('0');
    date << std::setw(4) << utc->tm_year + 1900 << '-';
    date << std::setw(2) << utc->tm_mon + 1 << '-';
    date << std::setw(2) << utc->tm_mday << ' ';
    date << std::setw(2) << utc->tm_hour << ':';
    date << std::setw(2) << utc->tm_min << ':';
    date << std::setw(2) << utc->tm_sec << " XPC_Log: ";

    // Get the message length:
    va_list args;
    va_start(args, format);
    char temp[1];
    int size = vsnprintf(temp, sizeof(temp), format, args);
    va_end(args);
    if (size < 0)
        return;

    // Format the message:
    va_start(args, format);
    std::vector<char> message(size + 1);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    // Put the pieces together:
    std::string out = date.str();
    out.append(message.begin(), message.end() - 1);
    if (out.back() != '\n')
        out.append(1, '\n');

    std::lock_guard<std::mutex> lock(gDebugMutex);
    printf("%s", out.c_str());

    if (gLogFile && MAX_LOG_SIZE < ftell(gLogFile))
    {
        // The lock is held, so report rotation failures directly:
        Status s = debugLogRotate();
        if (!s)
            printf("%s\n", s.message().c_str());
    }

    if (gLogFile)
    {
        fwrite(out.c_str(), 1, out.size(), gLogFile);
        fflush(gLogFile);
    }
#endif
}

} // namespace xpcd
