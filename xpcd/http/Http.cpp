/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */

#include "Http.hpp"
#include "../util/Debug.hpp"
#include <curl/curl.h>

namespace xpcd {

/**
 * Manages the cURL library global memory lifetime.
 */
struct HttpSingleton
{
    ~HttpSingleton();
    HttpSingleton();

    Status status;
};

HttpSingleton::~HttpSingleton()
{
    if (status)
        curl_global_cleanup();
}

HttpSingleton::HttpSingleton()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT))
        status = XPC_ERROR(XPC_CC_SysError, "Cannot initialize cURL");
    else
        XPC_DebugLog("cURL initialized: %s", curl_version());
}

Status
httpInit()
{
    // Constructed on first use, exactly once, even across threads:
    static HttpSingleton singleton;
    return singleton.status;
}

} // namespace xpcd
