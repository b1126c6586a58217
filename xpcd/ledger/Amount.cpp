/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Amount.hpp"
#include <limits>

namespace xpcd {

Status
dropsDecode(uint64_t &result, const std::string &text)
{
    if (text.empty())
        return XPC_ERROR(XPC_CC_ParseError, "Empty amount");

    uint64_t out = 0;
    for (auto c: text)
    {
        if (c < '0' || '9' < c)
            return XPC_ERROR(XPC_CC_ParseError, "Bad amount " + text);

        const uint64_t digit = c - '0';
        if ((std::numeric_limits<uint64_t>::max() - digit) / 10 < out)
            return XPC_ERROR(XPC_CC_ParseError, "Amount out of range " + text);
        out = 10 * out + digit;
    }

    result = out;
    return Status();
}

} // namespace xpcd
