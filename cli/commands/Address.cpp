/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../xpcd/ledger/Address.hpp"
#include <iostream>
#include <stdlib.h>

using namespace xpcd;

COMMAND(InitLevel::none, CliAddressDecode, "address-decode",
        " <x-address>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    XAddress address;
    XPC_CHECK(xAddressDecode(address, argv[0]));

    std::cout << "Classic address: " << address.classicAddress << std::endl;
    if (address.hasTag)
        std::cout << "Destination tag: " << address.tag << std::endl;
    std::cout << "Network: " << (address.testnet ? "test" : "main") <<
              std::endl;
    return Status();
}

COMMAND(InitLevel::none, CliAddressEncode, "address-encode",
        " <classic-address> [tag] [test]")
{
    if (argc < 1 || 3 < argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    XAddress address;
    address.classicAddress = argv[0];
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if ("test" == arg)
        {
            address.testnet = true;
            continue;
        }

        char *end;
        const auto tag = strtoul(arg.c_str(), &end, 10);
        if (arg.empty() || *end || 0xffffffffUL < tag)
            return XPC_ERROR(XPC_CC_ParseError, "Bad destination tag " + arg);
        address.hasTag = true;
        address.tag = tag;
    }

    std::string out;
    XPC_CHECK(xAddressEncode(out, address));
    std::cout << out << std::endl;
    return Status();
}
