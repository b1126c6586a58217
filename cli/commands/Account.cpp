/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../xpcd/ledger/TransactionSubmissionClient.hpp"
#include <iomanip>
#include <iostream>

using namespace xpcd;

COMMAND(InitLevel::network, CliBalance, "balance",
        " <x-address>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));
    const std::string address = argv[0];
    XPC_CHECK(session.context->addressCheck(address));

    OfflineSigner signer;
    TransactionSubmissionClient client(*session.network, signer);

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](uint64_t drops)
    {
        std::cout << drops / XPC_DROPS_PER_XRP << '.' <<
                  std::setw(6) << std::setfill('0') <<
                  drops % XPC_DROPS_PER_XRP << " XRP" << std::endl;
        done = true;
    };
    client.balanceFetch(onError, onReply, address);

    XPC_CHECK(sessionWait(session, done));
    return error;
}

COMMAND(InitLevel::network, CliAccountExists, "account-exists",
        " <x-address>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));
    const std::string address = argv[0];
    XPC_CHECK(session.context->addressCheck(address));

    OfflineSigner signer;
    TransactionSubmissionClient client(*session.network, signer);

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](bool exists)
    {
        std::cout << (exists ? "Account exists" : "Account not found") <<
                  std::endl;
        done = true;
    };
    client.accountExists(onError, onReply, address);

    XPC_CHECK(sessionWait(session, done));
    return error;
}
