/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../xpcd/crypto/Encoding.hpp"
#include "../../xpcd/ledger/TransactionSubmissionClient.hpp"
#include <iostream>

using namespace xpcd;

static void
feePrint(const char *label, bool present, const rpc::XRPDropsAmount &amount)
{
    if (present)
        std::cout << label << amount.drops() << " drops" << std::endl;
}

COMMAND(InitLevel::network, CliFee, "fee",
        "")
{
    if (0 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](const rpc::GetFeeResponse &reply)
    {
        const auto &drops = reply.drops();
        feePrint("Base: ", drops.has_base_fee(), drops.base_fee());
        feePrint("Minimum: ", drops.has_minimum_fee(), drops.minimum_fee());
        feePrint("Median: ", drops.has_median_fee(), drops.median_fee());
        feePrint("Open ledger: ", drops.has_open_ledger_fee(),
                 drops.open_ledger_fee());
        done = true;
    };
    session.network->feeFetch(onError, onReply, rpc::GetFeeRequest());

    XPC_CHECK(sessionWait(session, done));
    return error;
}

COMMAND(InitLevel::network, CliLedgerSequence, "ledger-sequence",
        "")
{
    if (0 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    OfflineSigner signer;
    TransactionSubmissionClient client(*session.network, signer);

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](uint32_t ledgerIndex)
    {
        std::cout << ledgerIndex << std::endl;
        done = true;
    };
    client.ledgerSequenceFetch(onError, onReply);

    XPC_CHECK(sessionWait(session, done));
    return error;
}

COMMAND(InitLevel::network, CliTxStatus, "tx-status",
        " <hash>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    OfflineSigner signer;
    TransactionSubmissionClient client(*session.network, signer);

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](const rpc::GetTransactionStatusResponse &reply)
    {
        std::cout << "Validated: " << (reply.validated() ? "yes" : "no") <<
                  std::endl;
        std::cout << "Result: " << reply.transaction_status_code() << std::endl;
        if (reply.last_ledger_sequence())
            std::cout << "Last ledger: " << reply.last_ledger_sequence() <<
                      std::endl;
        done = true;
    };
    client.transactionStatusFetch(onError, onReply, argv[0]);

    XPC_CHECK(sessionWait(session, done));
    return error;
}

COMMAND(InitLevel::network, CliPaymentStatus, "payment-status",
        " <hash>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    OfflineSigner signer;
    TransactionSubmissionClient client(*session.network, signer);

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](TransactionStatus status)
    {
        switch (status)
        {
        case TransactionStatus::pending:
            std::cout << "pending" << std::endl;
            break;
        case TransactionStatus::succeeded:
            std::cout << "succeeded" << std::endl;
            break;
        case TransactionStatus::failed:
            std::cout << "failed" << std::endl;
            break;
        }
        done = true;
    };
    client.paymentStatusFetch(onError, onReply, argv[0]);

    XPC_CHECK(sessionWait(session, done));
    return error;
}

COMMAND(InitLevel::network, CliSubmit, "submit",
        " <signed-hex>")
{
    if (1 != argc)
        return XPC_ERROR(XPC_CC_Error, helpString(*this));

    DataChunk signedTransaction;
    XPC_CHECK(base16Decode(signedTransaction, argv[0]));
    if (signedTransaction.empty())
        return XPC_ERROR(XPC_CC_Error, "Empty transaction");

    bool done = false;
    Status error;
    auto onError = [&](Status s)
    {
        error = s;
        done = true;
    };
    auto onReply = [&](const rpc::SubmitTransactionResponse &reply)
    {
        std::cout << reply.engine_result() << " (" <<
                  reply.engine_result_code() << "): " <<
                  reply.engine_result_message() << std::endl;
        if (!reply.hash().empty())
            std::cout << "Hash: " << base16Encode(reply.hash()) << std::endl;
        done = true;
    };
    rpc::SubmitTransactionRequest request;
    request.set_signed_transaction(toString(signedTransaction));
    session.network->transactionSubmit(onError, onReply, request);

    XPC_CHECK(sessionWait(session, done));
    return error;
}
