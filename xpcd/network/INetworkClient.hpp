/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_NETWORK_I_NETWORK_CLIENT_HPP
#define XPCD_NETWORK_I_NETWORK_CLIENT_HPP

#include "Typedefs.hpp"
#include <string>

namespace xpcd {

/**
 * A connection to a ledger node.
 * This combines the common features of the current and legacy protocols.
 *
 * Each fetch calls exactly one of its two callbacks.
 * A transport failure, or a call that finishes without a reply body,
 * goes to `onError` with `XPC_CC_NetworkError`.
 * Implementations never retry.
 */
class INetworkClient
{
public:
    virtual ~INetworkClient() {}

    /**
     * Returns the server name for this connection.
     */
    virtual std::string
    uri() = 0;

    /**
     * Performs any pending work, running finished callbacks
     * on the calling thread.
     * @param sleep the longest the caller may wait before calling again.
     */
    virtual Status
    wakeup(SleepTime &sleep) = 0;

    /**
     * Fetches the balance, sequence number and flags for an account.
     */
    virtual void
    accountInfoFetch(const StatusCallback &onError,
                     const AccountInfoCallback &onReply,
                     const rpc::GetAccountInfoRequest &request) = 0;

    /**
     * Fetches the current transaction fee levels.
     */
    virtual void
    feeFetch(const StatusCallback &onError,
             const FeeCallback &onReply,
             const rpc::GetFeeRequest &request) = 0;

    /**
     * Broadcasts a signed transaction.
     * A reply means the node accepted it for relay,
     * not that it has been validated.
     */
    virtual void
    transactionSubmit(const StatusCallback &onError,
                      const SubmitCallback &onReply,
                      const rpc::SubmitTransactionRequest &request) = 0;

    /**
     * Fetches the index of the most recent validated ledger.
     */
    virtual void
    ledgerSequenceFetch(const StatusCallback &onError,
                        const LedgerSequenceCallback &onReply,
                        const rpc::GetLatestValidatedLedgerSequenceRequest &request) = 0;

    /**
     * Fetches the validation state of a transaction.
     */
    virtual void
    transactionStatusFetch(const StatusCallback &onError,
                           const TransactionStatusCallback &onReply,
                           const rpc::GetTransactionStatusRequest &request) = 0;
};

} // namespace xpcd

#endif
