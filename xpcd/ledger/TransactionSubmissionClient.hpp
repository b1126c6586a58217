/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_LEDGER_TRANSACTION_SUBMISSION_CLIENT_HPP
#define XPCD_LEDGER_TRANSACTION_SUBMISSION_CLIENT_HPP

#include "Signer.hpp"
#include "../network/INetworkClient.hpp"
#include <memory>
#include <vector>

namespace xpcd {

/**
 * Where a payment stands, as far as the caller cares.
 */
enum class TransactionStatus
{
    pending,
    succeeded,
    failed
};

typedef std::function<void (uint64_t drops)> BalanceCallback;
typedef std::function<void (bool exists)> AccountExistsCallback;
typedef std::function<void (uint32_t ledgerIndex)> LedgerIndexCallback;
typedef std::function<void (TransactionStatus status)> PaymentStatusCallback;

/**
 * Sends payments and looks up account state over any network backend.
 *
 * Every operation calls exactly one of its two callbacks,
 * from inside the backend's `wakeup` or right away.
 * The backend and signer must outlive any operation in flight.
 */
class TransactionSubmissionClient
{
public:
    TransactionSubmissionClient(INetworkClient &network, ISigner &signer);

    /**
     * Looks up fees and the sender's sequence number,
     * then signs and submits a payment.
     * Both addresses must be X-Addresses.
     * @param amount the payment size, in drops.
     */
    void
    send(const StatusCallback &onError, const SubmitCallback &onReply,
         const Wallet &sender, uint64_t amount,
         const std::string &destination,
         const std::vector<rpc::Memo> &memos = std::vector<rpc::Memo>());

    /**
     * Fetches an account's balance, in drops.
     */
    void
    balanceFetch(const StatusCallback &onError, const BalanceCallback &onReply,
                 const std::string &address);

    /**
     * Determines whether the ledger knows about an account.
     */
    void
    accountExists(const StatusCallback &onError,
                  const AccountExistsCallback &onReply,
                  const std::string &address);

    void
    ledgerSequenceFetch(const StatusCallback &onError,
                        const LedgerIndexCallback &onReply);

    /**
     * Fetches the raw status for a transaction.
     * @param hash the 64-character hex transaction hash.
     */
    void
    transactionStatusFetch(const StatusCallback &onError,
                           const TransactionStatusCallback &onReply,
                           const std::string &hash);

    /**
     * Fetches the status of a payment,
     * reduced to pending, succeeded or failed.
     */
    void
    paymentStatusFetch(const StatusCallback &onError,
                       const PaymentStatusCallback &onReply,
                       const std::string &hash);

private:
    INetworkClient &network_;
    ISigner &signer_;

    struct SendState;

    void
    accountInfoFetch(const StatusCallback &onError,
                     const AccountInfoCallback &onReply,
                     const std::string &address);

    /**
     * Runs once both lookups are in, building, signing and submitting.
     */
    void
    sendFinish(std::shared_ptr<SendState> state);
};

} // namespace xpcd

#endif
