/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TransactionSubmissionClient.hpp"
#include "Address.hpp"
#include "../crypto/Encoding.hpp"
#include "../util/Debug.hpp"
#include <exception>

namespace xpcd {

constexpr auto invalidAddressMessage =
    "Please use the X-Address format. See: https://xrpaddress.info/.";
constexpr auto malformedResponseMessage = "Malformed Response.";
constexpr auto signingFailureMessage = "Unable to sign the transaction";

constexpr size_t hashLength = 32;

#define INVALID_ADDRESS_ERROR \
    XPC_ERROR(XPC_CC_InvalidAddress, invalidAddressMessage)
#define MALFORMED_RESPONSE_ERROR \
    XPC_ERROR(XPC_CC_MalformedResponse, malformedResponseMessage)

/**
 * Unknown accounts come back as errors, with one of these in the message.
 */
static bool
accountMissing(const Status &status)
{
    const auto message = status.message();
    return std::string::npos != message.find("actNotFound") ||
           std::string::npos != message.find("Account not found");
}

/**
 * Nodes reject malformed hashes, so a bad one fails the way they would.
 */
static Status
hashDecode(std::string &result, const std::string &hash)
{
    DataChunk data;
    if (!base16Decode(data, hash) || hashLength != data.size())
        return XPC_ERROR(XPC_CC_NetworkError, "Bad transaction hash " + hash);

    result = toString(data);
    return Status();
}

/**
 * Everything one `send` call needs while its lookups are in flight.
 */
struct TransactionSubmissionClient::SendState
{
    StatusCallback onError;
    SubmitCallback onReply;
    Wallet sender;
    XAddress from;
    XAddress to;
    uint64_t amount = 0;
    std::vector<rpc::Memo> memos;

    // Join point:
    bool failed = false;
    bool feeDone = false;
    bool sequenceDone = false;
    rpc::XRPDropsAmount fee;
    uint32_t sequence = 0;

    /**
     * Reports the first failure, and drops any after that.
     */
    void
    fail(const Status &status)
    {
        if (failed)
            return;
        failed = true;
        onError(status.log());
    }
};

TransactionSubmissionClient::TransactionSubmissionClient(
    INetworkClient &network, ISigner &signer):
    network_(network),
    signer_(signer)
{
}

void
TransactionSubmissionClient::send(const StatusCallback &onError,
                                  const SubmitCallback &onReply,
                                  const Wallet &sender, uint64_t amount,
                                  const std::string &destination,
                                  const std::vector<rpc::Memo> &memos)
{
    auto state = std::make_shared<SendState>();
    state->onError = onError;
    state->onReply = onReply;
    state->sender = sender;
    state->amount = amount;
    state->memos = memos;

    // Validate locally before touching the network:
    if (!xAddressDecode(state->to, destination) ||
            !xAddressDecode(state->from, sender.address))
        return onError(INVALID_ADDRESS_ERROR);

    XPC_DebugLevel(1, "send: %llu drops from %s to %s",
                   static_cast<unsigned long long>(amount),
                   state->from.classicAddress.c_str(),
                   state->to.classicAddress.c_str());

    // The two lookups run side by side:
    auto onFeeError = [state](Status s)
    {
        state->fail(s);
    };
    auto onFee = [this, state](const rpc::GetFeeResponse &reply)
    {
        if (state->failed)
            return;
        if (!reply.has_drops() || !reply.drops().has_minimum_fee())
            return state->fail(MALFORMED_RESPONSE_ERROR);

        state->fee = reply.drops().minimum_fee();
        state->feeDone = true;
        XPC_DebugLevel(1, "send: fee is %llu drops",
                       static_cast<unsigned long long>(state->fee.drops()));
        if (state->sequenceDone)
            sendFinish(state);
    };
    network_.feeFetch(onFeeError, onFee, rpc::GetFeeRequest());

    // A synchronous backend may have failed already:
    if (state->failed)
        return;

    auto onAccountError = [state](Status s)
    {
        state->fail(s);
    };
    auto onAccount = [this, state](const rpc::GetAccountInfoResponse &reply)
    {
        if (state->failed)
            return;
        if (!reply.has_account_data() || !reply.account_data().has_sequence())
            return state->fail(MALFORMED_RESPONSE_ERROR);

        state->sequence = reply.account_data().sequence();
        state->sequenceDone = true;
        XPC_DebugLevel(1, "send: sequence is %u", state->sequence);
        if (state->feeDone)
            sendFinish(state);
    };
    rpc::GetAccountInfoRequest request;
    request.mutable_account()->set_address(state->from.classicAddress);
    network_.accountInfoFetch(onAccountError, onAccount, request);
}

void
TransactionSubmissionClient::sendFinish(std::shared_ptr<SendState> state)
{
    // Assemble:
    rpc::Transaction transaction;
    transaction.mutable_account()->set_address(state->from.classicAddress);
    *transaction.mutable_fee() = state->fee;
    transaction.set_sequence(state->sequence);

    auto *payment = transaction.mutable_payment();
    payment->mutable_amount()->set_drops(state->amount);
    payment->mutable_destination()->set_address(state->to.classicAddress);
    if (state->to.hasTag)
        payment->set_destination_tag(state->to.tag);

    for (const auto &memo: state->memos)
        *transaction.add_memos() = memo;

    // Sign:
    DataChunk signedTransaction;
    Status s;
    try
    {
        s = signer_.sign(signedTransaction, transaction, state->sender);
    }
    catch (const std::exception &e)
    {
        s = XPC_ERROR(XPC_CC_SigningFailure, e.what());
    }
    catch (...)
    {
        s = XPC_ERROR(XPC_CC_SigningFailure, "Unknown signer exception");
    }
    if (!s)
        return state->fail(XPC_ERROR(XPC_CC_SigningFailure,
                                     std::string(signingFailureMessage) +
                                     ". " + s.message()));
    if (signedTransaction.empty())
        return state->fail(XPC_ERROR(XPC_CC_SigningFailure,
                                     signingFailureMessage));

    XPC_DebugLevel(1, "send: submitting %zu signed bytes",
                   signedTransaction.size());

    // Submit:
    rpc::SubmitTransactionRequest request;
    request.set_signed_transaction(toString(signedTransaction));
    network_.transactionSubmit(state->onError, state->onReply, request);
}

void
TransactionSubmissionClient::balanceFetch(const StatusCallback &onError,
        const BalanceCallback &onReply,
        const std::string &address)
{
    auto onAccount = [onError, onReply](const rpc::GetAccountInfoResponse &reply)
    {
        if (!reply.has_account_data() || !reply.account_data().has_balance())
            return onError(MALFORMED_RESPONSE_ERROR);
        onReply(reply.account_data().balance().drops());
    };
    accountInfoFetch(onError, onAccount, address);
}

void
TransactionSubmissionClient::accountExists(const StatusCallback &onError,
        const AccountExistsCallback &onReply,
        const std::string &address)
{
    auto onAccountError = [onError, onReply](Status s)
    {
        if (XPC_CC_InvalidAddress != s.value() && accountMissing(s))
            return onReply(false);
        onError(s);
    };
    auto onAccount = [onReply](const rpc::GetAccountInfoResponse &)
    {
        onReply(true);
    };
    accountInfoFetch(onAccountError, onAccount, address);
}

void
TransactionSubmissionClient::ledgerSequenceFetch(const StatusCallback &onError,
        const LedgerIndexCallback &onReply)
{
    auto onSequence = [onReply](
                          const rpc::GetLatestValidatedLedgerSequenceResponse &reply)
    {
        onReply(reply.ledger_index());
    };
    network_.ledgerSequenceFetch(onError, onSequence,
                                 rpc::GetLatestValidatedLedgerSequenceRequest());
}

void
TransactionSubmissionClient::transactionStatusFetch(
    const StatusCallback &onError,
    const TransactionStatusCallback &onReply,
    const std::string &hash)
{
    rpc::GetTransactionStatusRequest request;
    std::string hashData;
    auto s = hashDecode(hashData, hash);
    if (!s)
        return onError(s);
    request.set_hash(hashData);

    network_.transactionStatusFetch(onError, onReply, request);
}

void
TransactionSubmissionClient::paymentStatusFetch(const StatusCallback &onError,
        const PaymentStatusCallback &onReply,
        const std::string &hash)
{
    auto onStatus = [onReply](const rpc::GetTransactionStatusResponse &reply)
    {
        if (!reply.validated())
            return onReply(TransactionStatus::pending);

        const auto &code = reply.transaction_status_code();
        if (0 == code.compare(0, 3, "tes"))
            onReply(TransactionStatus::succeeded);
        else
            onReply(TransactionStatus::failed);
    };
    transactionStatusFetch(onError, onStatus, hash);
}

void
TransactionSubmissionClient::accountInfoFetch(const StatusCallback &onError,
        const AccountInfoCallback &onReply,
        const std::string &address)
{
    XAddress decoded;
    if (!xAddressDecode(decoded, address))
        return onError(INVALID_ADDRESS_ERROR);

    rpc::GetAccountInfoRequest request;
    request.mutable_account()->set_address(decoded.classicAddress);
    network_.accountInfoFetch(onError, onReply, request);
}

} // namespace xpcd
