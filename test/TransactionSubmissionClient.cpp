/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "fakes/FakeNetworkClient.hpp"
#include "fakes/FakeSigner.hpp"
#include "../xpcd/ledger/TransactionSubmissionClient.hpp"
#include "../xpcd/network/EventLoop.hpp"
#include <catch2/catch.hpp>
#include <algorithm>

using namespace xpcd;

static const char senderAddress[] =
    "XVYUQ3SdUcVnaTNVanDYo1NamrUukPUPeoGMnmvkEExbtrj";
static const char senderClassic[] = "rLNaPoKeeBjZe2qs6x52yVPZpZ8td4dc6w";
static const char destinationAddress[] =
    "X7cBcY4bdTTzk3LHmrKAK6GyrirkXfLHGFxzke5zTmYMfw4";
static const char destinationClassic[] = "rsegqrgSP8XmhCYwL9enkZ9BNDNawfPZnn";
static const char taggedAddress[] =
    "XVLhHMPHU98es4dbozjVtdWzVrDjtV18pX8yuPT7y4xaEHi";
static const char badAddress[] = "rsegqrgSP8XmhCYwL9enkZ9BNDNawfPZnn";
static const char transactionHash[] =
    "DEADBEEFDEADBEEFDEADBEEFDEADBEEFDEADBEEFDEADBEEFDEADBEEFDEADBEEF";

static const Wallet sender = {senderAddress, "0123"};

/**
 * Captures whichever callback an operation fires.
 */
template<typename T>
struct Result
{
    unsigned calls = 0;
    Status error;
    T value = T();

    StatusCallback
    onError()
    {
        return [this](Status s)
        {
            ++calls;
            error = s;
        };
    }

    std::function<void (const T &)>
    onReply()
    {
        return [this](const T &v)
        {
            ++calls;
            value = v;
        };
    }
};

/**
 * Fails the test if anything touches the network.
 */
class UnreachableNetworkClient:
    public FakeNetworkClient
{
public:
    void
    accountInfoFetch(const StatusCallback &onError,
                     const AccountInfoCallback &onReply,
                     const rpc::GetAccountInfoRequest &request) override
    {
        FAIL("accountInfoFetch called");
    }

    void
    feeFetch(const StatusCallback &onError,
             const FeeCallback &onReply,
             const rpc::GetFeeRequest &request) override
    {
        FAIL("feeFetch called");
    }

    void
    transactionSubmit(const StatusCallback &onError,
                      const SubmitCallback &onReply,
                      const rpc::SubmitTransactionRequest &request) override
    {
        FAIL("transactionSubmit called");
    }

    void
    transactionStatusFetch(const StatusCallback &onError,
                           const TransactionStatusCallback &onReply,
                           const rpc::GetTransactionStatusRequest &request) override
    {
        FAIL("transactionStatusFetch called");
    }
};

/**
 * Holds lookups until the next wakeup, like a real backend.
 */
class DeferredNetworkClient:
    public FakeNetworkClient
{
public:
    Status
    wakeup(SleepTime &sleep) override
    {
        auto work = std::move(queue);
        queue.clear();
        if (reverse)
            std::reverse(work.begin(), work.end());
        for (auto &f: work)
            f();

        sleep = queue.empty() ? SleepTime(0) : SleepTime(1);
        return Status();
    }

    void
    accountInfoFetch(const StatusCallback &onError,
                     const AccountInfoCallback &onReply,
                     const rpc::GetAccountInfoRequest &request) override
    {
        queue.push_back([=]()
        {
            FakeNetworkClient::accountInfoFetch(onError, onReply, request);
        });
    }

    void
    feeFetch(const StatusCallback &onError,
             const FeeCallback &onReply,
             const rpc::GetFeeRequest &request) override
    {
        queue.push_back([=]()
        {
            FakeNetworkClient::feeFetch(onError, onReply, request);
        });
    }

    std::vector<std::function<void ()>> queue;
    bool reverse = false;
};

TEST_CASE("Balance lookup", "[ledger][balance]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<uint64_t> result;

    SECTION("success")
    {
        client.balanceFetch(result.onError(), result.onReply(), senderAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(result.error);
        REQUIRE(4000 == result.value);
        REQUIRE(senderClassic ==
                network.lastAccountInfoRequest.account().address());
    }
    SECTION("missing balance")
    {
        network.responses.accountInfo.value.mutable_account_data()->clear_balance();
        client.balanceFetch(result.onError(), result.onReply(), senderAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(XPC_CC_MalformedResponse == result.error.value());
        REQUIRE("Malformed Response." == result.error.message());
    }
    SECTION("missing account data")
    {
        network.responses.accountInfo.value.clear_account_data();
        client.balanceFetch(result.onError(), result.onReply(), senderAddress);
        REQUIRE(XPC_CC_MalformedResponse == result.error.value());
    }
}

TEST_CASE("Account existence", "[ledger][balance]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<bool> result;

    SECTION("known account")
    {
        client.accountExists(result.onError(), result.onReply(), senderAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(result.error);
        REQUIRE(result.value);
    }
    SECTION("unknown account")
    {
        network.responses.accountInfo =
            XPC_ERROR(XPC_CC_NetworkError, "GetAccountInfo: Account not found.");
        client.accountExists(result.onError(), result.onReply(), senderAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(result.error);
        REQUIRE_FALSE(result.value);
    }
    SECTION("other failures")
    {
        network.responses.accountInfo = FakeNetworkClient::defaultError();
        client.accountExists(result.onError(), result.onReply(), senderAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(XPC_CC_NetworkError == result.error.value());
    }
}

TEST_CASE("Ledger lookups", "[ledger][status]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);

    SECTION("ledger sequence")
    {
        Result<uint32_t> result;
        client.ledgerSequenceFetch(result.onError(), result.onReply());
        REQUIRE(1 == result.calls);
        REQUIRE(12 == result.value);
    }
    SECTION("raw status")
    {
        Result<rpc::GetTransactionStatusResponse> result;
        client.transactionStatusFetch(result.onError(), result.onReply(),
                                      transactionHash);
        REQUIRE(1 == result.calls);
        REQUIRE(result.error);
        REQUIRE(result.value.validated());
        REQUIRE("tesSUCCESS" == result.value.transaction_status_code());
        REQUIRE(32 == network.lastTransactionStatusRequest.hash().size());
    }
    SECTION("bad hash")
    {
        Result<rpc::GetTransactionStatusResponse> result;
        client.transactionStatusFetch(result.onError(), result.onReply(),
                                      "DEADBEEF");
        REQUIRE(1 == result.calls);
        REQUIRE(XPC_CC_NetworkError == result.error.value());
        REQUIRE(0 == network.transactionStatusCalls);
    }
}

TEST_CASE("Payment status", "[ledger][status]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<TransactionStatus> result;
    auto &status = network.responses.transactionStatus.value;

    SECTION("succeeded")
    {
        client.paymentStatusFetch(result.onError(), result.onReply(),
                                  transactionHash);
        REQUIRE(TransactionStatus::succeeded == result.value);
    }
    SECTION("pending")
    {
        status.set_validated(false);
        client.paymentStatusFetch(result.onError(), result.onReply(),
                                  transactionHash);
        REQUIRE(TransactionStatus::pending == result.value);
    }
    SECTION("failed")
    {
        status.set_transaction_status_code("tecUNFUNDED_PAYMENT");
        client.paymentStatusFetch(result.onError(), result.onReply(),
                                  transactionHash);
        REQUIRE(TransactionStatus::failed == result.value);
    }
    REQUIRE(1 == result.calls);
    REQUIRE(result.error);
}

TEST_CASE("Bad hashes fail like a node would", "[ledger][status]")
{
    UnreachableNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<TransactionStatus> result;

    SECTION("too short")
    {
        client.paymentStatusFetch(result.onError(), result.onReply(), "DEADBEEF");
    }
    SECTION("not hex")
    {
        client.paymentStatusFetch(result.onError(), result.onReply(),
                                  std::string(64, 'Z'));
    }

    REQUIRE(1 == result.calls);
    REQUIRE(XPC_CC_NetworkError == result.error.value());
    REQUIRE_THAT(result.error.message(),
                 Catch::StartsWith("Bad transaction hash "));
}

TEST_CASE("Failing backend", "[ledger]")
{
    FakeNetworkClient network(FakeNetworkClient::defaultErrorResponses());
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    const auto expected = FakeNetworkClient::defaultError();
    Status error;
    unsigned calls = 0;
    auto onError = [&](Status s)
    {
        ++calls;
        error = s;
    };

    SECTION("send")
    {
        client.send(onError, [](const rpc::SubmitTransactionResponse &) {},
                    sender, 1, destinationAddress);
        REQUIRE(0 == signer.calls);
    }
    SECTION("balance")
    {
        client.balanceFetch(onError, [](uint64_t) {}, senderAddress);
    }
    SECTION("account exists")
    {
        client.accountExists(onError, [](bool) {}, senderAddress);
    }
    SECTION("ledger sequence")
    {
        client.ledgerSequenceFetch(onError, [](uint32_t) {});
    }
    SECTION("transaction status")
    {
        client.transactionStatusFetch(onError,
            [](const rpc::GetTransactionStatusResponse &) {}, transactionHash);
    }
    SECTION("payment status")
    {
        client.paymentStatusFetch(onError, [](TransactionStatus) {},
                                  transactionHash);
    }

    REQUIRE(1 == calls);
    REQUIRE(expected.value() == error.value());
    REQUIRE(expected.message() == error.message());
}

TEST_CASE("Bad addresses never reach the network", "[ledger][address]")
{
    UnreachableNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Status error;
    unsigned calls = 0;
    auto onError = [&](Status s)
    {
        ++calls;
        error = s;
    };

    SECTION("send destination")
    {
        client.send(onError, [](const rpc::SubmitTransactionResponse &) {},
                    sender, 1, badAddress);
    }
    SECTION("send sender")
    {
        const Wallet badSender = {badAddress, "0123"};
        client.send(onError, [](const rpc::SubmitTransactionResponse &) {},
                    badSender, 1, destinationAddress);
    }
    SECTION("balance")
    {
        client.balanceFetch(onError, [](uint64_t) {}, badAddress);
    }
    SECTION("account exists")
    {
        client.accountExists(onError, [](bool) {}, "");
    }

    REQUIRE(1 == calls);
    REQUIRE(XPC_CC_InvalidAddress == error.value());
    REQUIRE("Please use the X-Address format. See: https://xrpaddress.info/." ==
            error.message());
    REQUIRE(0 == signer.calls);
}

TEST_CASE("Sending payments", "[ledger][send]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<rpc::SubmitTransactionResponse> result;

    SECTION("end to end")
    {
        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(result.error);
        REQUIRE("tesSUCCESS" == result.value.engine_result());
        REQUIRE("DEADBEEF" == result.value.transaction_blob());

        // What the signer saw:
        const auto &transaction = signer.lastTransaction;
        REQUIRE(1 == signer.calls);
        REQUIRE(10 == transaction.fee().drops());
        REQUIRE(12 == transaction.sequence());
        REQUIRE(senderClassic == transaction.account().address());
        REQUIRE(1 == transaction.payment().amount().drops());
        REQUIRE(destinationClassic ==
                transaction.payment().destination().address());
        REQUIRE_FALSE(transaction.payment().has_destination_tag());
        REQUIRE(senderAddress == signer.lastWallet.address);

        // What went out:
        REQUIRE(1 == network.submitCalls);
        REQUIRE(std::string("\x12\x00\x00\x22", 4) ==
                network.lastSubmitRequest.signed_transaction());
    }
    SECTION("destination tag and memos")
    {
        rpc::Memo memo;
        memo.set_memo_data("hello");
        memo.set_memo_type("text");
        client.send(result.onError(), result.onReply(),
                    sender, 25, taggedAddress, {memo});
        REQUIRE(result.error);

        const auto &transaction = signer.lastTransaction;
        REQUIRE("rGWrZyQqhTp9Xu7G5Pkayo7bXjH4k4QYpf" ==
                transaction.payment().destination().address());
        REQUIRE(transaction.payment().has_destination_tag());
        REQUIRE(4294967295u == transaction.payment().destination_tag());
        REQUIRE(1 == transaction.memos_size());
        REQUIRE("hello" == transaction.memos(0).memo_data());
    }
    SECTION("submission failure passes through")
    {
        network.responses.submit =
            XPC_ERROR(XPC_CC_NetworkError, "tefPAST_SEQ");
        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE(1 == result.calls);
        REQUIRE(XPC_CC_NetworkError == result.error.value());
        REQUIRE("tefPAST_SEQ" == result.error.message());
    }
}

TEST_CASE("Malformed lookups stop the send", "[ledger][send]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<rpc::SubmitTransactionResponse> result;

    SECTION("missing fee set")
    {
        network.responses.fee.value.clear_drops();
    }
    SECTION("missing minimum fee")
    {
        network.responses.fee.value.mutable_drops()->clear_minimum_fee();
    }
    SECTION("missing sequence")
    {
        network.responses.accountInfo.value.mutable_account_data()->clear_sequence();
    }
    SECTION("missing account data")
    {
        network.responses.accountInfo.value.clear_account_data();
    }

    client.send(result.onError(), result.onReply(),
                sender, 1, destinationAddress);
    REQUIRE(1 == result.calls);
    REQUIRE(XPC_CC_MalformedResponse == result.error.value());
    REQUIRE("Malformed Response." == result.error.message());
    REQUIRE(0 == signer.calls);
    REQUIRE(0 == network.submitCalls);
}

TEST_CASE("Signing failures", "[ledger][send]")
{
    FakeNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<rpc::SubmitTransactionResponse> result;

    SECTION("thrown")
    {
        signer.mode = FakeSigner::Mode::throwError;
        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE_THAT(result.error.message(),
                     Catch::StartsWith("Unable to sign the transaction. ") &&
                     Catch::Contains("fake signer exception"));
    }
    SECTION("thrown non-exception value")
    {
        signer.mode = FakeSigner::Mode::throwValue;
        REQUIRE_NOTHROW(client.send(result.onError(), result.onReply(),
                                    sender, 1, destinationAddress));
        REQUIRE_THAT(result.error.message(),
                     Catch::StartsWith("Unable to sign the transaction"));
    }
    SECTION("returned")
    {
        signer.mode = FakeSigner::Mode::fail;
        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE_THAT(result.error.message(),
                     Catch::Contains("fake signer failure"));
    }
    SECTION("empty")
    {
        signer.mode = FakeSigner::Mode::empty;
        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE("Unable to sign the transaction" == result.error.message());
    }

    REQUIRE(1 == result.calls);
    REQUIRE(XPC_CC_SigningFailure == result.error.value());
    REQUIRE(0 == network.submitCalls);
}

TEST_CASE("Repeated sends are independent", "[ledger][send]")
{
    for (int i = 0; i < 2; ++i)
    {
        FakeNetworkClient network;
        FakeSigner signer;
        TransactionSubmissionClient client(network, signer);
        Result<rpc::SubmitTransactionResponse> result;

        client.send(result.onError(), result.onReply(),
                    sender, 1, destinationAddress);
        REQUIRE(1 == result.calls);
        REQUIRE("tesSUCCESS" == result.value.engine_result());
        REQUIRE(1 == network.submitCalls);
    }
}

TEST_CASE("Fee and account lookups run together", "[ledger][send]")
{
    DeferredNetworkClient network;
    FakeSigner signer;
    TransactionSubmissionClient client(network, signer);
    Result<rpc::SubmitTransactionResponse> result;
    bool done = false;
    auto onError = [&](Status s)
    {
        result.onError()(s);
        done = true;
    };
    auto onReply = [&](const rpc::SubmitTransactionResponse &reply)
    {
        result.onReply()(reply);
        done = true;
    };

    SECTION("fee first")
    {
        client.send(onError, onReply, sender, 1, destinationAddress);
        REQUIRE(2 == network.queue.size());
        REQUIRE(eventLoopRun(network, done, SleepTime(1000)));
        REQUIRE(result.error);
        REQUIRE(10 == signer.lastTransaction.fee().drops());
    }
    SECTION("account first")
    {
        network.reverse = true;
        client.send(onError, onReply, sender, 1, destinationAddress);
        REQUIRE(eventLoopRun(network, done, SleepTime(1000)));
        REQUIRE(result.error);
        REQUIRE(12 == signer.lastTransaction.sequence());
    }
    SECTION("late replies after a failure")
    {
        network.responses.fee = FakeNetworkClient::defaultError();
        client.send(onError, onReply, sender, 1, destinationAddress);
        REQUIRE(2 == network.queue.size());
        REQUIRE(eventLoopRun(network, done, SleepTime(1000)));
        REQUIRE(XPC_CC_NetworkError == result.error.value());
        REQUIRE(1 == network.accountInfoCalls);
        REQUIRE(0 == signer.calls);
    }
    SECTION("failure after the other lookup")
    {
        network.reverse = true;
        network.responses.fee = FakeNetworkClient::defaultError();
        client.send(onError, onReply, sender, 1, destinationAddress);
        REQUIRE(eventLoopRun(network, done, SleepTime(1000)));
        REQUIRE(XPC_CC_NetworkError == result.error.value());
        REQUIRE(0 == signer.calls);
    }

    REQUIRE(1 == result.calls);
}
