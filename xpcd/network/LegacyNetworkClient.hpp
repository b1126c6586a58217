/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_NETWORK_LEGACY_NETWORK_CLIENT_HPP
#define XPCD_NETWORK_LEGACY_NETWORK_CLIENT_HPP

#include "GrpcWeb.hpp"
#include "INetworkClient.hpp"
#include <curl/curl.h>
#include <map>
#include <memory>

namespace xpcd {

/**
 * Legacy reply decoders.
 * Each parses a legacy reply message and translates it into the
 * current protocol's type. Fields the legacy reply lacks stay unset.
 * A drops string that is not a decimal number, or a sequence number
 * wider than 32 bits, is a malformed response.
 * An unparsable message is a network error.
 */
Status
legacyAccountInfoDecode(rpc::GetAccountInfoResponse &result,
                        const std::string &message);

Status
legacyFeeDecode(rpc::GetFeeResponse &result, const std::string &message);

Status
legacySubmitDecode(rpc::SubmitTransactionResponse &result,
                   const std::string &message);

Status
legacyLedgerSequenceDecode(rpc::GetLatestValidatedLedgerSequenceResponse &result,
                           const std::string &message);

Status
legacyTransactionStatusDecode(rpc::GetTransactionStatusResponse &result,
                              const std::string &message);

/**
 * Talks to a ledger node using the legacy protocol,
 * carried as gRPC-Web over plain HTTP.
 * Replies are translated into the current protocol's types.
 */
class LegacyNetworkClient:
    public INetworkClient
{
public:
    ~LegacyNetworkClient();

    /**
     * Prepares the HTTP transport without connecting.
     * @param endpoint the server's base URL, such as `https://host:port`.
     * @param certPath an optional CA bundle for verifying the server.
     */
    LegacyNetworkClient(const std::string &endpoint,
                        const std::string &certPath="");

    // INetworkClient interface:
    std::string
    uri() override;

    Status
    wakeup(SleepTime &sleep) override;

    void
    accountInfoFetch(const StatusCallback &onError,
                     const AccountInfoCallback &onReply,
                     const rpc::GetAccountInfoRequest &request) override;

    void
    feeFetch(const StatusCallback &onError,
             const FeeCallback &onReply,
             const rpc::GetFeeRequest &request) override;

    void
    transactionSubmit(const StatusCallback &onError,
                      const SubmitCallback &onReply,
                      const rpc::SubmitTransactionRequest &request) override;

    void
    ledgerSequenceFetch(const StatusCallback &onError,
                        const LedgerSequenceCallback &onReply,
                        const rpc::GetLatestValidatedLedgerSequenceRequest &request) override;

    void
    transactionStatusFetch(const StatusCallback &onError,
                           const TransactionStatusCallback &onReply,
                           const rpc::GetTransactionStatusRequest &request) override;

private:
    typedef std::function<Status (const std::string &message)> Decoder;

    struct Pending
    {
        ~Pending();

        const char *method;
        CURL *handle = nullptr;
        struct curl_slist *headers = nullptr;
        std::string body;
        std::string reply;
        std::string replyHeaders;
        StatusCallback onError;
        Decoder decoder;
    };

    // Transport:
    Status status_;
    std::string uri_;
    std::string certPath_;
    CURLM *multi_ = nullptr;
    std::map<CURL *, std::unique_ptr<Pending>> pending_;
    bool closing_ = false;

    /**
     * Posts a serialized request and sets up the reply decoder.
     * If anything goes wrong (including errors returned by the decoder),
     * the error callback will be called.
     */
    void
    sendMessage(const char *method, const std::string &message,
                const StatusCallback &onError, const Decoder &decoder);

    Status
    prepare(Pending &pending);

    /**
     * Checks a finished transfer and hands its message to the decoder.
     */
    Status
    handleReply(Pending &pending, CURLcode code);
};

} // namespace xpcd

#endif
