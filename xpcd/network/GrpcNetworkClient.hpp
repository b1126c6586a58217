/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_NETWORK_GRPC_NETWORK_CLIENT_HPP
#define XPCD_NETWORK_GRPC_NETWORK_CLIENT_HPP

#include "INetworkClient.hpp"
#include "org/xrpl/rpc/v1/xrp_ledger.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <set>

namespace xpcd {

// Scheme used for TLS gRPC endpoints:
constexpr auto grpcSecureScheme = "grpcs://";

/**
 * Talks to a ledger node over native gRPC using the current protocol.
 * Calls are queued on a completion queue,
 * and their callbacks run from `wakeup`.
 */
class GrpcNetworkClient:
    public INetworkClient
{
public:
    ~GrpcNetworkClient();

    /**
     * Prepares a channel to the given endpoint without connecting.
     * @param endpoint either `host:port` for a plaintext channel,
     * or `grpcs://host:port` for TLS.
     */
    GrpcNetworkClient(const std::string &endpoint);

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

    /**
     * An outstanding call. The completion queue tag points at one of these.
     */
    struct Pending
    {
        virtual ~Pending() {}

        /**
         * Runs the callbacks once the queue reports the call finished.
         */
        virtual void
        complete(bool ok) = 0;

        grpc::ClientContext context;
        grpc::Status status;
    };

private:
    std::string uri_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<rpc::XRPLedgerAPIService::Stub> stub_;
    grpc::CompletionQueue queue_;
    std::set<Pending *> pending_;
    bool closing_ = false;

    /**
     * Starts a call and registers it with the completion queue.
     * @param start issues the stub's async method.
     */
    template<typename Reply, typename Start> void
    sendCall(const char *method, const StatusCallback &onError,
             const std::function<void (const Reply &)> &onReply,
             Start start);

    /**
     * Removes one finished call from the queue and runs its callbacks.
     */
    void
    finish(void *tag, bool ok);
};

} // namespace xpcd

#endif
