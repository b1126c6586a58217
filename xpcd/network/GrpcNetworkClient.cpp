/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "GrpcNetworkClient.hpp"
#include "../util/Debug.hpp"
#include <string.h>

namespace xpcd {

// The completion queue has no file descriptor to sleep on, so poll it:
constexpr SleepTime pollInterval(10);

namespace {

template<typename Reply>
struct PendingCall:
    public GrpcNetworkClient::Pending
{
    PendingCall(const char *method, const StatusCallback &onError,
                const std::function<void (const Reply &)> &onReply):
        method(method),
        onError(onError),
        onReply(onReply)
    {}

    void
    complete(bool ok) override
    {
        if (!ok)
            return onError(XPC_ERROR(XPC_CC_NetworkError,
                                     std::string(method) + " did not complete"));

        if (!status.ok())
        {
            XPC_DebugLog("gRPC %s failed (%d): %s", method,
                         status.error_code(), status.error_message().c_str());
            return onError(XPC_ERROR(XPC_CC_NetworkError,
                                     std::string(method) + ": " + status.error_message()));
        }

        onReply(reply);
    }

    const char *method;
    StatusCallback onError;
    std::function<void (const Reply &)> onReply;
    Reply reply;
    std::unique_ptr<grpc::ClientAsyncResponseReader<Reply>> reader;
};

} // namespace

GrpcNetworkClient::~GrpcNetworkClient()
{
    // Callbacks run below may try to start new calls:
    closing_ = true;
    for (auto *pending: pending_)
        pending->context.TryCancel();
    queue_.Shutdown();

    // Cancelled calls still come out of the queue, and report their errors:
    void *tag;
    bool ok;
    while (queue_.Next(&tag, &ok))
        finish(tag, ok);
}

GrpcNetworkClient::GrpcNetworkClient(const std::string &endpoint):
    uri_(endpoint)
{
    std::string target = endpoint;
    std::shared_ptr<grpc::ChannelCredentials> credentials;
    if (0 == endpoint.compare(0, strlen(grpcSecureScheme), grpcSecureScheme))
    {
        target = endpoint.substr(strlen(grpcSecureScheme));
        credentials = grpc::SslCredentials(grpc::SslCredentialsOptions());
    }
    else
    {
        credentials = grpc::InsecureChannelCredentials();
    }

    // Channels connect lazily, on the first call:
    channel_ = grpc::CreateChannel(target, credentials);
    stub_ = rpc::XRPLedgerAPIService::NewStub(channel_);
}

std::string
GrpcNetworkClient::uri()
{
    return uri_;
}

Status
GrpcNetworkClient::wakeup(SleepTime &sleep)
{
    void *tag;
    bool ok;
    while (grpc::CompletionQueue::GOT_EVENT ==
            queue_.AsyncNext(&tag, &ok, std::chrono::system_clock::now()))
        finish(tag, ok);

    sleep = pending_.empty() ? SleepTime(0) : pollInterval;
    return Status();
}

void
GrpcNetworkClient::accountInfoFetch(const StatusCallback &onError,
                                    const AccountInfoCallback &onReply,
                                    const rpc::GetAccountInfoRequest &request)
{
    auto start = [this, &request](grpc::ClientContext *context,
                                  grpc::CompletionQueue *queue)
    {
        return stub_->AsyncGetAccountInfo(context, request, queue);
    };
    sendCall<rpc::GetAccountInfoResponse>("GetAccountInfo", onError, onReply,
                                          start);
}

void
GrpcNetworkClient::feeFetch(const StatusCallback &onError,
                            const FeeCallback &onReply,
                            const rpc::GetFeeRequest &request)
{
    auto start = [this, &request](grpc::ClientContext *context,
                                  grpc::CompletionQueue *queue)
    {
        return stub_->AsyncGetFee(context, request, queue);
    };
    sendCall<rpc::GetFeeResponse>("GetFee", onError, onReply, start);
}

void
GrpcNetworkClient::transactionSubmit(const StatusCallback &onError,
                                     const SubmitCallback &onReply,
                                     const rpc::SubmitTransactionRequest &request)
{
    auto start = [this, &request](grpc::ClientContext *context,
                                  grpc::CompletionQueue *queue)
    {
        return stub_->AsyncSubmitTransaction(context, request, queue);
    };
    sendCall<rpc::SubmitTransactionResponse>("SubmitTransaction",
            onError, onReply, start);
}

void
GrpcNetworkClient::ledgerSequenceFetch(const StatusCallback &onError,
                                       const LedgerSequenceCallback &onReply,
                                       const rpc::GetLatestValidatedLedgerSequenceRequest &request)
{
    auto start = [this, &request](grpc::ClientContext *context,
                                  grpc::CompletionQueue *queue)
    {
        return stub_->AsyncGetLatestValidatedLedgerSequence(context, request,
                queue);
    };
    sendCall<rpc::GetLatestValidatedLedgerSequenceResponse>(
        "GetLatestValidatedLedgerSequence", onError, onReply, start);
}

void
GrpcNetworkClient::transactionStatusFetch(const StatusCallback &onError,
        const TransactionStatusCallback &onReply,
        const rpc::GetTransactionStatusRequest &request)
{
    auto start = [this, &request](grpc::ClientContext *context,
                                  grpc::CompletionQueue *queue)
    {
        return stub_->AsyncGetTransactionStatus(context, request, queue);
    };
    sendCall<rpc::GetTransactionStatusResponse>("GetTransactionStatus",
            onError, onReply, start);
}

template<typename Reply, typename Start> void
GrpcNetworkClient::sendCall(const char *method, const StatusCallback &onError,
                            const std::function<void (const Reply &)> &onReply,
                            Start start)
{
    if (closing_)
        return onError(XPC_ERROR(XPC_CC_NetworkError, "Connection closed"));

    XPC_DebugLevel(1, "gRPC %s to %s", method, uri_.c_str());

    std::unique_ptr<PendingCall<Reply>> pending(
        new PendingCall<Reply>(method, onError, onReply));
    pending->reader = start(&pending->context, &queue_);
    pending->reader->Finish(&pending->reply, &pending->status,
                            static_cast<Pending *>(pending.get()));

    // The queue now refers to the call, so it lives until `finish`:
    pending_.insert(pending.release());
}

void
GrpcNetworkClient::finish(void *tag, bool ok)
{
    std::unique_ptr<Pending> pending(static_cast<Pending *>(tag));
    pending_.erase(pending.get());
    pending->complete(ok);
}

} // namespace xpcd
