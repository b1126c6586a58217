/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "LegacyNetworkClient.hpp"
#include "../crypto/Encoding.hpp"
#include "../http/Http.hpp"
#include "../ledger/Amount.hpp"
#include "../util/Debug.hpp"
#include "io/xpring/legacy.pb.h"
#include <limits>

namespace xpcd {

namespace legacy = io::xpring;

#define TIMEOUT 10

// Curl only hands us a socket set, so poll it:
constexpr SleepTime pollInterval(10);

constexpr auto legacyService = "/io.xpring.XRPLedgerAPI/";

static Status curlOk(CURLcode code)
{
    if (code)
    {
        std::string message("cURL error: ");
        if (curl_easy_strerror(code))
            message += curl_easy_strerror(code);
        else
            message += std::to_string(code);
        return XPC_ERROR(XPC_CC_NetworkError, message);
    }
    return Status();
}

#define XPC_CHECK_CURL(code) XPC_CHECK(curlOk(code))

static size_t
curlDataCallback(void *data, size_t memberSize, size_t numMembers,
                 void *userData)
{
    auto size = numMembers * memberSize;

    auto string = static_cast<std::string *>(userData);
    string->append(static_cast<char *>(data), size);

    return size;
}

/**
 * Legacy servers send amounts as decimal strings.
 */
static Status
legacyDropsDecode(uint64_t &result, const legacy::XRPAmount &amount)
{
    if (!dropsDecode(result, amount.drops()))
        return XPC_ERROR(XPC_CC_MalformedResponse,
                         "Bad drops amount " + amount.drops());
    return Status();
}

LegacyNetworkClient::Pending::~Pending()
{
    if (handle) curl_easy_cleanup(handle);
    if (headers) curl_slist_free_all(headers);
}

LegacyNetworkClient::~LegacyNetworkClient()
{
    // Callbacks run below may try to start new calls:
    closing_ = true;
    for (auto &i: pending_)
    {
        curl_multi_remove_handle(multi_, i.first);
        i.second->onError(XPC_ERROR(XPC_CC_NetworkError, "Connection closed"));
    }
    pending_.clear();

    if (multi_)
        curl_multi_cleanup(multi_);
}

LegacyNetworkClient::LegacyNetworkClient(const std::string &endpoint,
        const std::string &certPath):
    uri_(endpoint),
    certPath_(certPath)
{
    while (!uri_.empty() && '/' == uri_.back())
        uri_.pop_back();

    // The HTTP transport needs its process-wide setup first:
    status_ = httpInit();
    if (!status_)
        return;

    multi_ = curl_multi_init();
    if (!multi_)
        status_ = XPC_ERROR(XPC_CC_SysError, "cURL failed create multi handle");
}

std::string
LegacyNetworkClient::uri()
{
    return uri_;
}

Status
LegacyNetworkClient::wakeup(SleepTime &sleep)
{
    XPC_CHECK(status_);

    int running = 0;
    auto mc = curl_multi_perform(multi_, &running);
    if (CURLM_OK != mc)
        return XPC_ERROR(XPC_CC_NetworkError, curl_multi_strerror(mc));

    // Handle any transfers that have finished:
    int left = 0;
    CURLMsg *message;
    while ((message = curl_multi_info_read(multi_, &left)))
    {
        if (CURLMSG_DONE != message->msg)
            continue;

        CURL *handle = message->easy_handle;
        const CURLcode code = message->data.result;
        auto i = pending_.find(handle);
        if (pending_.end() == i)
            continue;

        std::unique_ptr<Pending> pending(std::move(i->second));
        pending_.erase(i);
        curl_multi_remove_handle(multi_, handle);

        auto s = handleReply(*pending, code);
        if (!s)
            pending->onError(s);
    }

    sleep = pending_.empty() ? SleepTime(0) : pollInterval;
    return Status();
}

Status
legacyAccountInfoDecode(rpc::GetAccountInfoResponse &result,
                        const std::string &message)
{
    legacy::AccountInfo reply;
    if (!reply.ParseFromString(message))
        return XPC_ERROR(XPC_CC_NetworkError, "Bad AccountInfo reply");

    rpc::GetAccountInfoResponse out;
    auto *accountData = out.mutable_account_data();
    if (reply.has_balance())
    {
        uint64_t drops;
        XPC_CHECK(legacyDropsDecode(drops, reply.balance()));
        accountData->mutable_balance()->set_drops(drops);
    }
    if (reply.has_sequence())
    {
        if (std::numeric_limits<uint32_t>::max() < reply.sequence())
            return XPC_ERROR(XPC_CC_MalformedResponse,
                             "Sequence number out of range");
        accountData->set_sequence(reply.sequence());
    }
    accountData->set_flags(reply.flags());

    result = std::move(out);
    return Status();
}

Status
legacyFeeDecode(rpc::GetFeeResponse &result, const std::string &message)
{
    legacy::Fee reply;
    if (!reply.ParseFromString(message))
        return XPC_ERROR(XPC_CC_NetworkError, "Bad Fee reply");

    rpc::GetFeeResponse out;
    if (reply.has_amount())
    {
        uint64_t drops;
        XPC_CHECK(legacyDropsDecode(drops, reply.amount()));
        out.mutable_drops()->mutable_minimum_fee()->set_drops(drops);
    }

    result = std::move(out);
    return Status();
}

Status
legacySubmitDecode(rpc::SubmitTransactionResponse &result,
                   const std::string &message)
{
    legacy::SubmitSignedTransactionResponse reply;
    if (!reply.ParseFromString(message))
        return XPC_ERROR(XPC_CC_NetworkError,
                         "Bad SubmitSignedTransaction reply");

    result.Clear();
    result.set_engine_result(reply.engine_result());
    result.set_engine_result_code(reply.engine_result_code());
    result.set_engine_result_message(reply.engine_result_message());
    result.set_transaction_blob(reply.transaction_blob());
    return Status();
}

Status
legacyLedgerSequenceDecode(rpc::GetLatestValidatedLedgerSequenceResponse &result,
                           const std::string &message)
{
    legacy::LedgerSequence reply;
    if (!reply.ParseFromString(message))
        return XPC_ERROR(XPC_CC_NetworkError, "Bad LedgerSequence reply");
    if (std::numeric_limits<uint32_t>::max() < reply.index())
        return XPC_ERROR(XPC_CC_MalformedResponse,
                         "Ledger index out of range");

    result.Clear();
    result.set_ledger_index(reply.index());
    return Status();
}

Status
legacyTransactionStatusDecode(rpc::GetTransactionStatusResponse &result,
                              const std::string &message)
{
    legacy::TransactionStatus reply;
    if (!reply.ParseFromString(message))
        return XPC_ERROR(XPC_CC_NetworkError, "Bad TransactionStatus reply");

    result.Clear();
    result.set_validated(reply.validated());
    result.set_transaction_status_code(reply.transaction_status_code());
    result.set_last_ledger_sequence(reply.last_ledger_sequence());
    return Status();
}

void
LegacyNetworkClient::accountInfoFetch(const StatusCallback &onError,
                                      const AccountInfoCallback &onReply,
                                      const rpc::GetAccountInfoRequest &request)
{
    legacy::GetAccountInfoRequest query;
    query.set_address(request.account().address());

    auto decoder = [onReply](const std::string &message) -> Status
    {
        rpc::GetAccountInfoResponse out;
        XPC_CHECK(legacyAccountInfoDecode(out, message));
        onReply(out);
        return Status();
    };

    sendMessage("GetAccountInfo", query.SerializeAsString(), onError, decoder);
}

void
LegacyNetworkClient::feeFetch(const StatusCallback &onError,
                              const FeeCallback &onReply,
                              const rpc::GetFeeRequest &request)
{
    legacy::GetFeeRequest query;

    auto decoder = [onReply](const std::string &message) -> Status
    {
        rpc::GetFeeResponse out;
        XPC_CHECK(legacyFeeDecode(out, message));
        onReply(out);
        return Status();
    };

    sendMessage("GetFee", query.SerializeAsString(), onError, decoder);
}

void
LegacyNetworkClient::transactionSubmit(const StatusCallback &onError,
                                       const SubmitCallback &onReply,
                                       const rpc::SubmitTransactionRequest &request)
{
    legacy::SubmitSignedTransactionRequest query;
    query.set_signed_transaction_hex(base16Encode(request.signed_transaction()));

    auto decoder = [onReply](const std::string &message) -> Status
    {
        rpc::SubmitTransactionResponse out;
        XPC_CHECK(legacySubmitDecode(out, message));
        onReply(out);
        return Status();
    };

    sendMessage("SubmitSignedTransaction", query.SerializeAsString(),
                onError, decoder);
}

void
LegacyNetworkClient::ledgerSequenceFetch(const StatusCallback &onError,
        const LedgerSequenceCallback &onReply,
        const rpc::GetLatestValidatedLedgerSequenceRequest &request)
{
    legacy::GetLatestValidatedLedgerSequenceRequest query;

    auto decoder = [onReply](const std::string &message) -> Status
    {
        rpc::GetLatestValidatedLedgerSequenceResponse out;
        XPC_CHECK(legacyLedgerSequenceDecode(out, message));
        onReply(out);
        return Status();
    };

    sendMessage("GetLatestValidatedLedgerSequence", query.SerializeAsString(),
                onError, decoder);
}

void
LegacyNetworkClient::transactionStatusFetch(const StatusCallback &onError,
        const TransactionStatusCallback &onReply,
        const rpc::GetTransactionStatusRequest &request)
{
    legacy::GetTransactionStatusRequest query;
    query.set_transaction_hash(base16Encode(request.hash()));

    auto decoder = [onReply](const std::string &message) -> Status
    {
        rpc::GetTransactionStatusResponse out;
        XPC_CHECK(legacyTransactionStatusDecode(out, message));
        onReply(out);
        return Status();
    };

    sendMessage("GetTransactionStatus", query.SerializeAsString(),
                onError, decoder);
}

void
LegacyNetworkClient::sendMessage(const char *method,
                                 const std::string &message,
                                 const StatusCallback &onError,
                                 const Decoder &decoder)
{
    if (!status_)
        return onError(status_);
    if (closing_)
        return onError(XPC_ERROR(XPC_CC_NetworkError, "Connection closed"));

    std::unique_ptr<Pending> pending(new Pending);
    pending->method = method;
    pending->body = grpcWebEncode(message);
    pending->onError = onError;
    pending->decoder = decoder;

    auto s = prepare(*pending);
    if (!s)
        return onError(s);

    auto mc = curl_multi_add_handle(multi_, pending->handle);
    if (CURLM_OK != mc)
        return onError(XPC_ERROR(XPC_CC_NetworkError, curl_multi_strerror(mc)));

    XPC_DebugLevel(1, "gRPC-Web %s to %s", method, uri_.c_str());

    // The transfer is queued, so save the decoder:
    CURL *handle = pending->handle;
    pending_[handle] = std::move(pending);
}

Status
LegacyNetworkClient::prepare(Pending &pending)
{
    pending.handle = curl_easy_init();
    if (!pending.handle)
        return XPC_ERROR(XPC_CC_SysError, "cURL failed create handle");
    CURL *handle = pending.handle;

    // Basic options:
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, long(TIMEOUT)));
    if (!certPath_.empty())
        XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_CAINFO,
                                        certPath_.c_str()));

    // Headers:
    const std::string contentTypeHeader =
        std::string("Content-Type: ") + grpcWebContentType;
    const std::string acceptHeader =
        std::string("Accept: ") + grpcWebContentType;
    const char *headers[] =
    {
        contentTypeHeader.c_str(),
        acceptHeader.c_str(),
        "X-Grpc-Web: 1",
        "X-User-Agent: grpc-web-xpc/" XPC_VERSION
    };
    for (auto header: headers)
    {
        auto slist = curl_slist_append(pending.headers, header);
        if (!slist)
            return XPC_ERROR(XPC_CC_SysError, "cURL slist error");
        pending.headers = slist;
    }
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_HTTPHEADER, pending.headers));

    // Request body, which can contain zero bytes:
    const std::string url = uri_ + legacyService + pending.method;
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_URL, url.c_str()));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                                    long(pending.body.size())));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_POSTFIELDS,
                                    pending.body.data()));

    // Reply:
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION,
                                    curlDataCallback));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_WRITEDATA, &pending.reply));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION,
                                    curlDataCallback));
    XPC_CHECK_CURL(curl_easy_setopt(handle, CURLOPT_HEADERDATA,
                                    &pending.replyHeaders));

    return Status();
}

Status
LegacyNetworkClient::handleReply(Pending &pending, CURLcode code)
{
    XPC_CHECK_CURL(code);

    long httpCode = 0;
    XPC_CHECK_CURL(curl_easy_getinfo(pending.handle, CURLINFO_RESPONSE_CODE,
                                     &httpCode));
    if (httpCode < 200 || 300 <= httpCode)
    {
        XPC_DebugLog("%s%s (%ld)", uri_.c_str(), pending.method, httpCode);
        return XPC_ERROR(XPC_CC_NetworkError, "Bad HTTP status code " +
                         std::to_string(httpCode));
    }

    HeaderMap headers;
    grpcWebHeaderParse(headers, pending.replyHeaders);

    std::string message;
    XPC_CHECK(grpcWebDecode(message, pending.reply, headers));
    return pending.decoder(message);
}

} // namespace xpcd
