/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * General network data types.
 */

#ifndef XPCD_NETWORK_TYPEDEFS_HPP
#define XPCD_NETWORK_TYPEDEFS_HPP

#include "../util/Status.hpp"
#include "org/xrpl/rpc/v1/xrp_ledger.pb.h"
#include <chrono>
#include <functional>

namespace xpcd {

/**
 * The current ledger protocol types, shared by every backend.
 */
namespace rpc = org::xrpl::rpc::v1;

typedef std::chrono::milliseconds SleepTime;

typedef std::function<void (Status)> StatusCallback;

typedef std::function<void (const rpc::GetAccountInfoResponse &reply)>
AccountInfoCallback;
typedef std::function<void (const rpc::GetFeeResponse &reply)>
FeeCallback;
typedef std::function<void (const rpc::SubmitTransactionResponse &reply)>
SubmitCallback;
typedef std::function<void (const rpc::GetLatestValidatedLedgerSequenceResponse &reply)>
LedgerSequenceCallback;
typedef std::function<void (const rpc::GetTransactionStatusResponse &reply)>
TransactionStatusCallback;

} // namespace xpcd

#endif
