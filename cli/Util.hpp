/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../xpcd/ledger/Signer.hpp"

struct Session;

/**
 * This tool holds no keys, so lookups get a signer that always refuses.
 */
class OfflineSigner:
    public xpcd::ISigner
{
public:
    xpcd::Status
    sign(xpcd::DataChunk &result, const xpcd::rpc::Transaction &transaction,
         const xpcd::Wallet &wallet) override;
};

/**
 * Runs the session's backend until `done` goes true,
 * or the configured timeout passes.
 */
xpcd::Status
sessionWait(Session &session, const bool &done);

#endif
