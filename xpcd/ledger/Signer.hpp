/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_LEDGER_SIGNER_HPP
#define XPCD_LEDGER_SIGNER_HPP

#include "../network/Typedefs.hpp"
#include "../util/Data.hpp"

namespace xpcd {

/**
 * The public half of a sending account.
 * The private key never leaves the signer.
 */
struct Wallet
{
    /// The account's X-Address.
    std::string address;
    /// Hex-encoded public key.
    std::string publicKey;
};

/**
 * Turns an assembled transaction into signed wire bytes.
 */
class ISigner
{
public:
    virtual ~ISigner() {}

    /**
     * Signs a transaction on behalf of the wallet.
     * The signer fills in the signing key itself.
     * Anything thrown counts as a signing failure.
     */
    virtual Status
    sign(DataChunk &result, const rpc::Transaction &transaction,
         const Wallet &wallet) = 0;
};

} // namespace xpcd

#endif
