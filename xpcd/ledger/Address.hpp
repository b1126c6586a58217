/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for dealing with ledger address formats.
 */

#ifndef XPCD_LEDGER_ADDRESS_HPP
#define XPCD_LEDGER_ADDRESS_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace xpcd {

#define ACCOUNT_ID_LENGTH 20

typedef DataArray<ACCOUNT_ID_LENGTH> AccountId;

/**
 * All the fields packed into an X-Address.
 */
struct XAddress
{
    std::string classicAddress;
    bool hasTag = false;
    uint32_t tag = 0;
    bool testnet = false;
};

/**
 * Returns true if the text is a well-formed X-Address.
 */
bool
xAddressOk(const std::string &text);

/**
 * Splits an X-Address into its classic address and destination tag.
 * Malformed text gives `XPC_CC_InvalidAddress`.
 */
Status
xAddressDecode(XAddress &result, const std::string &text);

/**
 * Packs a classic address and optional tag into an X-Address.
 */
Status
xAddressEncode(std::string &result, const XAddress &address);

/**
 * Extracts the account ID from an `r...` address.
 */
Status
classicAddressDecode(AccountId &result, const std::string &text);

std::string
classicAddressEncode(const AccountId &accountId);

} // namespace xpcd

#endif
