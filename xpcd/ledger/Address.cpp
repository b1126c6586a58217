/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Address.hpp"
#include "../crypto/Encoding.hpp"
#include <algorithm>

namespace xpcd {

/*
 * X-Address payload layout:
 * 2 prefix bytes | 20 byte account ID | tag flag | 8 byte little-endian tag
 */
constexpr size_t xAddressLength = 2 + ACCOUNT_ID_LENGTH + 1 + 8;
constexpr uint8_t mainnetPrefix[] = {0x05, 0x44};
constexpr uint8_t testnetPrefix[] = {0x04, 0x93};
constexpr uint8_t classicPrefix = 0x00;

bool
xAddressOk(const std::string &text)
{
    XAddress ignored;
    return static_cast<bool>(xAddressDecode(ignored, text));
}

Status
xAddressDecode(XAddress &result, const std::string &text)
{
    DataChunk payload;
    if (!base58CheckDecode(payload, text))
        return XPC_ERROR(XPC_CC_InvalidAddress, "Not an X-Address: " + text);
    if (xAddressLength != payload.size())
        return XPC_ERROR(XPC_CC_InvalidAddress, "Wrong X-Address length");

    XAddress out;
    if (std::equal(mainnetPrefix, mainnetPrefix + 2, payload.begin()))
        out.testnet = false;
    else if (std::equal(testnetPrefix, testnetPrefix + 2, payload.begin()))
        out.testnet = true;
    else
        return XPC_ERROR(XPC_CC_InvalidAddress, "Unknown X-Address prefix");

    AccountId accountId;
    std::copy(payload.begin() + 2, payload.begin() + 2 + ACCOUNT_ID_LENGTH,
              accountId.begin());

    const auto flag = payload[2 + ACCOUNT_ID_LENGTH];
    const uint8_t *tag = payload.data() + 3 + ACCOUNT_ID_LENGTH;
    if (1 < flag)
        return XPC_ERROR(XPC_CC_InvalidAddress, "Bad X-Address tag flag");

    // Tags are 32 bits, so the high half must stay clear:
    if (tag[4] || tag[5] || tag[6] || tag[7])
        return XPC_ERROR(XPC_CC_InvalidAddress, "X-Address tag out of range");

    out.hasTag = flag;
    out.tag =
        uint32_t(tag[0]) |
        uint32_t(tag[1]) << 8 |
        uint32_t(tag[2]) << 16 |
        uint32_t(tag[3]) << 24;
    if (!out.hasTag && out.tag)
        return XPC_ERROR(XPC_CC_InvalidAddress, "X-Address tag without flag");

    out.classicAddress = classicAddressEncode(accountId);
    result = std::move(out);
    return Status();
}

Status
xAddressEncode(std::string &result, const XAddress &address)
{
    AccountId accountId;
    XPC_CHECK(classicAddressDecode(accountId, address.classicAddress));

    const uint32_t tag = address.hasTag ? address.tag : 0;
    const DataArray<9> tail =
    {{
        uint8_t(address.hasTag),
        uint8_t(tag & 0xff),
        uint8_t(tag >> 8 & 0xff),
        uint8_t(tag >> 16 & 0xff),
        uint8_t(tag >> 24 & 0xff),
        0, 0, 0, 0
    }};
    const auto prefix = address.testnet ? testnetPrefix : mainnetPrefix;

    result = base58CheckEncode(buildData(
    {
        DataSlice(prefix, prefix + 2), accountId, tail
    }));
    return Status();
}

Status
classicAddressDecode(AccountId &result, const std::string &text)
{
    DataChunk payload;
    if (!base58CheckDecode(payload, text))
        return XPC_ERROR(XPC_CC_InvalidAddress, "Not a classic address: " + text);
    if (1 + ACCOUNT_ID_LENGTH != payload.size() || classicPrefix != payload[0])
        return XPC_ERROR(XPC_CC_InvalidAddress, "Wrong classic address format");

    std::copy(payload.begin() + 1, payload.end(), result.begin());
    return Status();
}

std::string
classicAddressEncode(const AccountId &accountId)
{
    const DataArray<1> prefix = {{classicPrefix}};
    return base58CheckEncode(buildData({prefix, accountId}));
}

} // namespace xpcd
