/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include "Crypto.hpp"
#include <algorithm>

namespace xpcd {

// The ledger uses its own base-58 symbol ordering, with 'r' as zero:
static const char base58Sym[] =
    "rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz";

constexpr size_t checksumLength = 4;

static int
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(2 * data.size());

    for (auto byte: data)
    {
        out += base16Sym[byte >> 4];
        out += base16Sym[byte & 0xf];
    }
    return out;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return XPC_ERROR(XPC_CC_ParseError, "Bad hex string length");

    DataChunk out;
    out.reserve(in.size() / 2);

    for (size_t i = 0; i < in.size(); i += 2)
    {
        int high = base16Value(in[i]);
        int low = base16Value(in[i + 1]);
        if (high < 0 || low < 0)
            return XPC_ERROR(XPC_CC_ParseError, "Bad hex character");
        out.push_back(high << 4 | low);
    }

    result = std::move(out);
    return Status();
}

std::string
base58Encode(DataSlice data)
{
    // Leading zero bytes become leading zero symbols:
    size_t zeros = 0;
    while (zeros < data.size() && !data.data()[zeros])
        ++zeros;

    // Repeatedly divide the big-endian number by 58, least-significant first:
    std::vector<uint8_t> digits; // Base-58 digits, least significant first
    digits.reserve(data.size() * 138 / 100 + 1);
    for (auto i = data.begin() + zeros; i != data.end(); ++i)
    {
        int carry = *i;
        for (auto &digit: digits)
        {
            carry += digit << 8;
            digit = carry % 58;
            carry /= 58;
        }
        while (carry)
        {
            digits.push_back(carry % 58);
            carry /= 58;
        }
    }

    std::string out(zeros, base58Sym[0]);
    for (auto i = digits.rbegin(); i != digits.rend(); ++i)
        out += base58Sym[*i];
    return out;
}

Status
base58Decode(DataChunk &result, const std::string &in)
{
    size_t zeros = 0;
    while (zeros < in.size() && base58Sym[0] == in[zeros])
        ++zeros;

    DataChunk bytes; // Least significant first
    bytes.reserve(in.size() * 733 / 1000 + 1);
    for (auto i = in.begin() + zeros; i != in.end(); ++i)
    {
        const char *where = std::find(base58Sym, base58Sym + 58, *i);
        if (base58Sym + 58 == where || !*i)
            return XPC_ERROR(XPC_CC_ParseError, "Bad base58 character");

        int carry = where - base58Sym;
        for (auto &byte: bytes)
        {
            carry += byte * 58;
            byte = carry & 0xff;
            carry >>= 8;
        }
        while (carry)
        {
            bytes.push_back(carry & 0xff);
            carry >>= 8;
        }
    }

    DataChunk out(zeros, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    result = std::move(out);
    return Status();
}

std::string
base58CheckEncode(DataSlice payload)
{
    const auto hash = sha256Double(payload);
    return base58Encode(buildData({payload,
                                   DataSlice(hash.data(), hash.data() + checksumLength)}));
}

Status
base58CheckDecode(DataChunk &result, const std::string &in)
{
    DataChunk raw;
    XPC_CHECK(base58Decode(raw, in));
    if (raw.size() < checksumLength)
        return XPC_ERROR(XPC_CC_ParseError, "Base58 data too short");

    const auto split = raw.end() - checksumLength;
    const auto hash = sha256Double(DataSlice(raw.data(), raw.data() + (split - raw.begin())));
    if (!std::equal(split, raw.end(), hash.begin()))
        return XPC_ERROR(XPC_CC_ParseError, "Bad base58 checksum");

    result = DataChunk(raw.begin(), split);
    return Status();
}

} // namespace xpcd
