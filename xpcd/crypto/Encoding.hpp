/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_CRYPTO_ENCODING_HPP
#define XPCD_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace xpcd {

/**
 * Encodes data into an uppercase hex string.
 */
std::string
base16Encode(DataSlice data);

/**
 * Decodes a hex string. Either case is accepted.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-58 string using the ledger's alphabet.
 */
std::string
base58Encode(DataSlice data);

/**
 * Decodes a base-58 string using the ledger's alphabet.
 */
Status
base58Decode(DataChunk &result, const std::string &in);

/**
 * Appends a four-byte double-SHA256 checksum, then encodes in base-58.
 */
std::string
base58CheckEncode(DataSlice payload);

/**
 * Decodes a base-58 string and verifies its trailing checksum.
 * The result has the checksum removed.
 */
Status
base58CheckDecode(DataChunk &result, const std::string &in);

} // namespace xpcd

#endif
