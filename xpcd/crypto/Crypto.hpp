/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Cryptographic hash wrappers.
 */

#ifndef XPCD_CRYPTO_CRYPTO_HPP
#define XPCD_CRYPTO_CRYPTO_HPP

#include "../util/Data.hpp"

namespace xpcd {

#define SHA256_LENGTH 32

typedef DataArray<SHA256_LENGTH> Sha256Digest;

/**
 * Computes the SHA-256 hash of some data.
 */
Sha256Digest
sha256(DataSlice data);

/**
 * Computes SHA-256 twice, as used by base58check checksums.
 */
Sha256Digest
sha256Double(DataSlice data);

} // namespace xpcd

#endif
