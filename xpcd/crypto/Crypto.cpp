/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Crypto.hpp"
#include <openssl/sha.h>

namespace xpcd {

Sha256Digest
sha256(DataSlice data)
{
    Sha256Digest out;
    SHA256(data.data(), data.size(), out.data());
    return out;
}

Sha256Digest
sha256Double(DataSlice data)
{
    return sha256(sha256(data));
}

} // namespace xpcd
