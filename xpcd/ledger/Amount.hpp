/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_LEDGER_AMOUNT_HPP
#define XPCD_LEDGER_AMOUNT_HPP

#include "../util/Status.hpp"
#include <stdint.h>

namespace xpcd {

/**
 * Parses a decimal count of drops.
 * Only plain digits are accepted, and the value must fit in 64 bits.
 */
Status
dropsDecode(uint64_t &result, const std::string &text);

} // namespace xpcd

#endif
