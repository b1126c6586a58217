/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_HTTP_HTTP_HPP
#define XPCD_HTTP_HTTP_HPP

#include "../util/Status.hpp"

namespace xpcd {

/**
 * Initialize the cURL library.
 * The first call sets up process-wide transport state,
 * and later calls return the same result.
 * Must be called before any HTTP transport is created.
 */
Status
httpInit();

} // namespace xpcd

#endif
