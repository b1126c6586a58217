/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../xpcd/ledger/Amount.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Drops parsing", "[ledger][amount]")
{
    uint64_t drops = 7;

    SECTION("plain numbers")
    {
        REQUIRE(xpcd::dropsDecode(drops, "0"));
        REQUIRE(0 == drops);
        REQUIRE(xpcd::dropsDecode(drops, "100000000000000000"));
        REQUIRE(100000000000000000ull == drops);
        REQUIRE(xpcd::dropsDecode(drops, "18446744073709551615"));
        REQUIRE(18446744073709551615ull == drops);
    }
    SECTION("bad text")
    {
        REQUIRE(XPC_CC_ParseError == xpcd::dropsDecode(drops, "").value());
        REQUIRE(XPC_CC_ParseError == xpcd::dropsDecode(drops, "-1").value());
        REQUIRE(XPC_CC_ParseError == xpcd::dropsDecode(drops, "1.5").value());
        REQUIRE(XPC_CC_ParseError == xpcd::dropsDecode(drops, " 10").value());
        REQUIRE(7 == drops);
    }
    SECTION("overflow")
    {
        REQUIRE_FALSE(xpcd::dropsDecode(drops, "18446744073709551616"));
        REQUIRE_FALSE(xpcd::dropsDecode(drops, "99999999999999999999"));
        REQUIRE(7 == drops);
    }
}
