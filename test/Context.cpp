/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../xpcd/Context.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Settings defaults", "[context]")
{
    xpcd::ConfigJson config;
    std::unique_ptr<xpcd::Context> context;
    REQUIRE(xpcd::Context::create(context, config));

    REQUIRE(XPC_DEFAULT_GRPC_ENDPOINT == context->endpoint());
    REQUIRE_FALSE(context->legacy());
    REQUIRE(context->testnet());
    REQUIRE(std::chrono::seconds(30) == context->timeout());
    REQUIRE(context->networkClient()->uri() == XPC_DEFAULT_GRPC_ENDPOINT);
}

TEST_CASE("Settings file", "[context]")
{
    xpcd::ConfigJson config;
    std::unique_ptr<xpcd::Context> context;

    SECTION("legacy backend")
    {
        REQUIRE(config.decode(
            "{"
            "\"backend\": \"legacy\","
            "\"legacyEndpoint\": \"https://legacy.example.com/\","
            "\"network\": \"main\","
            "\"timeout\": 5"
            "}"));
        REQUIRE(xpcd::Context::create(context, config));

        REQUIRE(context->legacy());
        REQUIRE_FALSE(context->testnet());
        REQUIRE(std::chrono::seconds(5) == context->timeout());
        REQUIRE(context->networkClient()->uri() == "https://legacy.example.com");
    }
    SECTION("unknown backend")
    {
        REQUIRE(config.backendSet("websocket"));
        REQUIRE_FALSE(xpcd::Context::create(context, config));
        REQUIRE(!context);
    }
    SECTION("unknown network")
    {
        REQUIRE(config.networkSet("devnet"));
        REQUIRE_FALSE(xpcd::Context::create(context, config));
    }
    SECTION("bad timeout")
    {
        REQUIRE(config.timeoutSet(0));
        REQUIRE_FALSE(xpcd::Context::create(context, config));
    }
}

TEST_CASE("Address network check", "[context]")
{
    xpcd::ConfigJson config;
    std::unique_ptr<xpcd::Context> context;
    REQUIRE(config.networkSet("main"));
    REQUIRE(xpcd::Context::create(context, config));

    CHECK(context->addressCheck(
              "X7AcgcsBL6XDcUb289X4mJ8djcdyKaB5hJDWMArnXr61cqZ"));
    CHECK(XPC_CC_InvalidAddress == context->addressCheck(
              "T719a5UwUCnEs54UsxG9CJYYDhwmFCqkr7wxCcNcfZ6p5GZ").value());
    CHECK(XPC_CC_InvalidAddress == context->addressCheck(
              "r9cZA1mLK5R5Am25ArfXFmqgNwjZgnfk59").value());
}
