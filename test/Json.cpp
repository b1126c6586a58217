/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../xpcd/json/JsonObject.hpp"
#include <catch2/catch.hpp>

TEST_CASE("JsonPtr lifetime", "[util][json]")
{
    xpcd::JsonPtr a(json_integer(42));
    REQUIRE(1 == a.get()->refcount);
    REQUIRE(json_is_integer(a.get()));

    SECTION("move constructor")
    {
        xpcd::JsonPtr b(std::move(a));
        REQUIRE(1 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(!a.get());
    }
    SECTION("copy constructor")
    {
        xpcd::JsonPtr b(a);
        REQUIRE(2 == b.get()->refcount);
        REQUIRE(json_is_integer(a.get()));
    }
    SECTION("assignment operator")
    {
        xpcd::JsonPtr b;
        b = a;
        REQUIRE(2 == b.get()->refcount);

        b.reset();
        REQUIRE(!b.get());
        REQUIRE(1 == a.get()->refcount);
    }
}

TEST_CASE("JsonObject manipulation", "[util][json]")
{
    struct TestJson:
        public xpcd::JsonObject
    {
        XPC_JSON_STRING (string,  "string",  "default")
        XPC_JSON_INTEGER(integer, "integer", 42)
    };
    TestJson test;

    SECTION("empty")
    {
        REQUIRE_FALSE(test.stringOk());
        REQUIRE_FALSE(test.integerOk());
    }
    SECTION("defaults")
    {
        REQUIRE(test.string() == std::string("default"));
        REQUIRE(test.integer() == 42);
    }
    SECTION("string decode")
    {
        REQUIRE(test.decode("{ \"string\": \"value\" }"));
        REQUIRE(test.stringOk());
        REQUIRE(test.string() == std::string("value"));
    }
    SECTION("wrong type")
    {
        REQUIRE(test.decode("{ \"integer\": \"value\" }"));
        REQUIRE(XPC_CC_JSONError == test.integerOk().value());
        REQUIRE(test.integer() == 42);
    }
    SECTION("bad syntax")
    {
        REQUIRE(XPC_CC_JSONError == test.decode("{ \"string\": ").value());
    }
    SECTION("integer set")
    {
        REQUIRE(test.integerSet(65537));
        REQUIRE(test.integer() == 65537);
        REQUIRE(test.encode(true) == "{\"integer\":65537}");
    }
}
