/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txcoord/crypto/Encoding.hpp"
#include <catch.hpp>

TEST_CASE("RFC 4648 base16 test vectors", "[crypto][base16]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "66"},
        {"fo", "666f"},
        {"foo", "666f6f"},
        {"foob", "666f6f62"},
        {"fooba", "666f6f6261"},
        {"foobar", "666f6f626172"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == txcoord::base16Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        txcoord::DataChunk result;
        REQUIRE(txcoord::base16Decode(result, test.text));
        REQUIRE(txcoord::toString(result) == test.data);
    }
}

TEST_CASE("Bad base16 strings", "[crypto][base16]")
{
    txcoord::DataChunk result;

    // Bad length:
    REQUIRE_FALSE(txcoord::base16Decode(result, "123"));

    // Bad padding:
    REQUIRE_FALSE(txcoord::base16Decode(result, "00=="));
    REQUIRE_FALSE(txcoord::base16Decode(result, "0="));

    // Illegal characters:
    REQUIRE(txcoord::TXC_CC_ParseError == txcoord::base16Decode(result, "0g").value());
}

TEST_CASE("RFC 4648 base64 test vectors", "[crypto][base64]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "Zg=="},
        {"fo", "Zm8="},
        {"foo", "Zm9v"},
        {"foob", "Zm9vYg=="},
        {"fooba", "Zm9vYmE="},
        {"foobar", "Zm9vYmFy"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == txcoord::base64Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        txcoord::DataChunk result;
        REQUIRE(txcoord::base64Decode(result, test.text));
        REQUIRE(txcoord::toString(result) == test.data);
    }
}

TEST_CASE("Unusual base64 characters", "[crypto][base64]")
{
    txcoord::DataChunk result;
    REQUIRE(txcoord::base64Decode(result, "+/+="));
    REQUIRE(result.size() == 2);
    REQUIRE(0xfb == result[0]);
    REQUIRE(0xff == result[1]);
}

TEST_CASE("Bad base64 strings", "[crypto][base64]")
{
    txcoord::DataChunk result;

    // Bad length:
    REQUIRE_FALSE(txcoord::base64Decode(result, "12345"));

    // Bad padding:
    REQUIRE_FALSE(txcoord::base64Decode(result, "AAAA===="));
    REQUIRE_FALSE(txcoord::base64Decode(result, "A==="));
    REQUIRE_FALSE(txcoord::base64Decode(result, "A=AA"));
}
