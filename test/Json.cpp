/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txcoord/json/JsonArray.hpp"
#include "../txcoord/json/JsonObject.hpp"
#include "../txcoord/util/FileIO.hpp"
#include <catch.hpp>

TEST_CASE("JsonPtr lifetime", "[util][json]")
{
    txcoord::JsonPtr a(json_integer(42));
    REQUIRE(1 == a.get()->refcount);
    REQUIRE(json_is_integer(a.get()));

    SECTION("move constructor")
    {
        txcoord::JsonPtr b(std::move(a));
        REQUIRE(1 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(!a.get());
    }
    SECTION("copy constructor")
    {
        txcoord::JsonPtr b(a);
        REQUIRE(2 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(json_is_integer(a.get()));
    }
    SECTION("assignment operator")
    {
        txcoord::JsonPtr b;
        b = a;
        REQUIRE(2 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(json_is_integer(a.get()));

        b = nullptr;
        REQUIRE(!b.get());
        REQUIRE(1 == a.get()->refcount);
    }
}

TEST_CASE("JsonArray manipulation", "[util][json]")
{
    txcoord::JsonArray a;
    REQUIRE(json_is_array(a.get()));

    txcoord::JsonPtr temp(json_integer(42));
    REQUIRE(a.append(temp));

    REQUIRE(a.get());
    REQUIRE(1 == a.size());
    REQUIRE(json_is_integer(a[0].get()));
    REQUIRE(42 == json_integer_value(a[0].get()));
}

TEST_CASE("JsonObject manipulation", "[util][json]")
{
    struct TestJson:
        public txcoord::JsonObject
    {
        TXC_JSON_VALUE  (value,   "value",   JsonPtr)
        TXC_JSON_STRING (string,  "string",  "default")
        TXC_JSON_NUMBER (number,  "number",  6.28)
        TXC_JSON_BOOLEAN(boolean, "boolean", true)
        TXC_JSON_INTEGER(integer, "integer", 42)
    };
    TestJson test;

    SECTION("empty")
    {
        REQUIRE(json_is_object(test.get()));
        REQUIRE_FALSE(test.stringOk());
        REQUIRE_FALSE(test.numberOk());
        REQUIRE_FALSE(test.booleanOk());
        REQUIRE_FALSE(test.integerOk());
    }
    SECTION("defaults")
    {
        REQUIRE_FALSE(test.value());
        REQUIRE(test.string() == std::string("default"));
        REQUIRE(test.number() == 6.28);
        REQUIRE(test.boolean() == true);
        REQUIRE(test.integer() == 42);
    }
    SECTION("raw json")
    {
        REQUIRE(test.decode("{ \"value\": [] }"));
        REQUIRE(test.value());
    }
    SECTION("string decode")
    {
        REQUIRE(test.decode("{ \"string\": \"value\" }"));
        REQUIRE(test.stringOk());
        REQUIRE(test.string() == std::string("value"));
    }
    SECTION("number decode")
    {
        REQUIRE(test.decode("{ \"number\": 1.1 }"));
        REQUIRE(test.numberOk());
        REQUIRE(test.number() == 1.1);
    }
    SECTION("boolean set")
    {
        REQUIRE(test.booleanSet(false));
        REQUIRE(test.boolean() == false);
    }
    SECTION("integer set")
    {
        REQUIRE(test.integerSet(65537));
        REQUIRE(test.integer() == 65537);
    }
}

TEST_CASE("JsonPtr clone", "[util][json]")
{
    txcoord::JsonObject a;
    REQUIRE(a.decode("{ \"list\": [1, 2] }"));

    auto b = a.clone();
    REQUIRE(b.get() != a.get());
    REQUIRE(json_equal(a.get(), b.get()));

    json_array_append_new(json_object_get(b.get(), "list"), json_integer(3));
    REQUIRE(2 == json_array_size(json_object_get(a.get(), "list")));

    txcoord::JsonPtr empty;
    REQUIRE_FALSE(empty.clone());
}

TEST_CASE("JsonPtr files", "[util][json]")
{
    const std::string dir = "json-test/";
    REQUIRE(txcoord::fileEnsureDir(dir));

    txcoord::JsonArray a;
    REQUIRE(a.append(txcoord::JsonPtr(json_string("saved"))));
    REQUIRE(a.save(dir + "a.json"));
    REQUIRE_FALSE(txcoord::fileExists(dir + "a.json.tmp"));

    txcoord::JsonArray b;
    REQUIRE(b.load(dir + "a.json"));
    REQUIRE(1 == b.size());
    REQUIRE(std::string("saved") == json_string_value(b[0].get()));

    REQUIRE_FALSE(b.load(dir + "missing.json"));
    REQUIRE(txcoord::fileDelete(dir));
}
