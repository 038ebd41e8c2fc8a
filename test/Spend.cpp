/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Fakes.hpp"
#include "../txcoord/crypto/Encoding.hpp"
#include "../txcoord/spend/WifKeyManager.hpp"
#include "../txcoord/util/FileIO.hpp"
#include <catch.hpp>

static const char wif[] = "5HueCGU8rMjxEXxiPuD5BDku4MkFqeZyd4dp94nryZ6fmhahdkU";

TEST_CASE("WIF keys", "[spend]")
{
    txcoord::WifKeyManager keys;

    std::string handle;
    REQUIRE(keys.add(handle, wif));

    txcoord::DataChunk pubkey;
    REQUIRE(keys.publicKey(pubkey, handle));
    REQUIRE(65 == pubkey.size());
    REQUIRE(0x04 == pubkey[0]);
    REQUIRE(txcoord::base16Encode(pubkey) == handle);

    // Signatures are deterministic:
    const auto sighash = txcoord::fakeHash(7);
    txcoord::DataChunk signature1, signature2;
    REQUIRE(keys.sign(signature1, sighash, handle));
    REQUIRE(keys.sign(signature2, sighash, handle));
    REQUIRE(signature1 == signature2);

    REQUIRE(txcoord::TXC_CC_KeyError == keys.add(handle, "notawif").value());
    REQUIRE(txcoord::TXC_CC_KeyError == keys.publicKey(pubkey, "nobody").value());
    REQUIRE(txcoord::TXC_CC_KeyError == keys.sign(signature1, sighash, "nobody").value());
}

TEST_CASE("WIF key files", "[spend]")
{
    const std::string dir = "wif-test/";
    REQUIRE(txcoord::fileEnsureDir(dir));

    const std::string good = "{\"keys\": [\"" + std::string(wif) + "\"]}";
    REQUIRE(txcoord::fileSave(good, dir + "good.json"));
    txcoord::WifKeyManager keys;
    REQUIRE(keys.load(dir + "good.json"));

    const std::string bad = "{\"keys\": [5]}";
    REQUIRE(txcoord::fileSave(bad, dir + "bad.json"));
    txcoord::WifKeyManager badKeys;
    REQUIRE(txcoord::TXC_CC_JSONError == badKeys.load(dir + "bad.json").value());

    REQUIRE(txcoord::fileDelete(dir));
}

TEST_CASE("Signing", "[spend]")
{
    txcoord::WifKeyManager keys;
    std::string handle;
    REQUIRE(keys.add(handle, wif));

    txcoord::SpeedupInput input;
    input.point.hash = txcoord::fakeHash(3);
    input.point.index = 1;
    input.amount = 20000;
    input.keyHandle = handle;
    const txcoord::SpeedupInputList inputs{input, input};

    auto tx = txcoord::fakeTx(1, {15000});
    txcoord::inputsFill(tx, inputs);
    REQUIRE(2 == tx.inputs.size());
    REQUIRE(txcoord::isReplaceByFee(tx));
    REQUIRE(1 == tx.inputs[1].previous_output.index);

    SECTION("good keys")
    {
        REQUIRE(txcoord::signTx(tx, inputs, keys));
        for (const auto &in: tx.inputs)
            REQUIRE(2 == in.script.operations().size());

        // Signing again gives the same transaction:
        auto again = tx;
        REQUIRE(txcoord::signTx(again, inputs, keys));
        REQUIRE(txcoord::txidOf(tx) == txcoord::txidOf(again));
    }
    SECTION("missing key")
    {
        txcoord::SpeedupInputList stranger = inputs;
        stranger[1].keyHandle = "nobody";
        REQUIRE(txcoord::TXC_CC_KeyError == txcoord::signTx(tx, stranger, keys).value());
    }
    SECTION("wrong input count")
    {
        const txcoord::SpeedupInputList one{input};
        REQUIRE_FALSE(txcoord::signTx(tx, one, keys));
    }
}
