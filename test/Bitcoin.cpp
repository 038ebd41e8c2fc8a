/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Fakes.hpp"
#include "../txcoord/bitcoin/Utility.hpp"
#include "../txcoord/crypto/Encoding.hpp"
#include "../txcoord/spend/Outputs.hpp"
#include <catch.hpp>

static const char rawTxHex[] =
    "0100000000010170632233be35f8b6deb07e0e13d31cd6efa03b5a7e05afe619e5017acda23b6400000000171600145888c0ee06ce9ceaebe253d67e7e547f8bb3db05ffffffff0132430300000000001976a9143801b8cff780ca0853df97d247ab64980cc0638e88ac0247304402203470c6871ae67ae74d6eced94d57f4970e10a52523d329991fa21caa7125876d0220628ae0c349333d7636e6a14ce1e1defd2459b3b5d44b1a4fe96593e00da321c40121033f0463711a8815af06cbfc44d73ce8f5da613e81ddd83413a4af08d5b3ff2f8000000000";

TEST_CASE("Decode segwit transaction", "[bitcoin]")
{
    txcoord::DataChunk rawTx;
    REQUIRE(txcoord::base16Decode(rawTx, rawTxHex));

    bc::transaction_type result;
    REQUIRE(txcoord::decodeTx(result, rawTx));
    REQUIRE(result.inputs.size() == 1);
    REQUIRE(result.outputs.size() == 1);
    REQUIRE(result.outputs[0].value == 213810);
    REQUIRE(result.locktime == 0);
    REQUIRE_FALSE(txcoord::isReplaceByFee(result));
}

TEST_CASE("Decode bad transactions", "[bitcoin]")
{
    const auto tx = txcoord::fakeTx(1, {50000, 1000});
    auto rawTx = txcoord::encodeTx(tx);

    bc::transaction_type result;
    REQUIRE(txcoord::decodeTx(result, rawTx));
    REQUIRE(txcoord::txidOf(tx) == txcoord::txidOf(result));

    SECTION("too short")
    {
        rawTx.resize(rawTx.size() - 1);
        REQUIRE(txcoord::TXC_CC_ParseError == txcoord::decodeTx(result, rawTx).value());
    }
    SECTION("trailing junk")
    {
        rawTx.push_back(0);
        REQUIRE(txcoord::TXC_CC_ParseError == txcoord::decodeTx(result, rawTx).value());
    }
    SECTION("almost nothing")
    {
        REQUIRE(txcoord::TXC_CC_ParseError ==
                txcoord::decodeTx(result, txcoord::DataChunk{1, 0, 0}).value());
    }
}

TEST_CASE("Txid encoding", "[bitcoin]")
{
    const auto tx = txcoord::fakeTx(1, {50000});
    const auto txid = txcoord::txidOf(tx);
    REQUIRE(64 == txid.size());

    bc::hash_digest hash;
    REQUIRE(txcoord::txidDecode(hash, txid));
    REQUIRE(bc::hash_transaction(tx) == hash);

    REQUIRE(txcoord::TXC_CC_ParseError == txcoord::txidDecode(hash, "abc").value());
}

TEST_CASE("Replace by fee signaling", "[bitcoin]")
{
    REQUIRE_FALSE(txcoord::isReplaceByFee(txcoord::fakeTx(1, {50000})));
    REQUIRE_FALSE(txcoord::isReplaceByFee(txcoord::fakeTx(1, {50000}, 0xfffffffe)));
    REQUIRE(txcoord::isReplaceByFee(txcoord::fakeTx(1, {50000},
                                    txcoord::replaceableSequence)));
}

TEST_CASE("Size estimates", "[bitcoin]")
{
    auto tx = txcoord::fakeTx(1, {50000});
    const size_t bare = bc::satoshi_raw_size(tx);

    // One signature per input:
    REQUIRE(bare + 104 == txcoord::estimateSize(tx, 0));
    REQUIRE(bare + 104 + 35 == txcoord::estimateSize(tx, 1));

    // Existing signatures do not count twice:
    tx.inputs[0].script.push_operation(
        txcoord::makePushOperation(txcoord::DataChunk(72, 1)));
    REQUIRE(bare + 104 == txcoord::estimateSize(tx, 0));
}

TEST_CASE("Output helpers", "[bitcoin][spend]")
{
    const auto tx = txcoord::fakeTx(1, {50000, 1000, 545});
    REQUIRE(51545 == txcoord::outputsTotal(tx.outputs));

    REQUIRE(txcoord::outputIsDust(545, 546));
    REQUIRE_FALSE(txcoord::outputIsDust(546, 546));

    // Pay-to-pubkey-hash is 25 bytes:
    REQUIRE(25 == bc::save_script(tx.outputs[0].script).size());
}
