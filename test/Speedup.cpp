/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Fakes.hpp"
#include "../txcoord/dispatch/DispatchDb.hpp"
#include "../txcoord/funding/FundingPool.hpp"
#include "../txcoord/speedup/SpeedupEngine.hpp"
#include "../txcoord/store/Store.hpp"
#include <catch.hpp>

using txcoord::DispatchStatus;
using txcoord::NewsEvent;
using txcoord::SpeedupMethod;
using txcoord::SpeedupOutcome;

namespace {

/**
 * A dispatch with an anchor output, waiting in the mempool.
 */
txcoord::DispatchRecord
anchoredDispatch(uint8_t seed = 1)
{
    auto tx = txcoord::fakeTx(seed, {50000, 1000});

    txcoord::DispatchRecord out;
    out.id = txcoord::txidOf(tx);
    out.rawTx = txcoord::encodeTx(tx);
    out.context = "ctx";
    out.status = DispatchStatus::unconfirmed;
    out.broadcastHeight = 100;
    out.hasSpeedup = true;
    out.speedup.hasAnchor = true;
    out.speedup.anchorVout = 1;
    out.speedup.anchorKeyHandle = "anchor";
    out.speedup.thresholdBlocks = 1;
    out.speedup.initialFeeRate = 10;
    return out;
}

/**
 * A dispatch that signals replace-by-fee, paying a 10000 satoshi fee.
 */
txcoord::DispatchRecord
replaceableDispatch()
{
    auto tx = txcoord::fakeTx(2, {50000}, txcoord::replaceableSequence);

    txcoord::DispatchRecord out;
    out.id = txcoord::txidOf(tx);
    out.rawTx = txcoord::encodeTx(tx);
    out.status = DispatchStatus::unconfirmed;
    out.broadcastHeight = 100;
    out.hasSpeedup = true;
    txcoord::InputSource input;
    input.amount = 60000;
    input.keyHandle = "input";
    out.speedup.inputs.push_back(input);
    out.speedup.initialFeeRate = 10;
    return out;
}

txcoord::FundingUtxo
funding(uint64_t amount, char digit = 'f')
{
    txcoord::FundingUtxo out;
    out.txid = std::string(64, digit);
    out.vout = 0;
    out.amount = amount;
    out.ownerPublicKey = "funder";
    return out;
}

std::vector<NewsEvent>
newsEvents(txcoord::Store &store, txcoord::NewsFeed &feed)
{
    txcoord::StoreTransaction txn(store);
    txcoord::NewsList news;
    REQUIRE(feed.pending(news, txn));

    std::vector<NewsEvent> out;
    for (const auto &item: news)
        out.push_back(item.event);
    return out;
}

} // namespace

TEST_CASE("Speedup method selection", "[speedup]")
{
    txcoord::SpeedupPolicy policy((txcoord::SpeedupSettings()));

    auto anchored = anchoredDispatch();
    bc::transaction_type tx;
    REQUIRE(txcoord::decodeTx(tx, anchored.rawTx));
    REQUIRE(SpeedupMethod::cpfp == policy.chooseMethod(tx, anchored.speedup));

    SECTION("anchor out of range")
    {
        anchored.speedup.anchorVout = 2;
        REQUIRE(SpeedupMethod::none == policy.chooseMethod(tx, anchored.speedup));
    }
    SECTION("replaceable")
    {
        auto replaceable = replaceableDispatch();
        bc::transaction_type rtx;
        REQUIRE(txcoord::decodeTx(rtx, replaceable.rawTx));
        REQUIRE(txcoord::isReplaceByFee(rtx));
        REQUIRE(SpeedupMethod::rbf == policy.chooseMethod(rtx, replaceable.speedup));

        // Every input needs a key:
        replaceable.speedup.inputs[0].keyHandle.clear();
        REQUIRE(SpeedupMethod::none == policy.chooseMethod(rtx, replaceable.speedup));
    }
    SECTION("explicitly replaceable")
    {
        txcoord::SpeedupData data;
        data.replaceable = true;
        txcoord::InputSource input;
        input.amount = 1000;
        input.keyHandle = "input";
        data.inputs.push_back(input);
        REQUIRE_FALSE(txcoord::isReplaceByFee(tx));
        REQUIRE(SpeedupMethod::rbf == policy.chooseMethod(tx, data));

        data.replaceable = false;
        REQUIRE(SpeedupMethod::none == policy.chooseMethod(tx, data));
    }
}

TEST_CASE("Speedup timing", "[speedup]")
{
    txcoord::SpeedupSettings settings;
    settings.defaultThresholdBlocks = 3;
    txcoord::SpeedupPolicy policy(settings);

    auto record = anchoredDispatch();

    SECTION("block threshold")
    {
        REQUIRE_FALSE(policy.isStalled(record, 100, 0));
        REQUIRE(policy.isStalled(record, 101, 0));

        // Bumps restart the clock:
        record.lastAttemptHeight = 101;
        REQUIRE_FALSE(policy.isStalled(record, 101, 0));
        REQUIRE(policy.isStalled(record, 102, 0));
    }
    SECTION("time threshold")
    {
        record.speedup.thresholdBlocks = 0;
        record.speedup.thresholdSeconds = 600;
        record.broadcastTime = 1000;
        REQUIRE_FALSE(policy.isStalled(record, 200, 1599));
        REQUIRE(policy.isStalled(record, 100, 1600));
    }
    SECTION("default threshold")
    {
        record.speedup.thresholdBlocks = 0;
        REQUIRE_FALSE(policy.isStalled(record, 102, 0));
        REQUIRE(policy.isStalled(record, 103, 0));
    }
    SECTION("only pending dispatches stall")
    {
        record.status = DispatchStatus::confirmed;
        REQUIRE_FALSE(policy.isStalled(record, 200, 0));
        record.status = DispatchStatus::spedUp;
        REQUIRE(policy.isStalled(record, 200, 0));
    }
}

TEST_CASE("Fee rate escalation", "[speedup]")
{
    txcoord::SpeedupSettings settings;
    settings.baseFeeRate = 2;
    settings.feeMultiplier = 1.5;
    settings.maxFeeRate = 20;
    txcoord::SpeedupPolicy policy(settings);

    auto record = anchoredDispatch();
    bool clamped = true;

    record.speedup.initialFeeRate = 0;
    REQUIRE(2 == policy.nextFeeRate(clamped, record));
    REQUIRE_FALSE(clamped);

    record.speedup.initialFeeRate = 10;
    REQUIRE(10 == policy.nextFeeRate(clamped, record));

    record.lastFeeRate = 10;
    REQUIRE(15 == policy.nextFeeRate(clamped, record));
    REQUIRE_FALSE(clamped);

    record.lastFeeRate = 15;
    REQUIRE(20 == policy.nextFeeRate(clamped, record));
    REQUIRE(clamped);

    REQUIRE(20 == policy.escalate(clamped, 20));
    REQUIRE(clamped);
}

TEST_CASE("Speedup engine", "[speedup]")
{
    txcoord::Store store;
    REQUIRE(store.open(""));

    txcoord::SpeedupSettings settings;
    txcoord::SpeedupPolicy policy(settings);
    txcoord::FundingPool pool(10000, 1000);
    txcoord::NewsFeed news(false);
    txcoord::FakeBroadcaster broadcaster;
    txcoord::FakeKeyManager keys;
    txcoord::SpeedupEngine engine(policy, pool, news, broadcaster, keys);

    const auto utxo = funding(100000);
    auto record = anchoredDispatch();
    auto addFunding = [&]()
    {
        txcoord::StoreTransaction txn(store);
        REQUIRE(pool.add(txn, utxo));
        REQUIRE(txn.commit());
    };
    auto speedup = [&](SpeedupOutcome &outcome, size_t height)
    {
        txcoord::StoreTransaction txn(store);
        REQUIRE(engine.speedup(outcome, txn, record, height, 0));
        REQUIRE(txn.commit());
    };
    auto fundingOf = [&](txcoord::FundingUtxo &result,
                         const std::string &outpoint)
    {
        txcoord::StoreTransaction txn(store);
        return pool.get(result, txn, outpoint);
    };

    SECTION("child pays for parent")
    {
        addFunding();
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::sent == outcome);
        REQUIRE(DispatchStatus::spedUp == record.status);
        REQUIRE(1 == record.attempts.size());
        REQUIRE(1 == broadcaster.sent.size());
        REQUIRE(utxo.outpoint() == record.funding);

        const auto &attempt = record.attempts[0];
        REQUIRE(SpeedupMethod::cpfp == attempt.method);
        REQUIRE(10 == attempt.feeRate);
        REQUIRE(101 == attempt.height);
        REQUIRE(101 == record.lastAttemptHeight);

        // The child spends the anchor and the funding:
        bc::transaction_type parent, child;
        REQUIRE(txcoord::decodeTx(parent, record.rawTx));
        REQUIRE(txcoord::decodeTx(child, broadcaster.sent[0]));
        REQUIRE(attempt.txid == txcoord::txidOf(child));
        REQUIRE(2 == child.inputs.size());
        REQUIRE(bc::hash_transaction(parent) == child.inputs[0].previous_output.hash);
        REQUIRE(1 == child.inputs[0].previous_output.index);
        REQUIRE(txcoord::replaceableSequence == child.inputs[1].sequence);
        REQUIRE(1 == child.outputs.size());
        REQUIRE(1000 + utxo.amount == child.outputs[0].value + attempt.fee);

        // The fee covers both transactions:
        const auto size = bc::satoshi_raw_size(parent) +
                          txcoord::estimateSize(child, 0);
        REQUIRE(10 * size <= attempt.fee);

        txcoord::FundingUtxo reserved;
        REQUIRE(fundingOf(reserved, utxo.outpoint()));
        REQUIRE(record.id == reserved.reservedBy);
        REQUIRE(std::vector<NewsEvent>({NewsEvent::speedupBroadcast}) ==
                newsEvents(store, news));

        SECTION("the next bump pays more")
        {
            speedup(outcome, 102);
            REQUIRE(SpeedupOutcome::sent == outcome);
            REQUIRE(2 == record.attempts.size());
            REQUIRE(15 == record.attempts[1].feeRate);
            REQUIRE(record.attempts[0].fee < record.attempts[1].fee);
            REQUIRE(utxo.outpoint() == record.funding);
        }
        SECTION("settling on the child")
        {
            const auto change = child.outputs[0].value;
            txcoord::StoreTransaction txn(store);
            REQUIRE(engine.settle(txn, record, attempt.txid));
            REQUIRE(txn.commit());
            REQUIRE(record.funding.empty());

            txcoord::FundingUtxo result;
            REQUIRE(txcoord::TXC_CC_UnknownIdentifier ==
                    fundingOf(result, utxo.outpoint()).value());
            REQUIRE(fundingOf(result, attempt.txid + ":0"));
            REQUIRE(change == result.amount);
            REQUIRE("funder" == result.ownerPublicKey);
            REQUIRE(result.isFree());
        }
        SECTION("settling on the parent")
        {
            txcoord::StoreTransaction txn(store);
            REQUIRE(engine.settle(txn, record, record.id));
            REQUIRE(txn.commit());

            txcoord::FundingUtxo result;
            REQUIRE(fundingOf(result, utxo.outpoint()));
            REQUIRE(result.isFree());
        }
    }
    SECTION("replace by fee")
    {
        addFunding();
        record = replaceableDispatch();
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::sent == outcome);

        const auto &attempt = record.attempts[0];
        REQUIRE(SpeedupMethod::rbf == attempt.method);

        bc::transaction_type replacement;
        REQUIRE(txcoord::decodeTx(replacement, broadcaster.sent[0]));
        REQUIRE(2 == replacement.inputs.size());
        REQUIRE(2 == replacement.outputs.size());
        REQUIRE(50000 == replacement.outputs[0].value);

        // It must out-pay the original fee:
        REQUIRE(10000 < attempt.fee);
        REQUIRE(60000 + utxo.amount ==
                50000 + replacement.outputs[1].value + attempt.fee);
    }
    SECTION("no funding")
    {
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::waiting == outcome);
        REQUIRE(record.fundingRequested);
        REQUIRE(record.attempts.empty());

        // Only ask once:
        speedup(outcome, 102);
        REQUIRE(SpeedupOutcome::waiting == outcome);
        REQUIRE(std::vector<NewsEvent>({NewsEvent::insufficientFunding}) ==
                newsEvents(store, news));

        addFunding();
        speedup(outcome, 103);
        REQUIRE(SpeedupOutcome::sent == outcome);
        REQUIRE_FALSE(record.fundingRequested);
    }
    SECTION("funding too small for the fee")
    {
        txcoord::StoreTransaction txn(store);
        REQUIRE(pool.add(txn, funding(20000)));
        REQUIRE(txn.commit());

        // Rates this high need far more than the output holds:
        record.speedup.initialFeeRate = 1000;
        record.lastFeeRate = 0;
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::waiting == outcome);
        REQUIRE(record.funding.empty());
    }
    SECTION("fee budget")
    {
        addFunding();
        record.speedup.maxFeeBudget = 100;
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::gaveUp == outcome);
        REQUIRE(DispatchStatus::needsManualIntervention == record.status);
        REQUIRE(broadcaster.sent.empty());
        REQUIRE(record.funding.empty());

        txcoord::FundingUtxo result;
        REQUIRE(fundingOf(result, utxo.outpoint()));
        REQUIRE(result.isFree());
        REQUIRE(std::vector<NewsEvent>({NewsEvent::feeBudgetExceeded}) ==
                newsEvents(store, news));
    }
    SECTION("rejections escalate")
    {
        addFunding();
        broadcaster.rejections = 1;
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::sent == outcome);
        REQUIRE(15 == record.attempts[0].feeRate);
    }
    SECTION("too many rejections")
    {
        addFunding();
        broadcaster.rejectAll = true;
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::waiting == outcome);
        REQUIRE(DispatchStatus::unconfirmed == record.status);
        REQUIRE(record.attempts.empty());
        REQUIRE(record.funding.empty());
        REQUIRE(22.5 == record.lastFeeRate);
        REQUIRE(101 == record.lastAttemptHeight);

        txcoord::FundingUtxo result;
        REQUIRE(fundingOf(result, utxo.outpoint()));
        REQUIRE(result.isFree());
        REQUIRE(std::vector<NewsEvent>({NewsEvent::speedupFailed}) ==
                newsEvents(store, news));
    }
    SECTION("no way to speed up")
    {
        addFunding();
        record.speedup.hasAnchor = false;
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::gaveUp == outcome);
        REQUIRE(DispatchStatus::needsManualIntervention == record.status);
        REQUIRE(std::vector<NewsEvent>({NewsEvent::speedupFailed}) ==
                newsEvents(store, news));
    }
    SECTION("missing keys")
    {
        addFunding();
        keys.handles.erase("anchor");
        SpeedupOutcome outcome;
        speedup(outcome, 101);
        REQUIRE(SpeedupOutcome::gaveUp == outcome);
        REQUIRE(broadcaster.sent.empty());
    }
}

TEST_CASE("Clamped speedup rates", "[speedup]")
{
    txcoord::Store store;
    REQUIRE(store.open(""));

    txcoord::SpeedupSettings settings;
    settings.maxFeeRate = 20;
    txcoord::SpeedupPolicy policy(settings);
    txcoord::FundingPool pool(10000, 1000);
    txcoord::NewsFeed news(false);
    txcoord::FakeBroadcaster broadcaster;
    txcoord::FakeKeyManager keys;
    txcoord::SpeedupEngine engine(policy, pool, news, broadcaster, keys);

    auto record = anchoredDispatch();
    record.speedup.initialFeeRate = 50;
    {
        txcoord::StoreTransaction txn(store);
        REQUIRE(pool.add(txn, funding(100000)));
        REQUIRE(txn.commit());
    }

    // The first clamp makes news, but later ones do not:
    for (size_t height = 101; height < 103; ++height)
    {
        txcoord::StoreTransaction txn(store);
        SpeedupOutcome outcome;
        REQUIRE(engine.speedup(outcome, txn, record, height, 0));
        REQUIRE(txn.commit());
        REQUIRE(SpeedupOutcome::sent == outcome);
        REQUIRE(20 == record.attempts.back().feeRate);
    }
    REQUIRE(std::vector<NewsEvent>({NewsEvent::feeRateClamped,
                                    NewsEvent::speedupBroadcast,
                                    NewsEvent::speedupBroadcast}) ==
            newsEvents(store, news));
}

namespace {

/**
 * An engine over an in-memory store, for bumping several dispatches.
 */
struct BatchEngine
{
    txcoord::Store store;
    txcoord::SpeedupPolicy policy;
    txcoord::FundingPool pool;
    txcoord::NewsFeed news;
    txcoord::FakeBroadcaster broadcaster;
    txcoord::FakeKeyManager keys;
    txcoord::SpeedupEngine engine;
    std::vector<txcoord::DispatchRecord> records;

    BatchEngine(const txcoord::SpeedupSettings &settings):
        policy(settings),
        pool(1000, 1000),
        news(false),
        engine(policy, pool, news, broadcaster, keys)
    {
        REQUIRE(store.open(""));
        for (uint8_t seed: {1, 3, 4})
            records.push_back(anchoredDispatch(seed));
    }

    void
    fund(uint64_t amount, char digit)
    {
        txcoord::StoreTransaction txn(store);
        REQUIRE(pool.add(txn, funding(amount, digit)));
        REQUIRE(txn.commit());
    }

    std::vector<SpeedupOutcome>
    bump(std::vector<txcoord::DispatchRecord> &group, size_t height)
    {
        std::vector<SpeedupOutcome> out;
        txcoord::StoreTransaction txn(store);
        REQUIRE(engine.speedupBatch(out, txn, group, height, 0));
        for (const auto &record: group)
            REQUIRE(txcoord::dispatchSave(txn, record));
        REQUIRE(txn.commit());
        return out;
    }

    txcoord::FundingUtxo
    fundingAt(const std::string &outpoint)
    {
        txcoord::StoreTransaction txn(store);
        txcoord::FundingUtxo out;
        REQUIRE(pool.get(out, txn, outpoint));
        return out;
    }

    bc::transaction_type
    sentTx(size_t i)
    {
        bc::transaction_type out;
        REQUIRE(txcoord::decodeTx(out, broadcaster.sent.at(i)));
        return out;
    }
};

} // namespace

TEST_CASE("Batched children", "[speedup][batch]")
{
    BatchEngine e((txcoord::SpeedupSettings()));
    const auto outpoint = funding(100000).outpoint();

    SECTION("one child pays for every parent")
    {
        e.fund(100000, 'f');
        auto outcomes = e.bump(e.records, 101);
        REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::sent) == outcomes);
        REQUIRE(1 == e.broadcaster.sent.size());

        const auto child = e.sentTx(0);
        REQUIRE(4 == child.inputs.size());
        REQUIRE(1 == child.outputs.size());
        for (size_t i = 0; i < 3; ++i)
        {
            bc::transaction_type parent;
            REQUIRE(txcoord::decodeTx(parent, e.records[i].rawTx));
            REQUIRE(bc::hash_transaction(parent) == child.inputs[i].previous_output.hash);
            REQUIRE(1 == child.inputs[i].previous_output.index);
        }

        const auto attempt = e.records[0].attempts.at(0);
        REQUIRE(txcoord::txidOf(child) == attempt.txid);
        REQUIRE(outpoint == attempt.funding);
        REQUIRE(3 * 1000 + 100000 == child.outputs[0].value + attempt.fee);

        // The fee covers the whole package at the starting rate:
        size_t size = txcoord::estimateSize(child, 0);
        for (const auto &record: e.records)
            size += record.rawTx.size();
        REQUIRE(10 * size <= attempt.fee);

        for (const auto &record: e.records)
        {
            REQUIRE(DispatchStatus::spedUp == record.status);
            REQUIRE(1 == record.attempts.size());
            REQUIRE(attempt.txid == record.attempts[0].txid);
            REQUIRE(3 == record.attempts[0].batch.size());
            REQUIRE(outpoint == record.funding);
        }
        REQUIRE(e.records[0].id == e.fundingAt(outpoint).reservedBy);
        REQUIRE(std::vector<NewsEvent>(3, NewsEvent::speedupBroadcast) ==
                newsEvents(e.store, e.news));

        // The batch survives a trip through the store:
        {
            txcoord::StoreTransaction txn(e.store);
            txcoord::DispatchRecord loaded;
            REQUIRE(txcoord::dispatchLoad(loaded, txn, e.records[1].id));
            REQUIRE(e.records[1].attempts[0].batch == loaded.attempts.at(0).batch);
            REQUIRE(outpoint == loaded.attempts[0].funding);
        }

        SECTION("settling the shared child")
        {
            txcoord::StoreTransaction txn(e.store);
            for (auto &record: e.records)
                REQUIRE(e.engine.settle(txn, record, attempt.txid));
            REQUIRE(txn.commit());

            txcoord::FundingUtxoList left;
            txcoord::StoreTransaction check(e.store);
            REQUIRE(e.pool.list(left, check));
            REQUIRE(1 == left.size());
            REQUIRE(attempt.txid + ":0" == left[0].outpoint());
            REQUIRE(child.outputs[0].value == left[0].amount);
            for (const auto &record: e.records)
                REQUIRE(record.funding.empty());
        }
        SECTION("the batch goes out again whole")
        {
            outcomes = e.bump(e.records, 102);
            REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::sent) == outcomes);
            REQUIRE(2 == e.broadcaster.sent.size());
            REQUIRE(4 == e.sentTx(1).inputs.size());
            for (const auto &record: e.records)
            {
                REQUIRE(2 == record.attempts.size());
                REQUIRE(15 == record.attempts[1].feeRate);
                REQUIRE(outpoint == record.funding);
            }
            REQUIRE(attempt.fee < e.records[0].attempts[1].fee);
        }
        SECTION("a parent that confirms alone hands on the funding")
        {
            {
                txcoord::StoreTransaction txn(e.store);
                REQUIRE(e.engine.settle(txn, e.records[0], e.records[0].id));
                REQUIRE(txcoord::dispatchSave(txn, e.records[0]));
                REQUIRE(txn.commit());
            }
            REQUIRE(e.records[0].funding.empty());
            REQUIRE(e.records[1].id == e.fundingAt(outpoint).reservedBy);

            std::vector<txcoord::DispatchRecord> rest(e.records.begin() + 1,
                                                      e.records.end());
            outcomes = e.bump(rest, 102);
            REQUIRE(std::vector<SpeedupOutcome>(2, SpeedupOutcome::sent) == outcomes);
            const auto next = e.sentTx(1);
            REQUIRE(3 == next.inputs.size());
            REQUIRE(2 == rest[0].attempts[1].batch.size());
        }
    }
    SECTION("short funding means one child each")
    {
        // Enough for any one child, but not for all three:
        e.fund(6000, 'a');
        e.fund(6000, 'b');
        e.fund(6000, 'c');

        auto outcomes = e.bump(e.records, 101);
        REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::sent) == outcomes);
        REQUIRE(3 == e.broadcaster.sent.size());
        for (size_t i = 0; i < 3; ++i)
        {
            REQUIRE(2 == e.sentTx(i).inputs.size());
            REQUIRE(e.records[i].attempts.at(0).batch.empty());
        }
    }
    SECTION("a tight budget means one child each")
    {
        e.fund(100000, 'f');
        e.fund(100000, 'a');
        e.fund(100000, 'b');
        e.records[1].speedup.maxFeeBudget = 6000;

        auto outcomes = e.bump(e.records, 101);
        REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::sent) == outcomes);
        REQUIRE(3 == e.broadcaster.sent.size());
        REQUIRE(e.records[1].attempts.at(0).fee <= 6000);
    }
    SECTION("every broadcast rejected")
    {
        e.fund(100000, 'f');
        e.broadcaster.rejectAll = true;
        auto outcomes = e.bump(e.records, 101);
        REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::waiting) == outcomes);
        REQUIRE(e.fundingAt(outpoint).isFree());
        for (const auto &record: e.records)
        {
            REQUIRE(record.funding.empty());
            REQUIRE(101 == record.lastAttemptHeight);
        }
        REQUIRE(std::vector<NewsEvent>(3, NewsEvent::speedupFailed) ==
                newsEvents(e.store, e.news));
    }
}

TEST_CASE("Batch weight limit", "[speedup][batch]")
{
    txcoord::SpeedupSettings settings;

    SECTION("heavy batches split")
    {
        // Room for two of these parents, but not three:
        settings.maxBatchWeight = 3000;
        BatchEngine e(settings);
        e.fund(100000, 'a');
        e.fund(50000, 'b');

        auto outcomes = e.bump(e.records, 101);
        REQUIRE(std::vector<SpeedupOutcome>(3, SpeedupOutcome::sent) == outcomes);
        REQUIRE(2 == e.broadcaster.sent.size());
        REQUIRE(3 == e.sentTx(0).inputs.size());
        REQUIRE(2 == e.sentTx(1).inputs.size());

        REQUIRE(2 == e.records[0].attempts.at(0).batch.size());
        REQUIRE(e.records[0].funding == e.records[1].funding);
        REQUIRE(e.records[2].attempts.at(0).batch.empty());
        REQUIRE(e.records[0].funding != e.records[2].funding);
    }
    SECTION("zero turns batching off")
    {
        settings.maxBatchWeight = 0;
        BatchEngine e(settings);
        REQUIRE_FALSE(e.engine.canBatch(e.records[0]));
    }
    SECTION("who may batch")
    {
        BatchEngine e(settings);
        e.fund(100000, 'a');
        auto &record = e.records[0];
        REQUIRE(e.engine.canBatch(record));

        // Only CPFP children can be shared:
        auto replaceable = replaceableDispatch();
        REQUIRE_FALSE(e.engine.canBatch(replaceable));

        // A dispatch bumped on its own keeps going alone:
        std::vector<txcoord::DispatchRecord> alone{record};
        e.bump(alone, 101);
        REQUIRE(1 == alone[0].attempts.size());
        REQUIRE_FALSE(e.engine.canBatch(alone[0]));
    }
}
