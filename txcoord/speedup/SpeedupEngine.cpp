/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SpeedupEngine.hpp"
#include "../bitcoin/Utility.hpp"
#include "../funding/FundingPool.hpp"
#include "../spend/Inputs.hpp"
#include "../spend/Outputs.hpp"
#include "../store/Store.hpp"
#include "../util/Debug.hpp"
#include <algorithm>
#include <math.h>

namespace txcoord {

// An unsigned outpoint plus the signature script `estimateSize` assumes:
constexpr size_t inputSize = 41 + 104;

// A CPFP child with its funding input and change, before any anchors:
constexpr size_t childWeight = 4 * (10 + inputSize + 35);

static size_t
parentWeight(const DispatchRecord &record)
{
    return 4 * (record.rawTx.size() + inputSize);
}

SpeedupEngine::SpeedupEngine(const SpeedupPolicy &policy, FundingPool &pool,
                             NewsFeed &news, IBroadcaster &broadcaster,
                             IKeyManager &keys):
    policy_(policy),
    pool_(pool),
    news_(news),
    broadcaster_(broadcaster),
    keys_(keys)
{
}

Status
SpeedupEngine::speedup(SpeedupOutcome &result, StoreTransaction &txn,
                       DispatchRecord &record, size_t height, time_t now)
{
    std::vector<SpeedupOutcome> outcomes;
    TXC_CHECK(bump(outcomes, txn, Members{&record}, height, now));
    result = outcomes.front();
    return Status();
}

Status
SpeedupEngine::speedupBatch(std::vector<SpeedupOutcome> &result,
                            StoreTransaction &txn,
                            std::vector<DispatchRecord> &records,
                            size_t height, time_t now)
{
    std::vector<SpeedupOutcome> out(records.size(), SpeedupOutcome::waiting);
    const size_t limit = policy_.settings().maxBatchWeight;

    // An earlier batch keeps its members, since they share funding:
    std::vector<Members> groups;
    if (!records.empty() && !records.front().attempts.empty())
    {
        groups.push_back(Members());
        for (auto &record: records)
            groups.back().push_back(&record);
    }
    else
    {
        Members group;
        size_t weight = childWeight;
        for (auto &record: records)
        {
            const size_t extra = parentWeight(record);
            if (!group.empty() && limit < weight + extra)
            {
                groups.push_back(group);
                group.clear();
                weight = childWeight;
            }
            group.push_back(&record);
            weight += extra;
        }
        if (!group.empty())
            groups.push_back(group);
    }

    size_t next = 0;
    for (const auto &group: groups)
    {
        std::vector<SpeedupOutcome> outcomes;
        TXC_CHECK(bump(outcomes, txn, group, height, now));
        for (auto outcome: outcomes)
            out[next++] = outcome;
    }

    result = std::move(out);
    return Status();
}

bool
SpeedupEngine::canBatch(const DispatchRecord &record) const
{
    if (!record.hasSpeedup || !policy_.settings().maxBatchWeight)
        return false;

    bc::transaction_type parent;
    if (!decodeTx(parent, record.rawTx))
        return false;
    if (SpeedupMethod::cpfp != policy_.chooseMethod(parent, record.speedup))
        return false;

    if (record.attempts.empty())
        return record.funding.empty();
    return !record.attempts.back().batch.empty();
}

Status
SpeedupEngine::bump(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
                    const Members &members, size_t height, time_t now)
{
    result.assign(members.size(), SpeedupOutcome::waiting);
    const auto &settings = policy_.settings();
    DispatchRecord &lead = *members.front();
    const bool batch = 1 < members.size();
    const bool fresh = lead.attempts.empty();

    std::vector<bc::transaction_type> parents(members.size());
    for (size_t i = 0; i < members.size(); ++i)
        TXC_CHECK(decodeTx(parents[i], members[i]->rawTx));

    auto method = SpeedupMethod::cpfp;
    if (!batch)
    {
        method = policy_.chooseMethod(parents.front(), lead.speedup);
        if (SpeedupMethod::none == method)
            return giveUp(result, txn, members, NewsEvent::speedupFailed,
                          "No anchor output and not replaceable");
    }

    // A shared child pays the highest rate any member is due:
    bool clamped = false;
    bool atCeiling = true;
    double rate = 0;
    uint64_t budget = 0;
    for (auto member: members)
    {
        bool memberClamped = false;
        double memberRate = policy_.nextFeeRate(memberClamped, *member);
        rate = std::max(rate, memberRate);
        clamped = clamped || memberClamped;
        atCeiling = atCeiling && settings.maxFeeRate <= member->lastFeeRate;

        const uint64_t memberBudget = member->speedup.maxFeeBudget;
        if (memberBudget && (!budget || memberBudget < budget))
            budget = memberBudget;
    }

    // Every bump of a dispatch spends the same funding output:
    FundingUtxo funding;
    if (lead.funding.empty())
    {
        // Size the request using a stand-in for the funding input:
        FundingUtxo standIn;
        standIn.txid = std::string(64, '0');
        Plan estimate;
        TXC_CHECK(plan(estimate, parents, members, standIn, method, rate));

        int64_t shortfall = static_cast<int64_t>(estimate.fee) -
                            estimate.otherValue;
        uint64_t hint = std::max<int64_t>(shortfall, 0) + settings.dustThreshold;

        Status s = pool_.reserve(funding, txn, hint, lead.id);
        if (TXC_CC_InsufficientFunding == s.value())
        {
            TXC_DebugLog("%s: %s", lead.id.c_str(), s.message().c_str());
            if (batch)
                return fallBack(result, txn, members, height, now);
            if (!lead.fundingRequested)
            {
                TXC_CHECK(emit(txn, lead, NewsEvent::insufficientFunding,
                               "Needs funding of " + std::to_string(hint) +
                               " satoshis"));
                lead.fundingRequested = true;
            }
            return Status();
        }
        TXC_CHECK(s);

        for (auto member: members)
        {
            member->funding = funding.outpoint();
            member->fundingRequested = false;
        }
    }
    else
    {
        TXC_CHECK(pool_.get(funding, txn, lead.funding));
    }

    if (clamped && !atCeiling)
        for (auto member: members)
            TXC_CHECK(emit(txn, *member, NewsEvent::feeRateClamped,
                           "Fee rate clamped to " +
                           std::to_string(settings.maxFeeRate)));

    for (unsigned i = 0; i < settings.maxBroadcastAttempts; ++i)
    {
        if (i)
            rate = policy_.escalate(clamped, rate);

        Plan p;
        TXC_CHECK(plan(p, parents, members, funding, method, rate));

        if (budget && budget < p.fee)
        {
            if (batch && fresh)
                return fallBack(result, txn, members, height, now);
            return giveUp(result, txn, members, NewsEvent::feeBudgetExceeded,
                          "Fee " + std::to_string(p.fee) + " exceeds budget " +
                          std::to_string(budget));
        }
        if (p.change < static_cast<int64_t>(settings.dustThreshold))
        {
            if (batch && fresh)
                return fallBack(result, txn, members, height, now);
            return giveUp(result, txn, members, NewsEvent::insufficientFunding,
                          "Funding " + lead.funding + " cannot pay fee " +
                          std::to_string(p.fee));
        }
        TXC_CHECK(addChange(p, funding));

        Status s = broadcaster_.signSpeedup(p.tx, p.inputs, p.outputs, keys_);
        if (!s)
        {
            s.log();
            return giveUp(result, txn, members, NewsEvent::speedupFailed,
                          "Cannot sign: " + s.message());
        }

        const auto rawTx = encodeTx(p.tx);
        for (auto member: members)
        {
            member->lastFeeRate = rate;
            member->lastAttemptHeight = height;
            member->lastAttemptTime = now;
        }

        s = broadcaster_.broadcast(rawTx);
        if (!s)
        {
            s.log();
            continue;
        }

        SpeedupAttempt attempt;
        attempt.txid = txidOf(p.tx);
        attempt.rawTx = rawTx;
        attempt.method = method;
        attempt.feeRate = rate;
        attempt.fee = p.fee;
        attempt.height = height;
        attempt.time = now;
        attempt.funding = funding.outpoint();
        if (batch)
            for (auto member: members)
                attempt.batch.push_back(member->id);

        std::string detail = std::string(speedupMethodName(method)) + " " +
                             attempt.txid + " paying " + std::to_string(p.fee);
        if (batch)
            detail += " for " + std::to_string(members.size()) + " parents";

        for (auto member: members)
        {
            member->attempts.push_back(attempt);
            member->status = DispatchStatus::spedUp;
            TXC_CHECK(emit(txn, *member, NewsEvent::speedupBroadcast, detail));
        }
        result.assign(members.size(), SpeedupOutcome::sent);
        return Status();
    }

    // Every try was rejected, so wait for the next window:
    if (fresh)
        TXC_CHECK(releaseAll(txn, members));
    for (auto member: members)
        TXC_CHECK(emit(txn, *member, NewsEvent::speedupFailed,
                       "Broadcast rejected " +
                       std::to_string(settings.maxBroadcastAttempts) + " times"));
    return Status();
}

Status
SpeedupEngine::fallBack(std::vector<SpeedupOutcome> &result,
                        StoreTransaction &txn, const Members &members,
                        size_t height, time_t now)
{
    TXC_DebugLog("Bumping %d dispatches one at a time",
                 static_cast<int>(members.size()));
    TXC_CHECK(releaseAll(txn, members));

    result.assign(members.size(), SpeedupOutcome::waiting);
    for (size_t i = 0; i < members.size(); ++i)
    {
        std::vector<SpeedupOutcome> outcomes;
        TXC_CHECK(bump(outcomes, txn, Members{members[i]}, height, now));
        result[i] = outcomes.front();
    }
    return Status();
}

Status
SpeedupEngine::settle(StoreTransaction &txn, DispatchRecord &record,
                      const std::string &winner)
{
    if (record.funding.empty())
        return Status();

    auto attempt = std::find_if(record.attempts.begin(), record.attempts.end(),
                                [&winner](const SpeedupAttempt &a)
    {
        return a.txid == winner;
    });
    if (record.attempts.end() == attempt)
        return release(txn, record);

    // The winner spent funding from before a reorg, so ours is still unspent:
    if (!attempt->funding.empty() && attempt->funding != record.funding)
        return release(txn, record);

    // A batch sibling may have settled the shared child already:
    FundingUtxo funding;
    Status s = pool_.get(funding, txn, record.funding);
    if (TXC_CC_UnknownIdentifier == s.value())
    {
        record.funding.clear();
        return Status();
    }
    TXC_CHECK(s);
    TXC_CHECK(pool_.consume(txn, record.funding));
    record.funding.clear();

    // The change output always comes last:
    bc::transaction_type tx;
    TXC_CHECK(decodeTx(tx, attempt->rawTx));
    if (tx.outputs.empty())
        return Status();
    const auto &output = tx.outputs.back();
    if (outputIsDust(output.value, policy_.settings().dustThreshold))
        return Status();

    FundingUtxo change;
    change.txid = winner;
    change.vout = tx.outputs.size() - 1;
    change.amount = output.value;
    change.ownerPublicKey = funding.ownerPublicKey;
    s = pool_.addChange(txn, change);
    if (TXC_CC_DuplicateUtxo == s.value())
        s.log();
    else
        TXC_CHECK(s);

    return Status();
}

Status
SpeedupEngine::release(StoreTransaction &txn, DispatchRecord &record)
{
    if (record.funding.empty())
        return Status();

    FundingUtxo funding;
    Status s = pool_.get(funding, txn, record.funding);
    if (TXC_CC_UnknownIdentifier == s.value())
    {
        record.funding.clear();
        return Status();
    }
    TXC_CHECK(s);

    if (funding.reservedBy == record.id)
    {
        // Batch siblings still spend this output in their next bump:
        std::string heir;
        if (!record.attempts.empty())
        {
            for (const auto &id: record.attempts.back().batch)
            {
                if (id == record.id || !dispatchExists(txn, id))
                    continue;
                DispatchRecord sibling;
                TXC_CHECK(dispatchLoad(sibling, txn, id));
                if (sibling.funding == record.funding)
                {
                    heir = id;
                    break;
                }
            }
        }

        if (heir.empty())
            TXC_CHECK(pool_.release(txn, record.funding));
        else
            TXC_CHECK(pool_.transfer(txn, record.funding, record.id, heir));
    }
    record.funding.clear();
    return Status();
}

Status
SpeedupEngine::unsettle(StoreTransaction &txn, DispatchRecord &record)
{
    const std::string winner = record.winner;
    record.winner.clear();

    auto attempt = std::find_if(record.attempts.begin(), record.attempts.end(),
                                [&winner](const SpeedupAttempt &a)
    {
        return a.txid == winner;
    });
    if (record.attempts.end() == attempt)
        return Status();

    bc::transaction_type tx;
    TXC_CHECK(decodeTx(tx, attempt->rawTx));
    if (tx.outputs.empty())
        return Status();

    FundingUtxo change;
    change.txid = winner;
    change.vout = tx.outputs.size() - 1;

    // Change that is gone or already spoken for stays where it is:
    Status s = pool_.revoke(txn, change.outpoint());
    if (TXC_CC_UnknownIdentifier == s.value() ||
            TXC_CC_InvalidRequest == s.value())
        s.log();
    else
        TXC_CHECK(s);
    return Status();
}

Status
SpeedupEngine::plan(Plan &result, const std::vector<bc::transaction_type> &parents,
                    const Members &members, const FundingUtxo &funding,
                    SpeedupMethod method, double rate)
{
    Plan out;
    const auto &parent = parents.front();
    const auto &record = *members.front();

    SpeedupInput fundingInput;
    TXC_CHECK(txidDecode(fundingInput.point.hash, funding.txid));
    fundingInput.point.index = funding.vout;
    fundingInput.amount = funding.amount;
    fundingInput.keyHandle = funding.ownerPublicKey;

    size_t size = 0;
    uint64_t floor = 0;
    if (SpeedupMethod::cpfp == method)
    {
        // A child spending the anchors pays for the whole package:
        for (size_t i = 0; i < parents.size(); ++i)
        {
            const auto &data = members[i]->speedup;
            SpeedupInput anchor;
            anchor.point.hash = bc::hash_transaction(parents[i]);
            anchor.point.index = data.anchorVout;
            anchor.amount = parents[i].outputs[data.anchorVout].value;
            anchor.keyHandle = data.anchorKeyHandle;

            out.inputs.push_back(anchor);
            out.otherValue += anchor.amount;
            size += bc::satoshi_raw_size(parents[i]);
        }
        out.inputs.push_back(fundingInput);
        out.tx.version = 1;
        out.tx.locktime = 0;
        inputsFill(out.tx, out.inputs);

        size += estimateSize(out.tx, 1);
    }
    else
    {
        // A replacement keeps the original inputs and outputs:
        uint64_t totalIn = 0;
        for (size_t i = 0; i < parent.inputs.size(); ++i)
        {
            SpeedupInput input;
            input.point = parent.inputs[i].previous_output;
            input.amount = record.speedup.inputs[i].amount;
            input.keyHandle = record.speedup.inputs[i].keyHandle;
            out.inputs.push_back(input);
            totalIn += input.amount;
        }
        out.inputs.push_back(fundingInput);
        out.outputs = parent.outputs;
        out.tx.version = parent.version;
        out.tx.locktime = parent.locktime;
        inputsFill(out.tx, out.inputs);
        out.tx.outputs = out.outputs;

        size = estimateSize(out.tx, 1);
        out.otherValue = static_cast<int64_t>(totalIn) -
                         static_cast<int64_t>(outputsTotal(parent.outputs));
        floor = std::max<int64_t>(out.otherValue, 0);
    }

    // A replacement must beat what it replaces by at least a satoshi a byte:
    if (!record.attempts.empty())
        floor = std::max(floor, record.attempts.back().fee);

    out.fee = static_cast<uint64_t>(ceil(size * rate));
    if (floor && out.fee < floor + size)
        out.fee = floor + size;

    out.change = out.otherValue + static_cast<int64_t>(funding.amount) -
                 static_cast<int64_t>(out.fee);
    out.tx.outputs.clear();

    result = std::move(out);
    return Status();
}

Status
SpeedupEngine::addChange(Plan &plan, const FundingUtxo &funding)
{
    DataChunk pubkey;
    TXC_CHECK(keys_.publicKey(pubkey, funding.ownerPublicKey));

    bc::transaction_output_type change;
    change.value = plan.change;
    change.script = outputScriptForKey(pubkey);
    plan.outputs.push_back(change);
    return Status();
}

Status
SpeedupEngine::releaseAll(StoreTransaction &txn, const Members &members)
{
    // The lead member holds the reservation for the whole batch:
    TXC_CHECK(release(txn, *members.front()));
    for (auto member: members)
        member->funding.clear();
    return Status();
}

Status
SpeedupEngine::giveUp(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
                      const Members &members, NewsEvent event,
                      const std::string &detail)
{
    // Keep the funding if an earlier bump might still confirm:
    if (members.front()->attempts.empty())
        TXC_CHECK(releaseAll(txn, members));

    for (auto member: members)
    {
        TXC_DebugLog("Giving up on %s: %s", member->id.c_str(), detail.c_str());
        member->status = DispatchStatus::needsManualIntervention;
        TXC_CHECK(emit(txn, *member, event, detail));
    }
    result.assign(members.size(), SpeedupOutcome::gaveUp);
    return Status();
}

Status
SpeedupEngine::emit(StoreTransaction &txn, const DispatchRecord &record,
                    NewsEvent event, const std::string &detail)
{
    NewsItem item;
    item.event = event;
    item.id = record.id;
    item.context = record.context;
    item.detail = detail;
    TXC_CHECK(news_.append(txn, item));
    return Status();
}

} // namespace txcoord
