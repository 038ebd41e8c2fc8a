/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "DispatchDb.hpp"
#include "../crypto/Encoding.hpp"
#include "../json/JsonArray.hpp"
#include "../json/JsonObject.hpp"
#include "../store/Store.hpp"
#include "../util/Names.hpp"

namespace txcoord {

#define DISPATCH_TABLE "dispatches"

static const char *statusNames[] =
{
    "scheduled",
    "broadcasting",
    "unconfirmed",
    "spedUp",
    "confirmed",
    "finalized",
    "failed",
    "needsManualIntervention"
};

static const char *methodNames[] =
{
    "none",
    "cpfp",
    "rbf"
};

const char *
dispatchStatusName(DispatchStatus status)
{
    return statusNames[static_cast<size_t>(status)];
}

const char *
speedupMethodName(SpeedupMethod method)
{
    return methodNames[static_cast<size_t>(method)];
}

struct InputSourceJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(InputSourceJson, JsonObject)

    TXC_JSON_INTEGER(amount, "amount", 0)
    TXC_JSON_STRING(keyHandle, "keyHandle", "")
};

struct SpeedupJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(SpeedupJson, JsonObject)

    TXC_JSON_BOOLEAN(hasAnchor, "hasAnchor", false)
    TXC_JSON_INTEGER(anchorVout, "anchorVout", 0)
    TXC_JSON_STRING(anchorKeyHandle, "anchorKeyHandle", "")
    TXC_JSON_BOOLEAN(replaceable, "replaceable", false)
    TXC_JSON_VALUE(inputs, "inputs", JsonArray)
    TXC_JSON_INTEGER(thresholdBlocks, "thresholdBlocks", 0)
    TXC_JSON_INTEGER(thresholdSeconds, "thresholdSeconds", 0)
    TXC_JSON_NUMBER(initialFeeRate, "initialFeeRate", 0)
    TXC_JSON_INTEGER(maxFeeBudget, "maxFeeBudget", 0)
};

struct AttemptJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(AttemptJson, JsonObject)

    TXC_JSON_STRING(txid, "txid", nullptr)
    TXC_JSON_STRING(data, "data", nullptr)
    TXC_JSON_STRING(method, "method", "none")
    TXC_JSON_NUMBER(feeRate, "feeRate", 0)
    TXC_JSON_INTEGER(fee, "fee", 0)
    TXC_JSON_INTEGER(height, "height", 0)
    TXC_JSON_INTEGER(time, "time", 0)
    TXC_JSON_STRING(funding, "funding", "")
    TXC_JSON_VALUE(batch, "batch", JsonArray)
};

struct DispatchJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(DispatchJson, JsonObject)

    TXC_JSON_STRING(txid, "txid", nullptr)
    TXC_JSON_STRING(data, "data", nullptr)
    TXC_JSON_VALUE(speedup, "speedup", JsonPtr)
    TXC_JSON_STRING(context, "context", "")
    TXC_JSON_STRING(status, "status", nullptr)
    TXC_JSON_INTEGER(targetHeight, "targetHeight", 0)
    TXC_JSON_INTEGER(broadcastHeight, "broadcastHeight", 0)
    TXC_JSON_INTEGER(broadcastTime, "broadcastTime", 0)
    TXC_JSON_INTEGER(broadcastFailures, "broadcastFailures", 0)
    TXC_JSON_VALUE(attempts, "attempts", JsonArray)
    TXC_JSON_NUMBER(lastFeeRate, "lastFeeRate", 0)
    TXC_JSON_INTEGER(lastAttemptHeight, "lastAttemptHeight", 0)
    TXC_JSON_INTEGER(lastAttemptTime, "lastAttemptTime", 0)
    TXC_JSON_STRING(funding, "funding", "")
    TXC_JSON_BOOLEAN(fundingRequested, "fundingRequested", false)
    TXC_JSON_STRING(winner, "winner", "")

    Status
    pack(const DispatchRecord &in);

    Status
    unpack(DispatchRecord &result) const;
};

static Status
packSpeedup(SpeedupJson &out, const SpeedupData &in)
{
    TXC_CHECK(out.hasAnchorSet(in.hasAnchor));
    TXC_CHECK(out.anchorVoutSet(in.anchorVout));
    TXC_CHECK(out.anchorKeyHandleSet(in.anchorKeyHandle));
    TXC_CHECK(out.replaceableSet(in.replaceable));
    TXC_CHECK(out.thresholdBlocksSet(in.thresholdBlocks));
    TXC_CHECK(out.thresholdSecondsSet(in.thresholdSeconds));
    TXC_CHECK(out.initialFeeRateSet(in.initialFeeRate));
    TXC_CHECK(out.maxFeeBudgetSet(in.maxFeeBudget));

    JsonArray inputsJson;
    for (const auto &input: in.inputs)
    {
        InputSourceJson inputJson;
        TXC_CHECK(inputJson.amountSet(input.amount));
        TXC_CHECK(inputJson.keyHandleSet(input.keyHandle));
        TXC_CHECK(inputsJson.append(inputJson));
    }
    TXC_CHECK(out.inputsSet(inputsJson));

    return Status();
}

static void
unpackSpeedup(SpeedupData &out, const SpeedupJson &in)
{
    out.hasAnchor = in.hasAnchor();
    out.anchorVout = in.anchorVout();
    out.anchorKeyHandle = in.anchorKeyHandle();
    out.replaceable = in.replaceable();
    out.thresholdBlocks = in.thresholdBlocks();
    out.thresholdSeconds = in.thresholdSeconds();
    out.initialFeeRate = in.initialFeeRate();
    out.maxFeeBudget = in.maxFeeBudget();

    auto inputsJson = in.inputs();
    size_t size = inputsJson.size();
    for (size_t i = 0; i < size; i++)
    {
        InputSourceJson inputJson(inputsJson[i]);
        InputSource input;
        input.amount = inputJson.amount();
        input.keyHandle = inputJson.keyHandle();
        out.inputs.push_back(input);
    }
}

Status
DispatchJson::pack(const DispatchRecord &in)
{
    TXC_CHECK(txidSet(in.id));
    TXC_CHECK(dataSet(base64Encode(in.rawTx)));
    TXC_CHECK(contextSet(in.context));
    TXC_CHECK(statusSet(dispatchStatusName(in.status)));
    TXC_CHECK(targetHeightSet(in.targetHeight));
    TXC_CHECK(broadcastHeightSet(in.broadcastHeight));
    TXC_CHECK(broadcastTimeSet(in.broadcastTime));
    TXC_CHECK(broadcastFailuresSet(in.broadcastFailures));
    TXC_CHECK(lastFeeRateSet(in.lastFeeRate));
    TXC_CHECK(lastAttemptHeightSet(in.lastAttemptHeight));
    TXC_CHECK(lastAttemptTimeSet(in.lastAttemptTime));
    TXC_CHECK(fundingSet(in.funding));
    TXC_CHECK(fundingRequestedSet(in.fundingRequested));
    TXC_CHECK(winnerSet(in.winner));

    if (in.hasSpeedup)
    {
        SpeedupJson speedupJson;
        TXC_CHECK(packSpeedup(speedupJson, in.speedup));
        TXC_CHECK(speedupSet(speedupJson));
    }

    JsonArray attemptsJson;
    for (const auto &attempt: in.attempts)
    {
        AttemptJson attemptJson;
        TXC_CHECK(attemptJson.txidSet(attempt.txid));
        TXC_CHECK(attemptJson.dataSet(base64Encode(attempt.rawTx)));
        TXC_CHECK(attemptJson.methodSet(speedupMethodName(attempt.method)));
        TXC_CHECK(attemptJson.feeRateSet(attempt.feeRate));
        TXC_CHECK(attemptJson.feeSet(attempt.fee));
        TXC_CHECK(attemptJson.heightSet(attempt.height));
        TXC_CHECK(attemptJson.timeSet(attempt.time));
        TXC_CHECK(attemptJson.fundingSet(attempt.funding));
        if (!attempt.batch.empty())
        {
            JsonArray batchJson;
            for (const auto &parent: attempt.batch)
                TXC_CHECK(batchJson.append(json_string(parent.c_str())));
            TXC_CHECK(attemptJson.batchSet(batchJson));
        }
        TXC_CHECK(attemptsJson.append(attemptJson));
    }
    TXC_CHECK(attemptsSet(attemptsJson));

    return Status();
}

Status
DispatchJson::unpack(DispatchRecord &result) const
{
    DispatchRecord out;

    TXC_CHECK(txidOk());
    TXC_CHECK(dataOk());
    TXC_CHECK(statusOk());
    out.id = txid();
    TXC_CHECK(base64Decode(out.rawTx, data()));
    TXC_CHECK(nameParse(out.status, statusNames, status()));
    out.context = context();
    out.targetHeight = targetHeight();
    out.broadcastHeight = broadcastHeight();
    out.broadcastTime = broadcastTime();
    out.broadcastFailures = broadcastFailures();
    out.lastFeeRate = lastFeeRate();
    out.lastAttemptHeight = lastAttemptHeight();
    out.lastAttemptTime = lastAttemptTime();
    out.funding = funding();
    out.fundingRequested = fundingRequested();
    out.winner = winner();

    auto speedupJson = speedup();
    if (json_is_object(speedupJson.get()))
    {
        out.hasSpeedup = true;
        unpackSpeedup(out.speedup, SpeedupJson(speedupJson));
    }

    auto attemptsJson = attempts();
    size_t size = attemptsJson.size();
    for (size_t i = 0; i < size; i++)
    {
        AttemptJson attemptJson(attemptsJson[i]);
        TXC_CHECK(attemptJson.txidOk());
        TXC_CHECK(attemptJson.dataOk());

        SpeedupAttempt attempt;
        attempt.txid = attemptJson.txid();
        TXC_CHECK(base64Decode(attempt.rawTx, attemptJson.data()));
        TXC_CHECK(nameParse(attempt.method, methodNames, attemptJson.method()));
        attempt.feeRate = attemptJson.feeRate();
        attempt.fee = attemptJson.fee();
        attempt.height = attemptJson.height();
        attempt.time = attemptJson.time();
        attempt.funding = attemptJson.funding();

        auto batchJson = attemptJson.batch();
        size_t batchSize = batchJson.size();
        for (size_t j = 0; j < batchSize; j++)
        {
            const char *parent = json_string_value(batchJson[j].get());
            if (!parent)
                return TXC_ERROR(TXC_CC_JSONError, "Bad batch entry");
            attempt.batch.push_back(parent);
        }
        out.attempts.push_back(attempt);
    }

    result = std::move(out);
    return Status();
}

bool
dispatchExists(StoreTransaction &txn, const std::string &id)
{
    JsonPtr json;
    return txn.find(json, DISPATCH_TABLE, id);
}

Status
dispatchLoad(DispatchRecord &result, StoreTransaction &txn,
             const std::string &id)
{
    JsonPtr json;
    if (!txn.find(json, DISPATCH_TABLE, id))
        return TXC_ERROR(TXC_CC_UnknownIdentifier, "Not dispatched: " + id);

    TXC_CHECK(DispatchJson(json).unpack(result));
    return Status();
}

Status
dispatchList(std::vector<DispatchRecord> &result, StoreTransaction &txn)
{
    std::vector<DispatchRecord> out;
    for (const auto &row: txn.scan(DISPATCH_TABLE))
    {
        DispatchRecord record;
        TXC_CHECK(DispatchJson(row.second).unpack(record));
        out.push_back(std::move(record));
    }

    result = std::move(out);
    return Status();
}

Status
dispatchSave(StoreTransaction &txn, const DispatchRecord &record)
{
    DispatchJson json;
    TXC_CHECK(json.pack(record));
    txn.put(DISPATCH_TABLE, record.id, json);
    return Status();
}

void
dispatchErase(StoreTransaction &txn, const std::string &id)
{
    txn.erase(DISPATCH_TABLE, id);
}

} // namespace txcoord
