/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FundingPool.hpp"
#include "../json/JsonObject.hpp"
#include "../store/Store.hpp"
#include "../util/Debug.hpp"
#include <algorithm>

namespace txcoord {

#define FUNDING_TABLE "funding"

struct FundingJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(FundingJson, JsonObject)

    TXC_JSON_STRING(txid, "txid", nullptr)
    TXC_JSON_INTEGER(vout, "vout", 0)
    TXC_JSON_INTEGER(amount, "amount", 0)
    TXC_JSON_STRING(ownerPublicKey, "ownerPublicKey", nullptr)
    TXC_JSON_STRING(reservedBy, "reservedBy", "")

    Status
    pack(const FundingUtxo &in)
    {
        TXC_CHECK(txidSet(in.txid));
        TXC_CHECK(voutSet(in.vout));
        TXC_CHECK(amountSet(in.amount));
        TXC_CHECK(ownerPublicKeySet(in.ownerPublicKey));
        TXC_CHECK(reservedBySet(in.reservedBy));
        return Status();
    }

    Status
    unpack(FundingUtxo &result) const
    {
        TXC_CHECK(txidOk());
        TXC_CHECK(voutOk());
        TXC_CHECK(amountOk());
        TXC_CHECK(ownerPublicKeyOk());

        FundingUtxo out;
        out.txid = txid();
        out.vout = vout();
        out.amount = amount();
        out.ownerPublicKey = ownerPublicKey();
        out.reservedBy = reservedBy();

        result = std::move(out);
        return Status();
    }
};

std::string
FundingUtxo::outpoint() const
{
    return txid + ":" + std::to_string(vout);
}

FundingPool::FundingPool(uint64_t minAmount, uint64_t feeMargin):
    minAmount_(minAmount),
    feeMargin_(feeMargin)
{
}

Status
FundingPool::add(StoreTransaction &txn, const FundingUtxo &utxo)
{
    if (utxo.txid.size() != 64)
        return TXC_ERROR(TXC_CC_InvalidRequest, "Bad funding txid " + utxo.txid);
    if (utxo.ownerPublicKey.empty())
        return TXC_ERROR(TXC_CC_InvalidRequest, "Funding needs an owner key");
    if (utxo.amount < minAmount_)
        return TXC_ERROR(TXC_CC_InvalidRequest, "Funding of " +
                         std::to_string(utxo.amount) + " is below the minimum " +
                         std::to_string(minAmount_));

    TXC_CHECK(insert(txn, utxo));
    return Status();
}

Status
FundingPool::addChange(StoreTransaction &txn, const FundingUtxo &utxo)
{
    TXC_CHECK(insert(txn, utxo));
    TXC_DebugLog("Added change %s (%llu) to the pool", utxo.outpoint().c_str(),
                 static_cast<unsigned long long>(utxo.amount));
    return Status();
}

Status
FundingPool::reserve(FundingUtxo &result, StoreTransaction &txn,
                     uint64_t amountHint, const std::string &dispatchId)
{
    FundingUtxoList utxos;
    TXC_CHECK(list(utxos, txn));

    // Smallest first, with the outpoint as the tie breaker:
    std::sort(utxos.begin(), utxos.end(),
              [](const FundingUtxo &a, const FundingUtxo &b)
    {
        if (a.amount != b.amount)
            return a.amount < b.amount;
        return a.outpoint() < b.outpoint();
    });

    const uint64_t needed = amountHint + feeMargin_;
    for (auto &utxo: utxos)
    {
        if (!utxo.isFree() || utxo.amount < needed)
            continue;

        // Re-read the row, so the commit fails if anyone else touches it:
        FundingUtxo current;
        TXC_CHECK(get(current, txn, utxo.outpoint()));
        if (!current.isFree())
            continue;

        current.reservedBy = dispatchId;
        TXC_CHECK(save(txn, current));
        TXC_DebugLog("Reserved %s (%llu) for %s", current.outpoint().c_str(),
                     static_cast<unsigned long long>(current.amount),
                     dispatchId.c_str());

        result = current;
        return Status();
    }

    return TXC_ERROR(TXC_CC_InsufficientFunding, "No funding covers " +
                     std::to_string(needed) + " satoshis");
}

Status
FundingPool::release(StoreTransaction &txn, const std::string &outpoint)
{
    FundingUtxo utxo;
    TXC_CHECK(get(utxo, txn, outpoint));
    if (utxo.isFree())
        return TXC_ERROR(TXC_CC_Error, "Funding " + outpoint + " is not reserved");

    TXC_DebugLog("Released %s from %s", outpoint.c_str(), utxo.reservedBy.c_str());
    utxo.reservedBy.clear();
    TXC_CHECK(save(txn, utxo));
    return Status();
}

Status
FundingPool::consume(StoreTransaction &txn, const std::string &outpoint)
{
    FundingUtxo utxo;
    TXC_CHECK(get(utxo, txn, outpoint));
    if (utxo.isFree())
        return TXC_ERROR(TXC_CC_Error, "Funding " + outpoint + " is not reserved");

    TXC_DebugLog("Consumed %s", outpoint.c_str());
    txn.erase(FUNDING_TABLE, outpoint);
    return Status();
}

Status
FundingPool::transfer(StoreTransaction &txn, const std::string &outpoint,
                      const std::string &from, const std::string &to)
{
    FundingUtxo utxo;
    TXC_CHECK(get(utxo, txn, outpoint));
    if (utxo.reservedBy != from)
        return TXC_ERROR(TXC_CC_Error, "Funding " + outpoint + " is not held by " + from);

    TXC_DebugLog("Moved %s from %s to %s", outpoint.c_str(), from.c_str(), to.c_str());
    utxo.reservedBy = to;
    TXC_CHECK(save(txn, utxo));
    return Status();
}

Status
FundingPool::revoke(StoreTransaction &txn, const std::string &outpoint)
{
    FundingUtxo utxo;
    TXC_CHECK(get(utxo, txn, outpoint));
    if (!utxo.isFree())
        return TXC_ERROR(TXC_CC_InvalidRequest,
            "Funding " + outpoint + " is held by " + utxo.reservedBy);

    TXC_DebugLog("Revoked %s", outpoint.c_str());
    txn.erase(FUNDING_TABLE, outpoint);
    return Status();
}

Status
FundingPool::get(FundingUtxo &result, StoreTransaction &txn,
                 const std::string &outpoint)
{
    JsonPtr json;
    if (!txn.find(json, FUNDING_TABLE, outpoint))
        return TXC_ERROR(TXC_CC_UnknownIdentifier, "No funding " + outpoint);

    TXC_CHECK(FundingJson(json).unpack(result));
    return Status();
}

Status
FundingPool::list(FundingUtxoList &result, StoreTransaction &txn)
{
    FundingUtxoList out;
    for (const auto &row: txn.scan(FUNDING_TABLE))
    {
        FundingUtxo utxo;
        TXC_CHECK(FundingJson(row.second).unpack(utxo));
        out.push_back(utxo);
    }

    result = std::move(out);
    return Status();
}

Status
FundingPool::size(size_t &result, StoreTransaction &txn)
{
    result = txn.scan(FUNDING_TABLE).size();
    return Status();
}

Status
FundingPool::insert(StoreTransaction &txn, const FundingUtxo &utxo)
{
    JsonPtr existing;
    if (txn.find(existing, FUNDING_TABLE, utxo.outpoint()))
        return TXC_ERROR(TXC_CC_DuplicateUtxo, "Duplicate funding " + utxo.outpoint());

    FundingUtxo out = utxo;
    out.reservedBy.clear();
    TXC_CHECK(save(txn, out));
    return Status();
}

Status
FundingPool::save(StoreTransaction &txn, const FundingUtxo &utxo)
{
    FundingJson json;
    TXC_CHECK(json.pack(utxo));
    txn.put(FUNDING_TABLE, utxo.outpoint(), json);
    return Status();
}

} // namespace txcoord
