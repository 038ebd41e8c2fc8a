/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_FUNDING_FUNDING_POOL_HPP
#define TXCOORD_FUNDING_FUNDING_POOL_HPP

#include "../util/Status.hpp"
#include <vector>

namespace txcoord {

class StoreTransaction;

/**
 * An output set aside to pay for fee bumps.
 */
struct FundingUtxo
{
    std::string txid;
    uint32_t vout = 0;
    uint64_t amount = 0;
    /// Key manager handle for the key that can spend this output.
    std::string ownerPublicKey;
    /// The dispatch holding this output, or empty if it is free.
    std::string reservedBy;

    /**
     * The "txid:vout" string that names this output.
     */
    std::string
    outpoint() const;

    bool
    isFree() const { return reservedBy.empty(); }
};

typedef std::vector<FundingUtxo> FundingUtxoList;

/**
 * The set of outputs the coordinator may spend on fee bumps.
 *
 * Every change goes through the caller's store transaction,
 * so a reservation only sticks if the whole transaction commits.
 */
class FundingPool
{
public:
    /**
     * @param minAmount The smallest output `add` will accept.
     * @param feeMargin Extra satoshis a reserved output must carry
     * beyond the amount asked for.
     */
    FundingPool(uint64_t minAmount, uint64_t feeMargin);

    /**
     * Adds a free output to the pool.
     * Fails with TXC_CC_DuplicateUtxo if the outpoint is already here.
     */
    Status
    add(StoreTransaction &txn, const FundingUtxo &utxo);

    /**
     * Returns the change from a confirmed fee bump to the pool.
     * Unlike `add`, this takes anything above dust.
     */
    Status
    addChange(StoreTransaction &txn, const FundingUtxo &utxo);

    /**
     * Reserves the smallest free output that covers `amountHint`
     * plus the fee margin.
     * Fails with TXC_CC_InsufficientFunding if there is no such output.
     */
    Status
    reserve(FundingUtxo &result, StoreTransaction &txn,
            uint64_t amountHint, const std::string &dispatchId);

    /**
     * Returns a reserved output to the free set.
     */
    Status
    release(StoreTransaction &txn, const std::string &outpoint);

    /**
     * Removes a reserved output for good, once its spend confirms.
     */
    Status
    consume(StoreTransaction &txn, const std::string &outpoint);

    /**
     * Hands a reservation from one dispatch to another.
     */
    Status
    transfer(StoreTransaction &txn, const std::string &outpoint,
             const std::string &from, const std::string &to);

    /**
     * Takes a free output back out of the pool,
     * such as the change of a bump that a reorg undid.
     * Fails with TXC_CC_InvalidRequest if a dispatch holds it.
     */
    Status
    revoke(StoreTransaction &txn, const std::string &outpoint);

    Status
    get(FundingUtxo &result, StoreTransaction &txn,
        const std::string &outpoint);

    /**
     * Lists every output in the pool, sorted by outpoint.
     */
    Status
    list(FundingUtxoList &result, StoreTransaction &txn);

    Status
    size(size_t &result, StoreTransaction &txn);

private:
    const uint64_t minAmount_;
    const uint64_t feeMargin_;

    Status
    insert(StoreTransaction &txn, const FundingUtxo &utxo);

    Status
    save(StoreTransaction &txn, const FundingUtxo &utxo);
};

} // namespace txcoord

#endif
