/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEEDUP_SPEEDUP_ENGINE_HPP
#define TXCOORD_SPEEDUP_SPEEDUP_ENGINE_HPP

#include "SpeedupPolicy.hpp"
#include "../news/NewsFeed.hpp"
#include "../spend/IBroadcaster.hpp"

namespace txcoord {

class FundingPool;
class StoreTransaction;
struct FundingUtxo;

enum class SpeedupOutcome
{
    /// A fee bump went out.
    sent,
    /// Nothing went out, but a later window might do better.
    waiting,
    /// The dispatch needs a human.
    gaveUp
};

/**
 * Builds, signs and broadcasts fee bumps for stalled dispatches,
 * paying for them out of the funding pool.
 *
 * Problems with an individual bump become news items.
 * The engine only returns an error for failures that should
 * abort the whole synchronization step, such as storage trouble.
 */
class SpeedupEngine
{
public:
    SpeedupEngine(const SpeedupPolicy &policy, FundingPool &pool,
                  NewsFeed &news, IBroadcaster &broadcaster,
                  IKeyManager &keys);

    /**
     * Tries to bump a stalled dispatch.
     * Updates the record in place; the caller saves it.
     */
    Status
    speedup(SpeedupOutcome &result, StoreTransaction &txn,
            DispatchRecord &record, size_t height, time_t now);

    /**
     * Bumps several stalled CPFP dispatches with shared children.
     * Each child spends one anchor per parent plus a single funding output,
     * and its package stays under `maxBatchWeight`.
     *
     * The records must either all be unbumped, or all belong to the
     * same earlier batch, which then goes out again as a whole.
     * Unbumped batches the pool or fee budgets cannot carry fall back
     * to one child per dispatch.
     * @param result one outcome per record, in the same order.
     */
    Status
    speedupBatch(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
                 std::vector<DispatchRecord> &records,
                 size_t height, time_t now);

    /**
     * Returns true if a dispatch may share a CPFP child with others.
     */
    bool
    canBatch(const DispatchRecord &record) const;

    /**
     * Settles the funding once one of the dispatch's transactions confirms.
     * If a bump won, its funding is gone and its change joins the pool.
     * If the original won, the funding goes back to the free set.
     */
    Status
    settle(StoreTransaction &txn, DispatchRecord &record,
           const std::string &winner);

    /**
     * Lets go of any funding a dispatch holds.
     */
    Status
    release(StoreTransaction &txn, DispatchRecord &record);

    /**
     * Undoes `settle` after a reorg drops the winning bump,
     * taking its change back out of the pool.
     */
    Status
    unsettle(StoreTransaction &txn, DispatchRecord &record);

private:
    typedef std::vector<DispatchRecord *> Members;

    /**
     * An unsigned fee bump, ready for the broadcaster to sign.
     */
    struct Plan
    {
        bc::transaction_type tx;
        SpeedupInputList inputs;
        bc::transaction_output_list outputs;
        uint64_t fee = 0;
        /// What everything except the funding brings to the fee.
        int64_t otherValue = 0;
        /// Negative if the funding cannot cover the fee.
        int64_t change = 0;
    };

    const SpeedupPolicy &policy_;
    FundingPool &pool_;
    NewsFeed &news_;
    IBroadcaster &broadcaster_;
    IKeyManager &keys_;

    /**
     * Builds, signs and broadcasts one bump for every member.
     * A single member may use either method; a batch is always CPFP.
     */
    Status
    bump(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
         const Members &members, size_t height, time_t now);

    /**
     * Gives up on a batch and bumps each member on its own.
     */
    Status
    fallBack(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
             const Members &members, size_t height, time_t now);

    /**
     * Lays out a bump paying the given rate, minus its change output.
     */
    Status
    plan(Plan &result, const std::vector<bc::transaction_type> &parents,
         const Members &members, const FundingUtxo &funding,
         SpeedupMethod method, double rate);

    /**
     * Sends the leftover funding back to the funding key.
     */
    Status
    addChange(Plan &plan, const FundingUtxo &funding);

    /**
     * Frees the funding a batch reserved before it went out.
     */
    Status
    releaseAll(StoreTransaction &txn, const Members &members);

    Status
    giveUp(std::vector<SpeedupOutcome> &result, StoreTransaction &txn,
           const Members &members, NewsEvent event, const std::string &detail);

    Status
    emit(StoreTransaction &txn, const DispatchRecord &record,
         NewsEvent event, const std::string &detail);
};

} // namespace txcoord

#endif
