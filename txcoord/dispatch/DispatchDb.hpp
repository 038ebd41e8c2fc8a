/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Transactions the coordinator has broadcast on the caller's behalf.
 */

#ifndef TXCOORD_DISPATCH_DISPATCH_DB_HPP
#define TXCOORD_DISPATCH_DISPATCH_DB_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <time.h>
#include <vector>

namespace txcoord {

class StoreTransaction;

enum class DispatchStatus
{
    /// Waiting for the chain to reach the target height.
    scheduled,
    /// Saved, but the broadcast has not been confirmed as sent.
    broadcasting,
    /// Sent to the network, but not yet in a block.
    unconfirmed,
    /// At least one fee bump has been sent.
    spedUp,
    /// Buried under enough blocks.
    confirmed,
    /// No longer watched.
    finalized,
    /// A scheduled broadcast was rejected.
    failed,
    /// The coordinator gave up on speeding this one up.
    needsManualIntervention
};

enum class SpeedupMethod
{
    none,
    /// Child pays for parent.
    cpfp,
    /// Replace by fee.
    rbf
};

const char *
dispatchStatusName(DispatchStatus status);

const char *
speedupMethodName(SpeedupMethod method);

/**
 * An input of the original transaction, as far as RBF needs to know.
 */
struct InputSource
{
    uint64_t amount = 0;
    std::string keyHandle;
};

/**
 * Caller instructions for accelerating a stalled transaction.
 */
struct SpeedupData
{
    /// The transaction has an output we can spend for CPFP.
    bool hasAnchor = false;
    uint32_t anchorVout = 0;
    std::string anchorKeyHandle;

    /// The transaction may be replaced, given the keys for every input.
    bool replaceable = false;
    std::vector<InputSource> inputs;

    /// Blocks to wait before bumping. Zero disables this criterion.
    size_t thresholdBlocks = 0;
    /// Seconds to wait before bumping. Zero disables this criterion.
    time_t thresholdSeconds = 0;

    /// Starting fee rate, in satoshis per byte.
    double initialFeeRate = 0;
    /// The most any single bump may pay. Zero means no limit.
    uint64_t maxFeeBudget = 0;
};

/**
 * A fee-bump transaction the network accepted.
 */
struct SpeedupAttempt
{
    std::string txid;
    DataChunk rawTx;
    SpeedupMethod method = SpeedupMethod::none;
    double feeRate = 0;
    uint64_t fee = 0;
    size_t height = 0;
    time_t time = 0;

    /// The funding outpoint the bump spends, for CPFP.
    std::string funding;
    /// Every parent a batched CPFP child pays for, this one included.
    /// Empty when the child has a single parent.
    std::vector<std::string> batch;
};

struct DispatchRecord
{
    std::string id;
    DataChunk rawTx;
    bool hasSpeedup = false;
    SpeedupData speedup;
    std::string context;
    DispatchStatus status = DispatchStatus::broadcasting;

    /// Broadcast once the chain reaches this height. Zero means now.
    size_t targetHeight = 0;
    size_t broadcastHeight = 0;
    time_t broadcastTime = 0;
    /// Consecutive rejected rebroadcasts.
    unsigned broadcastFailures = 0;

    std::vector<SpeedupAttempt> attempts;
    /// The rate of the most recent bump, whether it went out or not.
    double lastFeeRate = 0;
    size_t lastAttemptHeight = 0;
    time_t lastAttemptTime = 0;

    /// The funding outpoint reserved for this dispatch, if any.
    std::string funding;
    /// An insufficientFunding news item has gone out since the last
    /// successful reservation.
    bool fundingRequested = false;

    /// The txid whose confirmation settled this dispatch, if any.
    std::string winner;
};

/**
 * Returns true if the dispatch exists.
 */
bool
dispatchExists(StoreTransaction &txn, const std::string &id);

/**
 * Looks up a dispatch by txid.
 */
Status
dispatchLoad(DispatchRecord &result, StoreTransaction &txn,
             const std::string &id);

/**
 * Loads every dispatch, sorted by txid.
 */
Status
dispatchList(std::vector<DispatchRecord> &result, StoreTransaction &txn);

/**
 * Inserts or updates a dispatch.
 */
Status
dispatchSave(StoreTransaction &txn, const DispatchRecord &record);

void
dispatchErase(StoreTransaction &txn, const std::string &id);

} // namespace txcoord

#endif
