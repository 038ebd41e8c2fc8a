/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEEDUP_SPEEDUP_POLICY_HPP
#define TXCOORD_SPEEDUP_SPEEDUP_POLICY_HPP

#include "../dispatch/DispatchDb.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txcoord {

struct SpeedupSettings
{
    /// Blocks to wait when a dispatch sets no threshold of its own.
    size_t defaultThresholdBlocks = 1;
    /// The lowest rate any bump will use, in satoshis per byte.
    double baseFeeRate = 1;
    /// Each bump pays this much more per byte than the one before.
    double feeMultiplier = 1.5;
    /// Rates above this are clamped.
    double maxFeeRate = 1000;
    /// Broadcast tries per threshold window.
    unsigned maxBroadcastAttempts = 3;
    /// Change below this is not worth creating.
    uint64_t dustThreshold = 546;
    /// The heaviest package one CPFP child may pay for, in weight units.
    /// Zero gives every dispatch its own child.
    size_t maxBatchWeight = 400000;
};

/**
 * Decides when and how to bump a stalled transaction.
 * The decisions depend only on the arguments,
 * so the same inputs always give the same answers.
 */
class SpeedupPolicy
{
public:
    virtual ~SpeedupPolicy();
    SpeedupPolicy(const SpeedupSettings &settings);

    /**
     * Prefers CPFP when there is an anchor output to spend,
     * then RBF when every input can be re-signed.
     */
    virtual SpeedupMethod
    chooseMethod(const bc::transaction_type &tx, const SpeedupData &data) const;

    /**
     * Returns true once a dispatch has waited out its threshold,
     * counting from the broadcast or the most recent bump.
     */
    virtual bool
    isStalled(const DispatchRecord &record, size_t height, time_t now) const;

    /**
     * The rate for the first try of the next bump.
     * @param clamped set to true if the rate hit the ceiling.
     */
    virtual double
    nextFeeRate(bool &clamped, const DispatchRecord &record) const;

    /**
     * The rate to use after a rejection at the given rate.
     */
    virtual double
    escalate(bool &clamped, double rate) const;

    const SpeedupSettings &
    settings() const { return settings_; }

private:
    const SpeedupSettings settings_;

    double
    clamp(bool &clamped, double rate) const;
};

} // namespace txcoord

#endif
