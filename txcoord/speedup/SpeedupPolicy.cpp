/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SpeedupPolicy.hpp"
#include "../bitcoin/Utility.hpp"
#include "../util/Debug.hpp"
#include <algorithm>

namespace txcoord {

SpeedupPolicy::~SpeedupPolicy()
{
}

SpeedupPolicy::SpeedupPolicy(const SpeedupSettings &settings):
    settings_(settings)
{
}

SpeedupMethod
SpeedupPolicy::chooseMethod(const bc::transaction_type &tx,
                            const SpeedupData &data) const
{
    if (data.hasAnchor && data.anchorVout < tx.outputs.size() &&
            !data.anchorKeyHandle.empty())
        return SpeedupMethod::cpfp;

    if ((data.replaceable || isReplaceByFee(tx)) &&
            data.inputs.size() == tx.inputs.size() && !tx.inputs.empty())
    {
        bool signable = std::all_of(data.inputs.begin(), data.inputs.end(),
                                    [](const InputSource &input)
        {
            return !input.keyHandle.empty();
        });
        if (signable)
            return SpeedupMethod::rbf;
    }

    return SpeedupMethod::none;
}

bool
SpeedupPolicy::isStalled(const DispatchRecord &record, size_t height,
                         time_t now) const
{
    if (DispatchStatus::unconfirmed != record.status &&
            DispatchStatus::spedUp != record.status)
        return false;

    size_t blocks = record.speedup.thresholdBlocks;
    time_t seconds = record.speedup.thresholdSeconds;
    if (!blocks && !seconds)
        blocks = settings_.defaultThresholdBlocks;

    const size_t sinceHeight = record.lastAttemptHeight ?
                               record.lastAttemptHeight : record.broadcastHeight;
    const time_t sinceTime = record.lastAttemptTime ?
                             record.lastAttemptTime : record.broadcastTime;

    if (blocks && sinceHeight && sinceHeight + blocks <= height)
        return true;
    if (seconds && sinceTime && sinceTime + seconds <= now)
        return true;
    return false;
}

double
SpeedupPolicy::nextFeeRate(bool &clamped, const DispatchRecord &record) const
{
    if (0 < record.lastFeeRate)
        return escalate(clamped, record.lastFeeRate);

    double rate = std::max(settings_.baseFeeRate, record.speedup.initialFeeRate);
    return clamp(clamped, rate);
}

double
SpeedupPolicy::escalate(bool &clamped, double rate) const
{
    return clamp(clamped, rate * settings_.feeMultiplier);
}

double
SpeedupPolicy::clamp(bool &clamped, double rate) const
{
    clamped = settings_.maxFeeRate < rate;
    if (clamped)
    {
        TXC_DebugLog("Fee rate %.2f clamped to %.2f", rate, settings_.maxFeeRate);
        return settings_.maxFeeRate;
    }
    return rate;
}

} // namespace txcoord
