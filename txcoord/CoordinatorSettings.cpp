/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "CoordinatorSettings.hpp"

namespace txcoord {

Status
CoordinatorSettings::check() const
{
    if (confirmationThreshold() < 1)
        return TXC_ERROR(TXC_CC_InvalidRequest,
                         "confirmationThreshold must be at least 1");
    if (maxMonitoringConfirmations() < confirmationThreshold())
        return TXC_ERROR(TXC_CC_InvalidRequest,
                         "maxMonitoringConfirmations is below the threshold");
    if (baseFeeRate() <= 0 || maxFeeRate() < baseFeeRate())
        return TXC_ERROR(TXC_CC_InvalidRequest, "Bad fee rate limits");
    if (feeMultiplier() <= 1)
        return TXC_ERROR(TXC_CC_InvalidRequest,
                         "feeMultiplier must be greater than 1");
    if (maxBroadcastAttempts() < 1 || storeAttempts() < 1 ||
            observerAttempts() < 1 || tickFailureTolerance() < 1)
        return TXC_ERROR(TXC_CC_InvalidRequest,
                         "Attempt counts must be at least 1");
    if (minFundingAmount() < 0 || feeMargin() < 0 || dustThreshold() < 0 ||
            speedupThresholdBlocks() < 0 || storeBackoffMs() < 0 ||
            httpTimeout() < 0 || maxBatchWeight() < 0)
        return TXC_ERROR(TXC_CC_InvalidRequest, "Negative setting");

    return Status();
}

SpeedupSettings
CoordinatorSettings::speedupSettings() const
{
    SpeedupSettings out;
    out.defaultThresholdBlocks = speedupThresholdBlocks();
    out.baseFeeRate = baseFeeRate();
    out.feeMultiplier = feeMultiplier();
    out.maxFeeRate = maxFeeRate();
    out.maxBroadcastAttempts = maxBroadcastAttempts();
    out.dustThreshold = dustThreshold();
    out.maxBatchWeight = maxBatchWeight();
    return out;
}

RetryPolicy
CoordinatorSettings::storePolicy() const
{
    RetryPolicy out;
    out.attempts = storeAttempts();
    out.backoffMs = storeBackoffMs();
    return out;
}

RetryPolicy
CoordinatorSettings::observerPolicy() const
{
    RetryPolicy out;
    out.attempts = observerAttempts();
    return out;
}

} // namespace txcoord
