/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Tunable knobs for the coordinator, stored as JSON.
 *
 * Any key missing from the document takes its default value,
 * so an empty object is a valid configuration.
 */

#ifndef TXCOORD_COORDINATOR_SETTINGS_HPP
#define TXCOORD_COORDINATOR_SETTINGS_HPP

#include "json/JsonObject.hpp"
#include "speedup/SpeedupPolicy.hpp"
#include "util/Retry.hpp"

namespace txcoord {

struct CoordinatorSettings:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(CoordinatorSettings, JsonObject)

    // Chain tracking:
    TXC_JSON_INTEGER(confirmationThreshold, "confirmationThreshold", 6)
    TXC_JSON_INTEGER(maxMonitoringConfirmations, "maxMonitoringConfirmations", 100)

    // Fee bumping:
    TXC_JSON_INTEGER(speedupThresholdBlocks, "speedupThresholdBlocks", 1)
    TXC_JSON_NUMBER(baseFeeRate, "baseFeeRate", 1)
    TXC_JSON_NUMBER(feeMultiplier, "feeMultiplier", 1.5)
    TXC_JSON_NUMBER(maxFeeRate, "maxFeeRate", 1000)
    TXC_JSON_INTEGER(maxBroadcastAttempts, "maxBroadcastAttempts", 3)
    TXC_JSON_INTEGER(minFundingAmount, "minFundingAmount", 10000)
    TXC_JSON_INTEGER(feeMargin, "feeMargin", 1000)
    TXC_JSON_INTEGER(dustThreshold, "dustThreshold", 546)
    TXC_JSON_INTEGER(maxBatchWeight, "maxBatchWeight", 400000)

    // Failure handling:
    TXC_JSON_INTEGER(storeAttempts, "storeAttempts", 3)
    TXC_JSON_INTEGER(storeBackoffMs, "storeBackoffMs", 50)
    TXC_JSON_INTEGER(observerAttempts, "observerAttempts", 2)
    TXC_JSON_INTEGER(tickFailureTolerance, "tickFailureTolerance", 3)
    TXC_JSON_INTEGER(httpTimeout, "httpTimeout", 10)

    TXC_JSON_BOOLEAN(pruneAckedNews, "pruneAckedNews", false)
    TXC_JSON_STRING(insightServer, "insightServer", "https://insight.bitpay.com")

    /**
     * Rejects values the coordinator cannot work with,
     * such as a zero confirmation threshold.
     */
    Status
    check() const;

    SpeedupSettings
    speedupSettings() const;

    RetryPolicy
    storePolicy() const;

    RetryPolicy
    observerPolicy() const;
};

} // namespace txcoord

#endif
