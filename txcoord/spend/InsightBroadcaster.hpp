/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_INSIGHT_BROADCASTER_HPP
#define TXCOORD_SPEND_INSIGHT_BROADCASTER_HPP

#include "IBroadcaster.hpp"

namespace txcoord {

struct CoordinatorSettings;

/**
 * Posts transactions to an Insight block explorer,
 * and signs fee bumps locally.
 */
class InsightBroadcaster:
    public IBroadcaster
{
public:
    InsightBroadcaster(const std::string &server, long timeout);
    explicit InsightBroadcaster(const CoordinatorSettings &settings);

    // IBroadcaster interface:
    Status
    broadcast(DataSlice rawTx) override;

    Status
    signSpeedup(bc::transaction_type &tx, const SpeedupInputList &inputs,
                const bc::transaction_output_list &outputs,
                IKeyManager &keys) override;

private:
    const std::string server_;
    const long timeout_;
};

} // namespace txcoord

#endif
