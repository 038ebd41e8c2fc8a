/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_BITCOIN_INSIGHT_OBSERVER_HPP
#define TXCOORD_BITCOIN_INSIGHT_OBSERVER_HPP

#include "IChainObserver.hpp"

namespace txcoord {

struct CoordinatorSettings;

/**
 * Watches the chain through an Insight block explorer's REST API.
 */
class InsightObserver:
    public IChainObserver
{
public:
    /**
     * @param server The explorer's base URL, such as
     * "https://insight.bitpay.com".
     * @param timeout Seconds to wait for each request.
     */
    InsightObserver(const std::string &server, long timeout);

    /**
     * Uses the `insightServer` and `httpTimeout` settings.
     */
    explicit InsightObserver(const CoordinatorSettings &settings);

    // IChainObserver interface:
    Status
    currentHeight(size_t &result) override;

    Status
    confirmationDepth(ChainDepth &result, const std::string &txid) override;

private:
    const std::string server_;
    const long timeout_;
};

} // namespace txcoord

#endif
