/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_BITCOIN_I_CHAIN_OBSERVER_HPP
#define TXCOORD_BITCOIN_I_CHAIN_OBSERVER_HPP

#include "../util/Status.hpp"
#include <string>

namespace txcoord {

/**
 * Where a transaction stands on the chain.
 */
struct ChainDepth
{
    /// The network knows about the transaction (mempool or block).
    bool found = false;
    /// Blocks on top of the containing block, counting that block.
    /// Zero while the transaction waits in the mempool.
    size_t confirmations = 0;
};

/**
 * A read-only view of the Bitcoin network.
 * Implementations should give up after a bounded time,
 * reporting TXC_CC_ObserverTimeout.
 */
class IChainObserver
{
public:
    virtual ~IChainObserver() {}

    /**
     * Obtains the height of the best block.
     */
    virtual Status
    currentHeight(size_t &result) = 0;

    /**
     * Looks up the confirmation depth for a txid.
     * An unknown txid is not an error, but leaves `found` false.
     */
    virtual Status
    confirmationDepth(ChainDepth &result, const std::string &txid) = 0;
};

} // namespace txcoord

#endif
