/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_I_BROADCASTER_HPP
#define TXCOORD_SPEND_I_BROADCASTER_HPP

#include "IKeyManager.hpp"
#include <vector>

namespace txcoord {

/**
 * A pay-to-pubkey-hash output the coordinator knows how to spend.
 */
struct SpeedupInput
{
    bc::output_point point;
    uint64_t amount = 0;
    /// The key manager handle for the key that owns this output.
    std::string keyHandle;
};

typedef std::vector<SpeedupInput> SpeedupInputList;

/**
 * Sends transactions to the network and builds fee-bump transactions.
 */
class IBroadcaster
{
public:
    virtual ~IBroadcaster() {}

    /**
     * Sends a raw transaction to the network.
     * A rejection comes back as TXC_CC_DispatchFailed.
     */
    virtual Status
    broadcast(DataSlice rawTx) = 0;

    /**
     * Builds and signs a fee-bump transaction.
     * @param tx On entry, supplies the version and locktime.
     * On exit, holds the signed transaction, with one replaceable input
     * for each entry in `inputs` and the given outputs.
     */
    virtual Status
    signSpeedup(bc::transaction_type &tx, const SpeedupInputList &inputs,
                const bc::transaction_output_list &outputs,
                IKeyManager &keys) = 0;
};

} // namespace txcoord

#endif
