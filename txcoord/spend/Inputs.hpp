/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_INPUTS_HPP
#define TXCOORD_SPEND_INPUTS_HPP

#include "IBroadcaster.hpp"

namespace txcoord {

/**
 * Fills in the inputs of a transaction, one per funding source,
 * with the replaceable sequence number and no signatures.
 */
void
inputsFill(bc::transaction_type &tx, const SpeedupInputList &inputs);

/**
 * Signs each input of a transaction with its key.
 * Each input must spend a pay-to-pubkey-hash output
 * belonging to the matching entry in `inputs`.
 */
Status
signTx(bc::transaction_type &result, const SpeedupInputList &inputs,
       IKeyManager &keys);

} // namespace txcoord

#endif
