/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_OUTPUTS_HPP
#define TXCOORD_SPEND_OUTPUTS_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txcoord {

bc::script_type
outputScriptForPubkey(const bc::short_hash &hash);

/**
 * Creates a pay-to-pubkey-hash script for a serialized public key.
 */
bc::script_type
outputScriptForKey(DataSlice publicKey);

/**
 * Returns true if an amount is below the dust threshold.
 */
bool
outputIsDust(uint64_t amount, uint64_t threshold);

uint64_t
outputsTotal(const bc::transaction_output_list &outputs);

} // namespace txcoord

#endif
