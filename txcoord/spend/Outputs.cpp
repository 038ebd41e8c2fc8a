/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Outputs.hpp"

namespace txcoord {

bc::script_type
outputScriptForPubkey(const bc::short_hash &hash)
{
    bc::script_type result;
    result.push_operation({bc::opcode::dup, bc::data_chunk()});
    result.push_operation({bc::opcode::hash160, bc::data_chunk()});
    result.push_operation({bc::opcode::special, bc::data_chunk(hash.begin(), hash.end())});
    result.push_operation({bc::opcode::equalverify, bc::data_chunk()});
    result.push_operation({bc::opcode::checksig, bc::data_chunk()});
    return result;
}

bc::script_type
outputScriptForKey(DataSlice publicKey)
{
    return outputScriptForPubkey(bc::bitcoin_short_hash(
                                     bc::data_chunk(publicKey.begin(), publicKey.end())));
}

bool
outputIsDust(uint64_t amount, uint64_t threshold)
{
    return amount < threshold;
}

uint64_t
outputsTotal(const bc::transaction_output_list &outputs)
{
    uint64_t out = 0;
    for (const auto &output: outputs)
        out += output.value;
    return out;
}

} // namespace txcoord
