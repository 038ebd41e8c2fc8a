/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Inputs.hpp"
#include "Outputs.hpp"
#include "../bitcoin/Utility.hpp"

namespace txcoord {

void
inputsFill(bc::transaction_type &tx, const SpeedupInputList &inputs)
{
    tx.inputs.clear();
    for (const auto &source: inputs)
    {
        bc::transaction_input_type input;
        input.previous_output = source.point;
        input.sequence = replaceableSequence;
        tx.inputs.push_back(input);
    }
}

Status
signTx(bc::transaction_type &result, const SpeedupInputList &inputs,
       IKeyManager &keys)
{
    if (result.inputs.size() != inputs.size())
        return TXC_ERROR(TXC_CC_Error, "Input count mismatch");

    for (size_t i = 0; i < result.inputs.size(); ++i)
    {
        // Find the public key for this input:
        DataChunk pubkey;
        TXC_CHECK(keys.publicKey(pubkey, inputs[i].keyHandle));
        bc::script_type script = outputScriptForKey(pubkey);

        // Generate the signature for this input:
        auto sighash = bc::script_type::generate_signature_hash(
                           result, i, script, bc::sighash::all);
        if (sighash == bc::null_hash)
            return TXC_ERROR(TXC_CC_KeyError, "Unable to sign");
        DataChunk signature;
        TXC_CHECK(keys.sign(signature, sighash, inputs[i].keyHandle));
        signature.push_back(0x01);

        // Create our scriptsig:
        bc::script_type scriptsig;
        scriptsig.push_operation(makePushOperation(signature));
        scriptsig.push_operation(makePushOperation(pubkey));
        result.inputs[i].script = scriptsig;
    }

    return Status();
}

} // namespace txcoord
