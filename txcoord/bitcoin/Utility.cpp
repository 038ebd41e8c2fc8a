/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Utility.hpp"
#include <limits>

namespace txcoord {

bool
isReplaceByFee(const bc::transaction_type &tx)
{
    for (const auto &input: tx.inputs)
        if (input.sequence < 0xffffffff - 1)
            return true;
    return false;
}

bc::operation
makePushOperation(bc::data_slice data)
{
    bc::operation op;
    op.data = bc::data_chunk(data.begin(), data.end());
    if (!data.size())
        op.code = bc::opcode::zero;
    else if (data.size() <= 75)
        op.code = bc::opcode::special;
    else if (data.size() < std::numeric_limits<uint8_t>::max())
        op.code = bc::opcode::pushdata1;
    else if (data.size() < std::numeric_limits<uint16_t>::max())
        op.code = bc::opcode::pushdata2;
    else
        op.code = bc::opcode::pushdata4;
    return op;
}

Status
decodeTx(bc::transaction_type &result, bc::data_slice rawTx)
{
    if (rawTx.size() < 10)
        return TXC_ERROR(TXC_CC_ParseError, "Bad transaction format - too little data");

    bc::transaction_type out;
    try
    {
        auto deserial = bc::make_deserializer(rawTx.begin(), rawTx.end());

        out.version = deserial.read_4_bytes();

        // Skip the marker and flag if this is segwit:
        bool isSegwit = false;
        if (deserial.iterator()[0] == 0x00 && deserial.iterator()[1] == 0x01)
        {
            isSegwit = true;
            deserial.read_2_bytes();
        }

        // Read inputs:
        uint64_t inputCount = deserial.read_variable_uint();
        for (size_t i = 0; i < inputCount; ++i)
        {
            bc::transaction_input_type input;
            input.previous_output.hash = deserial.read_hash();
            input.previous_output.index = deserial.read_4_bytes();
            if (previous_output_is_null(input.previous_output))
                input.script = bc::raw_data_script(bc::read_raw_script(deserial));
            else
                input.script = bc::read_script(deserial);
            input.sequence = deserial.read_4_bytes();
            out.inputs.push_back(input);
        }

        // Read outputs:
        uint64_t outputCount = deserial.read_variable_uint();
        for (size_t i = 0; i < outputCount; ++i)
        {
            bc::transaction_output_type output;
            output.value = deserial.read_8_bytes();
            output.script = bc::read_script(deserial);
            out.outputs.push_back(output);
        }

        // Skip one witness stack per input:
        if (isSegwit)
        {
            for (size_t i = 0; i < inputCount; ++i)
            {
                uint64_t itemCount = deserial.read_variable_uint();
                for (size_t j = 0; j < itemCount; ++j)
                    deserial.read_data(deserial.read_variable_uint());
            }
        }

        out.locktime = deserial.read_4_bytes();

        if (deserial.iterator() != rawTx.end())
            return TXC_ERROR(TXC_CC_ParseError, "Bad transaction format - extra data");
    }
    catch (bc::end_of_stream)
    {
        return TXC_ERROR(TXC_CC_ParseError, "Bad transaction format - too little data");
    }

    result = std::move(out);
    return Status();
}

DataChunk
encodeTx(const bc::transaction_type &tx)
{
    DataChunk out(bc::satoshi_raw_size(tx));
    bc::satoshi_save(tx, out.begin());
    return out;
}

std::string
txidOf(const bc::transaction_type &tx)
{
    return bc::encode_hash(bc::hash_transaction(tx));
}

Status
txidDecode(bc::hash_digest &result, const std::string &txid)
{
    if (!bc::decode_hash(result, txid))
        return TXC_ERROR(TXC_CC_ParseError, "Bad txid " + txid);
    return Status();
}

size_t
estimateSize(const bc::transaction_type &tx, size_t changeOutputs)
{
    // Measure the transaction without any existing signatures:
    bc::transaction_type unsigned_tx = tx;
    for (auto &input: unsigned_tx.inputs)
        input.script = bc::script_type();

    size_t size = bc::satoshi_raw_size(unsigned_tx);
    size += 104 * unsigned_tx.inputs.size();
    size += 35 * changeOutputs;
    return size;
}

} // namespace txcoord
