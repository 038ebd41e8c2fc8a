/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utility functions that should probably go into libbitcoin one day.
 */

#ifndef TXCOORD_BITCOIN_UTILITY_HPP
#define TXCOORD_BITCOIN_UTILITY_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txcoord {

/**
 * The sequence number that opts an input in to BIP 125 replacement.
 */
constexpr uint32_t replaceableSequence = 0xfffffffd;

/**
 * Returns true if a transaction opts in to RBF semantics.
 */
bool
isReplaceByFee(const bc::transaction_type &tx);

/**
 * Bundles the provided data into a script push operation.
 */
bc::operation
makePushOperation(bc::data_slice data);

/**
 * Decodes a blob of raw data into a transaction.
 * Segwit witness data is skipped.
 */
Status
decodeTx(bc::transaction_type &result, bc::data_slice rawTx);

/**
 * Serializes a transaction into its raw wire format.
 */
DataChunk
encodeTx(const bc::transaction_type &tx);

/**
 * Returns the txid of a transaction, in the usual byte-reversed hex.
 */
std::string
txidOf(const bc::transaction_type &tx);

/**
 * Parses a txid in the usual byte-reversed hex.
 */
Status
txidDecode(bc::hash_digest &result, const std::string &txid);

/**
 * Estimates the signed size of a transaction.
 * Signature scripts have a 72-byte signature plus a 32-byte pubkey,
 * and each change output adds another 35 bytes.
 */
size_t
estimateSize(const bc::transaction_type &tx, size_t changeOutputs);

} // namespace txcoord

#endif
