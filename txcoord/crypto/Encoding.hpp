/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_CRYPTO_ENCODING_HPP
#define TXCOORD_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace txcoord {

/**
 * Encodes data into a lowercase hex string.
 */
std::string
base16Encode(DataSlice data);

/**
 * Decodes a hex string.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-64 string according to rfc4648.
 */
std::string
base64Encode(DataSlice data);

/**
 * Decodes a base-64 string as defined by rfc4648.
 */
Status
base64Decode(DataChunk &result, const std::string &in);

} // namespace txcoord

#endif
