/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_I_KEY_MANAGER_HPP
#define TXCOORD_SPEND_I_KEY_MANAGER_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txcoord {

/**
 * Holds signing keys on behalf of the coordinator.
 * Keys are named by opaque handles, and the secrets never leave.
 */
class IKeyManager
{
public:
    virtual ~IKeyManager() {}

    /**
     * Obtains the serialized public key for a handle.
     */
    virtual Status
    publicKey(DataChunk &result, const std::string &handle) = 0;

    /**
     * Produces a DER-encoded signature over a signature hash,
     * without the trailing sighash type byte.
     */
    virtual Status
    sign(DataChunk &result, const bc::hash_digest &sighash,
         const std::string &handle) = 0;
};

} // namespace txcoord

#endif
