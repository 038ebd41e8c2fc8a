/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_SPEND_WIF_KEY_MANAGER_HPP
#define TXCOORD_SPEND_WIF_KEY_MANAGER_HPP

#include "IKeyManager.hpp"
#include <map>
#include <mutex>

namespace txcoord {

/**
 * A key manager backed by WIF private keys.
 * The handle for each key is its public key in hex.
 */
class WifKeyManager:
    public IKeyManager
{
public:
    /**
     * Reads keys from a JSON file of the form `{"keys": ["5K...", ...]}`.
     */
    Status
    load(const std::string &path);

    /**
     * Adds a single WIF key.
     * @param handle Receives the handle for the new key.
     */
    Status
    add(std::string &handle, const std::string &wif);

    // IKeyManager interface:
    Status
    publicKey(DataChunk &result, const std::string &handle) override;

    Status
    sign(DataChunk &result, const bc::hash_digest &sighash,
         const std::string &handle) override;

private:
    struct Key
    {
        bc::ec_secret secret;
        bc::ec_point pubkey;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Key> keys_;
};

} // namespace txcoord

#endif
