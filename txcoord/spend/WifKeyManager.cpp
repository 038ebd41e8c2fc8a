/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "WifKeyManager.hpp"
#include "../crypto/Encoding.hpp"
#include "../json/JsonArray.hpp"
#include "../json/JsonObject.hpp"
#include "../util/Debug.hpp"

namespace txcoord {

struct KeyFileJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(KeyFileJson, JsonObject)

    TXC_JSON_VALUE(keys, "keys", JsonArray)
};

Status
WifKeyManager::load(const std::string &path)
{
    KeyFileJson json;
    TXC_CHECK(json.load(path));

    auto keysJson = json.keys();
    size_t size = keysJson.size();
    for (size_t i = 0; i < size; i++)
    {
        auto wif = keysJson[i];
        if (!json_is_string(wif.get()))
            return TXC_ERROR(TXC_CC_JSONError, "Bad key entry in " + path);

        std::string handle;
        TXC_CHECK(add(handle, json_string_value(wif.get())));
    }
    TXC_DebugLog("Loaded %d keys", static_cast<int>(size));

    return Status();
}

Status
WifKeyManager::add(std::string &handle, const std::string &wif)
{
    Key key;
    key.secret = bc::wif_to_secret(wif);
    if (key.secret == bc::ec_secret())
        return TXC_ERROR(TXC_CC_KeyError, "Bad WIF key");
    key.pubkey = bc::secret_to_public_key(key.secret,
                                          bc::is_wif_compressed(wif));

    handle = base16Encode(key.pubkey);

    std::lock_guard<std::mutex> lock(mutex_);
    keys_[handle] = key;
    return Status();
}

Status
WifKeyManager::publicKey(DataChunk &result, const std::string &handle)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto i = keys_.find(handle);
    if (keys_.end() == i)
        return TXC_ERROR(TXC_CC_KeyError, "No key for handle " + handle);

    result = DataChunk(i->second.pubkey.begin(), i->second.pubkey.end());
    return Status();
}

Status
WifKeyManager::sign(DataChunk &result, const bc::hash_digest &sighash,
                    const std::string &handle)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto i = keys_.find(handle);
    if (keys_.end() == i)
        return TXC_ERROR(TXC_CC_KeyError, "No key for handle " + handle);

    const auto &secret = i->second.secret;
    auto signature = bc::sign(secret, sighash, bc::create_nonce(secret, sighash));
    if (signature.empty())
        return TXC_ERROR(TXC_CC_KeyError, "Unable to sign");

    result = DataChunk(signature.begin(), signature.end());
    return Status();
}

} // namespace txcoord
