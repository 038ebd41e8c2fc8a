/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "InsightObserver.hpp"
#include "../CoordinatorSettings.hpp"
#include "../http/HttpRequest.hpp"
#include "../json/JsonObject.hpp"
#include "../util/Debug.hpp"

namespace txcoord {

struct StatusInfoJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(StatusInfoJson, JsonObject)

    TXC_JSON_INTEGER(blocks, "blocks", 0)
};

struct StatusJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(StatusJson, JsonObject)

    TXC_JSON_VALUE(info, "info", StatusInfoJson)
};

struct TxJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(TxJson, JsonObject)

    TXC_JSON_STRING(txid, "txid", nullptr)
    TXC_JSON_INTEGER(confirmations, "confirmations", 0)
};

/**
 * Network failures of any kind count as timeouts,
 * since trying again later is the only remedy.
 */
static Status
insightGet(HttpReply &reply, const std::string &url, long timeout)
{
    Status s = HttpRequest().
               timeout(timeout).
               get(reply, url);
    if (!s)
        return TXC_ERROR(TXC_CC_ObserverTimeout, s.message());
    return Status();
}

InsightObserver::InsightObserver(const std::string &server, long timeout):
    server_(server),
    timeout_(timeout)
{
}

InsightObserver::InsightObserver(const CoordinatorSettings &settings):
    InsightObserver(settings.insightServer(), settings.httpTimeout())
{
}

Status
InsightObserver::currentHeight(size_t &result)
{
    HttpReply reply;
    TXC_CHECK(insightGet(reply, server_ + "/api/status?q=getInfo", timeout_));
    if (!reply.codeOk())
        return TXC_ERROR(TXC_CC_ObserverTimeout, "Explorer returned HTTP " +
                         std::to_string(reply.code));

    StatusJson json;
    TXC_CHECK(json.decode(reply.body));
    auto info = json.info();
    TXC_CHECK(info.blocksOk());

    result = info.blocks();
    return Status();
}

Status
InsightObserver::confirmationDepth(ChainDepth &result, const std::string &txid)
{
    HttpReply reply;
    TXC_CHECK(insightGet(reply, server_ + "/api/tx/" + txid, timeout_));

    // The explorer has never heard of this one:
    if (404 == reply.code)
    {
        TXC_DebugLog("Explorer does not know %s", txid.c_str());
        result = ChainDepth();
        return Status();
    }
    if (!reply.codeOk())
        return TXC_ERROR(TXC_CC_ObserverTimeout, "Explorer returned HTTP " +
                         std::to_string(reply.code));

    TxJson json;
    TXC_CHECK(json.decode(reply.body));
    TXC_CHECK(json.txidOk());
    if (txid != json.txid())
        return TXC_ERROR(TXC_CC_JSONError, "Explorer returned the wrong txid");

    result.found = true;
    result.confirmations = json.confirmations() < 0 ? 0 : json.confirmations();
    return Status();
}

} // namespace txcoord
