/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "NewsFeed.hpp"
#include "../json/JsonObject.hpp"
#include "../store/Store.hpp"
#include "../util/Debug.hpp"
#include "../util/Names.hpp"
#include <algorithm>
#include <set>
#include <stdio.h>

namespace txcoord {

#define NEWS_TABLE "news"
#define CURSOR_TABLE "cursors"
#define NEXT_SEQUENCE "next"

static const char *kindNames[] =
{
    "monitor",
    "dispatch"
};

static const char *eventNames[] =
{
    "confirmed",
    "reorg",
    "finalized",
    "dispatchFailed",
    "speedupBroadcast",
    "speedupFailed",
    "feeBudgetExceeded",
    "insufficientFunding",
    "feeRateClamped"
};

const char *
newsKindName(NewsKind kind)
{
    return kindNames[static_cast<size_t>(kind)];
}

const char *
newsEventName(NewsEvent event)
{
    return eventNames[static_cast<size_t>(event)];
}

NewsKind
newsKindOf(NewsEvent event)
{
    switch (event)
    {
    case NewsEvent::confirmed:
    case NewsEvent::reorg:
    case NewsEvent::finalized:
        return NewsKind::monitor;
    default:
        return NewsKind::dispatch;
    }
}

/**
 * Zero-pads the sequence number, so the keys sort numerically.
 */
static std::string
newsKey(uint64_t sequence)
{
    char out[24];
    snprintf(out, sizeof(out), "%012llu",
             static_cast<unsigned long long>(sequence));
    return out;
}

struct NewsJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(NewsJson, JsonObject)

    TXC_JSON_INTEGER(sequence, "sequence", 0)
    TXC_JSON_STRING(kind, "kind", nullptr)
    TXC_JSON_STRING(event, "event", nullptr)
    TXC_JSON_STRING(id, "id", nullptr)
    TXC_JSON_STRING(context, "context", "")
    TXC_JSON_STRING(detail, "detail", "")
    TXC_JSON_INTEGER(confirmations, "confirmations", 0)
    TXC_JSON_BOOLEAN(acked, "acked", false)

    Status
    pack(const NewsItem &in)
    {
        TXC_CHECK(sequenceSet(in.sequence));
        TXC_CHECK(kindSet(newsKindName(in.kind)));
        TXC_CHECK(eventSet(newsEventName(in.event)));
        TXC_CHECK(idSet(in.id));
        TXC_CHECK(contextSet(in.context));
        TXC_CHECK(detailSet(in.detail));
        TXC_CHECK(confirmationsSet(in.confirmations));
        TXC_CHECK(ackedSet(in.acked));
        return Status();
    }

    Status
    unpack(NewsItem &result) const
    {
        TXC_CHECK(sequenceOk());
        TXC_CHECK(kindOk());
        TXC_CHECK(eventOk());
        TXC_CHECK(idOk());

        NewsItem out;
        out.sequence = sequence();
        TXC_CHECK(nameParse(out.kind, kindNames, kind()));
        TXC_CHECK(nameParse(out.event, eventNames, event()));
        out.id = id();
        out.context = context();
        out.detail = detail();
        out.confirmations = confirmations();
        out.acked = acked();

        result = std::move(out);
        return Status();
    }
};

struct CounterJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(CounterJson, JsonObject)

    TXC_JSON_INTEGER(value, "value", 0)
};

static uint64_t
counterGet(StoreTransaction &txn, const std::string &name, uint64_t fallback)
{
    JsonPtr json;
    if (!txn.find(json, CURSOR_TABLE, name))
        return fallback;
    return CounterJson(json).value();
}

NewsFeed::NewsFeed(bool pruneAcked):
    pruneAcked_(pruneAcked)
{
}

Status
NewsFeed::append(StoreTransaction &txn, NewsItem &item)
{
    uint64_t sequence;
    TXC_CHECK(nextSequence(sequence, txn));

    item.sequence = sequence;
    item.kind = newsKindOf(item.event);
    item.acked = false;

    NewsJson json;
    TXC_CHECK(json.pack(item));
    txn.put(NEWS_TABLE, newsKey(sequence), json);
    TXC_CHECK(setCounter(txn, NEXT_SEQUENCE, sequence + 1));

    TXC_DebugLog("News %llu: %s %s %s",
                 static_cast<unsigned long long>(sequence),
                 newsEventName(item.event), item.id.c_str(), item.detail.c_str());
    return Status();
}

Status
NewsFeed::pending(NewsList &result, StoreTransaction &txn)
{
    NewsList out;
    for (const auto &row: txn.scan(NEWS_TABLE))
    {
        NewsItem item;
        TXC_CHECK(NewsJson(row.second).unpack(item));
        if (!item.acked)
            out.push_back(item);
    }

    result = std::move(out);
    return Status();
}

Status
NewsFeed::ack(StoreTransaction &txn, const std::vector<uint64_t> &sequences)
{
    uint64_t next;
    TXC_CHECK(nextSequence(next, txn));
    for (auto sequence: sequences)
        if (!sequence || next <= sequence)
            return TXC_ERROR(TXC_CC_UnknownIdentifier, "No news item " +
                             std::to_string(sequence));

    // Mark the items, remembering which cursors might move:
    std::set<NewsKind> touched;
    for (auto sequence: sequences)
    {
        JsonPtr json;
        if (!txn.find(json, NEWS_TABLE, newsKey(sequence)))
            continue; // Already acked and pruned

        NewsItem item;
        TXC_CHECK(NewsJson(json).unpack(item));
        if (item.acked)
            continue;

        item.acked = true;
        NewsJson out;
        TXC_CHECK(out.pack(item));
        txn.put(NEWS_TABLE, newsKey(sequence), out);
        touched.insert(item.kind);
    }

    if (touched.empty())
        return Status();

    // Advance the cursors past every contiguous acked item:
    const auto rows = txn.scan(NEWS_TABLE);
    for (auto kind: touched)
    {
        uint64_t old;
        TXC_CHECK(cursor(old, txn, kind));

        uint64_t watermark = old;
        std::vector<std::string> prunable;
        for (const auto &row: rows)
        {
            NewsItem item;
            TXC_CHECK(NewsJson(row.second).unpack(item));
            if (item.kind != kind)
                continue;
            if (!item.acked)
                break;
            watermark = std::max(watermark, item.sequence);
            prunable.push_back(row.first);
        }

        if (watermark != old)
            TXC_CHECK(setCounter(txn, newsKindName(kind), watermark));
        if (pruneAcked_)
            for (const auto &key: prunable)
                txn.erase(NEWS_TABLE, key);
    }

    return Status();
}

Status
NewsFeed::cursor(uint64_t &result, StoreTransaction &txn, NewsKind kind)
{
    result = counterGet(txn, newsKindName(kind), 0);
    return Status();
}

Status
NewsFeed::nextSequence(uint64_t &result, StoreTransaction &txn)
{
    result = counterGet(txn, NEXT_SEQUENCE, 1);
    return Status();
}

Status
NewsFeed::setCounter(StoreTransaction &txn, const std::string &name,
                     uint64_t value)
{
    CounterJson json;
    TXC_CHECK(json.valueSet(value));
    txn.put(CURSOR_TABLE, name, json);
    return Status();
}

} // namespace txcoord
