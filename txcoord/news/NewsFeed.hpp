/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_NEWS_NEWS_FEED_HPP
#define TXCOORD_NEWS_NEWS_FEED_HPP

#include "../util/Status.hpp"
#include <vector>

namespace txcoord {

class StoreTransaction;

enum class NewsKind
{
    /// Something happened to a monitored identifier.
    monitor,
    /// Something happened to a broadcast or its fee bumps.
    dispatch
};

enum class NewsEvent
{
    confirmed,
    reorg,
    finalized,
    dispatchFailed,
    speedupBroadcast,
    speedupFailed,
    feeBudgetExceeded,
    insufficientFunding,
    feeRateClamped
};

const char *
newsKindName(NewsKind kind);

const char *
newsEventName(NewsEvent event);

/**
 * Returns the kind of news an event belongs to.
 */
NewsKind
newsKindOf(NewsEvent event);

struct NewsItem
{
    uint64_t sequence = 0;
    NewsKind kind = NewsKind::monitor;
    NewsEvent event = NewsEvent::confirmed;
    /// The identifier this news is about.
    std::string id;
    std::string context;
    /// Human-readable particulars, such as a fee or a replacement txid.
    std::string detail;
    size_t confirmations = 0;
    bool acked = false;
};

typedef std::vector<NewsItem> NewsList;

/**
 * An ordered log of state changes, delivered until acknowledged.
 *
 * Sequence numbers start at 1 and have no gaps.
 * Each kind of news has a durable cursor,
 * the highest sequence at or below which every item of that kind is acked.
 */
class NewsFeed
{
public:
    /**
     * @param pruneAcked Delete items once the cursor passes them,
     * rather than keeping them around for audit.
     */
    NewsFeed(bool pruneAcked);

    /**
     * Adds an item to the end of the log.
     * The kind comes from the event, and `item.sequence` receives
     * the newly-assigned sequence number.
     */
    Status
    append(StoreTransaction &txn, NewsItem &item);

    /**
     * Every unacknowledged item, in sequence order.
     */
    Status
    pending(NewsList &result, StoreTransaction &txn);

    /**
     * Marks items as acknowledged and advances the cursors.
     * Acknowledging an item twice does nothing,
     * but a sequence number that was never handed out fails with
     * TXC_CC_UnknownIdentifier, leaving everything untouched.
     */
    Status
    ack(StoreTransaction &txn, const std::vector<uint64_t> &sequences);

    Status
    cursor(uint64_t &result, StoreTransaction &txn, NewsKind kind);

    /**
     * The sequence number the next item will receive.
     */
    Status
    nextSequence(uint64_t &result, StoreTransaction &txn);

private:
    const bool pruneAcked_;

    Status
    setCounter(StoreTransaction &txn, const std::string &name, uint64_t value);
};

} // namespace txcoord

#endif
