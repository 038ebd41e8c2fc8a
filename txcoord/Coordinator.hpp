/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * The public face of the transaction coordinator.
 */

#ifndef TXCOORD_COORDINATOR_HPP
#define TXCOORD_COORDINATOR_HPP

#include "CoordinatorSettings.hpp"
#include "funding/FundingPool.hpp"
#include "monitor/MonitorRegistry.hpp"
#include "news/NewsFeed.hpp"
#include "speedup/SpeedupEngine.hpp"
#include <functional>
#include <mutex>

namespace txcoord {

class IChainObserver;
class Store;
struct ChainDepth;

struct DispatchOptions
{
    /// Hold the broadcast until the chain reaches this height.
    size_t targetHeight = 0;
};

/**
 * Everything the caller can learn about a tracked identifier.
 */
struct TransactionStatus
{
    std::string id;
    MonitorKind kind = MonitorKind::transaction;
    MonitorStatus state = MonitorStatus::registered;
    std::string context;
    size_t confirmations = 0;

    // Only meaningful when `dispatched` is true:
    bool dispatched = false;
    DispatchStatus dispatchState = DispatchStatus::broadcasting;
    std::string lastSpeedupTxid;
    size_t attempts = 0;
};

/**
 * Tracks transactions through the chain, broadcasts them on request,
 * and bumps their fees when they stall.
 *
 * Every call runs inside its own store transaction,
 * so several coordinators may share one store.
 * State changes reach the caller through the news feed.
 */
class Coordinator
{
public:
    Coordinator(const CoordinatorSettings &settings, Store &store,
                IKeyManager &keys, IChainObserver &observer,
                IBroadcaster &broadcaster);

    /**
     * Opens the store and checks that its contents load.
     * An empty path keeps everything in memory.
     */
    Status
    open(const std::string &storePath);

    void
    close();

    /**
     * True once the store has loaded and the chain observer answers.
     */
    bool
    isReady();

    /**
     * Brings every tracked item up to date with the chain,
     * broadcasting and bumping fees as needed.
     * Transient failures are logged and ignored until
     * `tickFailureTolerance` ticks in a row have failed.
     */
    Status
    tick(time_t now = time(nullptr));

    Status
    monitor(const MonitorTargetList &targets, const std::string &context);

    /**
     * Takes over a signed transaction, broadcasting it and
     * watching it until it confirms.
     * The stall clock starts on the first tick after the broadcast.
     * @param speedup Instructions for bumping the fee, or null.
     */
    Status
    dispatch(DataSlice rawTx, const SpeedupData *speedup,
             const std::string &context,
             const DispatchOptions &options = DispatchOptions());

    /**
     * Stops tracking an identifier, releasing any funding it holds.
     */
    Status
    cancel(const std::string &id);

    Status
    addFunding(const FundingUtxo &utxo);

    Status
    getTransaction(TransactionStatus &result, const std::string &id);

    /**
     * Every news item the caller has not acknowledged yet.
     */
    Status
    getNews(NewsList &result);

    Status
    ackNews(const std::vector<uint64_t> &sequences);

private:
    const CoordinatorSettings settings_;
    Store &store_;
    IKeyManager &keys_;
    IChainObserver &observer_;
    IBroadcaster &broadcaster_;

    SpeedupPolicy policy_;
    FundingPool pool_;
    MonitorRegistry registry_;
    NewsFeed news_;
    SpeedupEngine engine_;
    const RetryPolicy storePolicy_;
    const RetryPolicy observerPolicy_;

    std::mutex mutex_;
    bool loaded_ = false;
    unsigned tickFailures_ = 0;

    /**
     * Runs some work inside a store transaction and commits it,
     * starting over on conflicts.
     */
    Status
    transact(const std::function<Status (StoreTransaction &txn)> &work);

    Status
    currentHeight(size_t &result);

    Status
    confirmationDepth(ChainDepth &result, const std::string &txid);

    /**
     * @param batch collects the stalled dispatches that may share a child.
     */
    Status
    tickItem(StoreTransaction &txn, MonitoredItem &item,
             std::vector<std::string> &batch, size_t height, time_t now);

    /**
     * Gets a dispatch onto the network, if it is time to send it.
     * @return false if the dispatch is not on the network yet.
     */
    Status
    tickBroadcast(bool &result, StoreTransaction &txn,
                  MonitoredItem &item, DispatchRecord &record,
                  const ChainDepth &depth, size_t height, time_t now);

    Status
    tickSpeedup(StoreTransaction &txn, MonitoredItem &item,
                DispatchRecord &record, std::vector<std::string> &batch,
                size_t height, time_t now);

    /**
     * Bumps the dispatches `tickItem` held back, sharing children.
     */
    Status
    tickBatch(StoreTransaction &txn, const std::vector<std::string> &batch,
              size_t height, time_t now);

    /**
     * Moves a monitored item along after a bump.
     */
    Status
    speedupTransition(MonitoredItem &item, SpeedupOutcome outcome);

    /**
     * Finds the deepest of a dispatch's transactions.
     * @param winner receives the txid to credit if the dispatch confirms.
     */
    Status
    dispatchDepth(ChainDepth &result, std::string &winner,
                  const DispatchRecord &record);

    Status
    emit(StoreTransaction &txn, const MonitoredItem &item, NewsEvent event,
         const std::string &detail);
};

} // namespace txcoord

#endif
