/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Coordinator.hpp"
#include "bitcoin/IChainObserver.hpp"
#include "bitcoin/Utility.hpp"
#include "dispatch/DispatchDb.hpp"
#include "store/Store.hpp"
#include "util/Debug.hpp"
#include <map>

namespace txcoord {

static bool
itemChanged(const MonitoredItem &a, const MonitoredItem &b)
{
    return a.status != b.status ||
           a.firstSeenHeight != b.firstSeenHeight ||
           a.lastCheckedHeight != b.lastCheckedHeight ||
           a.confirmations != b.confirmations;
}

static bool
dispatchChanged(const DispatchRecord &a, const DispatchRecord &b)
{
    return a.status != b.status ||
           a.broadcastHeight != b.broadcastHeight ||
           a.broadcastTime != b.broadcastTime ||
           a.broadcastFailures != b.broadcastFailures ||
           a.attempts.size() != b.attempts.size() ||
           a.lastFeeRate != b.lastFeeRate ||
           a.lastAttemptHeight != b.lastAttemptHeight ||
           a.lastAttemptTime != b.lastAttemptTime ||
           a.funding != b.funding ||
           a.fundingRequested != b.fundingRequested ||
           a.winner != b.winner;
}

Coordinator::Coordinator(const CoordinatorSettings &settings, Store &store,
                         IKeyManager &keys, IChainObserver &observer,
                         IBroadcaster &broadcaster):
    settings_(settings.clone()),
    store_(store),
    keys_(keys),
    observer_(observer),
    broadcaster_(broadcaster),
    policy_(settings_.speedupSettings()),
    pool_(settings_.minFundingAmount(), settings_.feeMargin()),
    news_(settings_.pruneAckedNews()),
    engine_(policy_, pool_, news_, broadcaster, keys),
    storePolicy_(settings_.storePolicy()),
    observerPolicy_(settings_.observerPolicy())
{
}

Status
Coordinator::open(const std::string &storePath)
{
    std::lock_guard<std::mutex> lock(mutex_);
    TXC_CHECK(settings_.check());
    TXC_CHECK(store_.open(storePath));

    // Make sure everything we will need later actually parses:
    StoreTransaction txn(store_);
    MonitoredItemList items;
    TXC_CHECK(registry_.list(items, txn));
    std::vector<DispatchRecord> records;
    TXC_CHECK(dispatchList(records, txn));
    FundingUtxoList funding;
    TXC_CHECK(pool_.list(funding, txn));
    NewsList news;
    TXC_CHECK(news_.pending(news, txn));

    TXC_DebugLog("Loaded %d monitors, %d dispatches, %d funding outputs, "
                 "%d pending news", static_cast<int>(items.size()),
                 static_cast<int>(records.size()),
                 static_cast<int>(funding.size()),
                 static_cast<int>(news.size()));
    loaded_ = true;
    tickFailures_ = 0;
    return Status();
}

void
Coordinator::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = false;
    store_.close();
}

bool
Coordinator::isReady()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loaded_ || !store_.isOpen())
            return false;
    }

    size_t height;
    return !!currentHeight(height).log();
}

Status
Coordinator::tick(time_t now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_)
        return TXC_ERROR(TXC_CC_NotReady, "The coordinator is not open");

    Status s = transact([&](StoreTransaction &txn) -> Status
    {
        size_t height;
        TXC_CHECK(currentHeight(height));

        MonitoredItemList items;
        TXC_CHECK(registry_.list(items, txn));
        std::vector<std::string> batch;
        for (auto &item: items)
            TXC_CHECK(tickItem(txn, item, batch, height, now));
        TXC_CHECK(tickBatch(txn, batch, height, now));
        return Status();
    });
    if (s)
    {
        tickFailures_ = 0;
        return s;
    }

    if (!isTransient(s) && TXC_CC_StorageError != s.value())
        return s;

    s.log();
    ++tickFailures_;
    if (static_cast<json_int_t>(tickFailures_) < settings_.tickFailureTolerance())
    {
        TXC_DebugLog("Tick failed %u times in a row, carrying on",
                     tickFailures_);
        return Status();
    }

    if (TXC_CC_ObserverTimeout == s.value())
        return s;
    return TXC_ERROR(TXC_CC_StorageError, s.message());
}

Status
Coordinator::monitor(const MonitorTargetList &targets,
                     const std::string &context)
{
    return transact([&](StoreTransaction &txn)
    {
        return registry_.monitor(txn, targets, context);
    });
}

Status
Coordinator::dispatch(DataSlice rawTx, const SpeedupData *speedup,
                      const std::string &context,
                      const DispatchOptions &options)
{
    bc::transaction_type tx;
    TXC_CHECK(decodeTx(tx, rawTx));
    if (tx.inputs.empty() || tx.outputs.empty())
        return TXC_ERROR(TXC_CC_ParseError,
                         "Transaction needs inputs and outputs");
    if (speedup && speedup->hasAnchor &&
            tx.outputs.size() <= speedup->anchorVout)
        return TXC_ERROR(TXC_CC_InvalidRequest, "No such anchor output");
    if (speedup && !speedup->inputs.empty() &&
            tx.inputs.size() != speedup->inputs.size())
        return TXC_ERROR(TXC_CC_InvalidRequest,
                         "Need one input source per input");

    DispatchRecord record;
    record.id = txidOf(tx);
    record.rawTx = DataChunk(rawTx.begin(), rawTx.end());
    record.hasSpeedup = !!speedup;
    if (speedup)
        record.speedup = *speedup;
    record.context = context;
    record.targetHeight = options.targetHeight;

    if (options.targetHeight)
    {
        size_t height;
        TXC_CHECK(currentHeight(height));
        if (height < options.targetHeight)
            record.status = DispatchStatus::scheduled;
    }

    // Save first, so tick can finish the job if we crash mid-broadcast:
    bool hadMonitor = false;
    MonitoredItem prior;
    TXC_CHECK(transact([&](StoreTransaction &txn) -> Status
    {
        if (dispatchExists(txn, record.id))
            return TXC_ERROR(TXC_CC_AlreadyDispatched,
                             "Already dispatched " + record.id);

        hadMonitor = registry_.exists(txn, record.id);
        if (hadMonitor)
            TXC_CHECK(registry_.get(prior, txn, record.id));
        TXC_CHECK(registry_.monitorDispatch(txn, record.id, context));
        TXC_CHECK(dispatchSave(txn, record));
        return Status();
    }));

    if (DispatchStatus::scheduled == record.status)
    {
        TXC_DebugLog("Scheduled %s for height %d", record.id.c_str(),
                     static_cast<int>(record.targetHeight));
        return Status();
    }

    Status s = broadcaster_.broadcast(record.rawTx);
    if (!s)
    {
        s.log();
        bool sent = false;
        TXC_CHECK(transact([&](StoreTransaction &txn) -> Status
        {
            // A tick may have rebroadcast it while we waited:
            sent = false;
            if (!dispatchExists(txn, record.id))
                return Status();
            DispatchRecord saved;
            TXC_CHECK(dispatchLoad(saved, txn, record.id));
            if (DispatchStatus::broadcasting != saved.status)
            {
                sent = true;
                return Status();
            }

            dispatchErase(txn, record.id);
            if (hadMonitor)
                return registry_.save(txn, prior);
            return registry_.cancel(txn, record.id);
        }));
        if (sent)
        {
            TXC_DebugLog("%s went out on a tick meanwhile", record.id.c_str());
            return Status();
        }
        return TXC_ERROR(TXC_CC_DispatchFailed,
                         "Broadcast rejected: " + s.message());
    }

    // A failure here leaves the dispatch in broadcasting for tick to redo:
    transact([&](StoreTransaction &txn) -> Status
    {
        DispatchRecord saved;
        TXC_CHECK(dispatchLoad(saved, txn, record.id));
        if (DispatchStatus::broadcasting != saved.status)
            return Status();
        saved.status = DispatchStatus::unconfirmed;
        TXC_CHECK(dispatchSave(txn, saved));

        MonitoredItem item;
        TXC_CHECK(registry_.get(item, txn, record.id));
        if (MonitorStatus::broadcasting == item.status)
        {
            TXC_CHECK(registry_.transition(item, MonitorStatus::unconfirmed));
            TXC_CHECK(registry_.save(txn, item));
        }
        return Status();
    }).log();

    return Status();
}

Status
Coordinator::cancel(const std::string &id)
{
    return transact([&](StoreTransaction &txn) -> Status
    {
        if (dispatchExists(txn, id))
        {
            DispatchRecord record;
            TXC_CHECK(dispatchLoad(record, txn, id));
            TXC_CHECK(engine_.release(txn, record));
            dispatchErase(txn, id);
        }
        return registry_.cancel(txn, id);
    });
}

Status
Coordinator::addFunding(const FundingUtxo &utxo)
{
    return transact([&](StoreTransaction &txn)
    {
        return pool_.add(txn, utxo);
    });
}

Status
Coordinator::getTransaction(TransactionStatus &result, const std::string &id)
{
    if (!store_.isOpen())
        return TXC_ERROR(TXC_CC_NotReady, "The store is not open");

    StoreTransaction txn(store_);
    MonitoredItem item;
    TXC_CHECK(registry_.get(item, txn, id));

    TransactionStatus out;
    out.id = item.id;
    out.kind = item.kind;
    out.state = item.status;
    out.context = item.context;
    out.confirmations = item.confirmations;

    if (item.dispatched && dispatchExists(txn, id))
    {
        DispatchRecord record;
        TXC_CHECK(dispatchLoad(record, txn, id));
        out.dispatched = true;
        out.dispatchState = record.status;
        out.attempts = record.attempts.size();
        if (!record.attempts.empty())
            out.lastSpeedupTxid = record.attempts.back().txid;
    }

    result = std::move(out);
    return Status();
}

Status
Coordinator::getNews(NewsList &result)
{
    if (!store_.isOpen())
        return TXC_ERROR(TXC_CC_NotReady, "The store is not open");

    StoreTransaction txn(store_);
    return news_.pending(result, txn);
}

Status
Coordinator::ackNews(const std::vector<uint64_t> &sequences)
{
    return transact([&](StoreTransaction &txn)
    {
        return news_.ack(txn, sequences);
    });
}

Status
Coordinator::transact(const std::function<Status (StoreTransaction &txn)> &work)
{
    if (!store_.isOpen())
        return TXC_ERROR(TXC_CC_NotReady, "The store is not open");

    return retry(storePolicy_, [&]() -> Status
    {
        StoreTransaction txn(store_);
        TXC_CHECK(work(txn));
        TXC_CHECK(txn.commit());
        return Status();
    });
}

Status
Coordinator::currentHeight(size_t &result)
{
    return retry(observerPolicy_, [&]()
    {
        return observer_.currentHeight(result);
    });
}

Status
Coordinator::confirmationDepth(ChainDepth &result, const std::string &txid)
{
    return retry(observerPolicy_, [&]()
    {
        return observer_.confirmationDepth(result, txid);
    });
}

Status
Coordinator::tickItem(StoreTransaction &txn, MonitoredItem &item,
                      std::vector<std::string> &batch,
                      size_t height, time_t now)
{
    // Caller-defined keys have nothing to look up:
    if (MonitorStatus::finalized == item.status ||
            MonitorKind::other == item.kind)
        return Status();

    const MonitoredItem itemBefore = item;
    DispatchRecord record;
    const bool dispatched = item.dispatched && dispatchExists(txn, item.id);
    if (dispatched)
        TXC_CHECK(dispatchLoad(record, txn, item.id));
    const DispatchRecord recordBefore = record;

    if (dispatched)
    {
        if (DispatchStatus::failed == record.status ||
                DispatchStatus::finalized == record.status)
            return Status();
        if (DispatchStatus::scheduled == record.status &&
                height < record.targetHeight)
            return Status();
    }

    ChainDepth depth;
    std::string winner = item.id;
    if (dispatched)
        TXC_CHECK(dispatchDepth(depth, winner, record));
    else
        TXC_CHECK(confirmationDepth(depth, item.id));

    bool live = true;
    if (dispatched)
        TXC_CHECK(tickBroadcast(live, txn, item, record, depth, height, now));

    if (live)
    {
        const size_t threshold = settings_.confirmationThreshold();
        const size_t confirmations = depth.found ? depth.confirmations : 0;
        const size_t previous = item.confirmations;

        item.lastCheckedHeight = height;
        item.confirmations = confirmations;
        if (depth.found && !item.firstSeenHeight)
            item.firstSeenHeight = height;

        if (MonitorStatus::confirmed == item.status)
        {
            if (confirmations < threshold)
            {
                TXC_DebugLog("Reorg: %s fell from %d to %d confirmations",
                             item.id.c_str(), static_cast<int>(previous),
                             static_cast<int>(confirmations));
                TXC_CHECK(registry_.transition(item, MonitorStatus::unconfirmed));
                if (dispatched)
                {
                    TXC_CHECK(engine_.unsettle(txn, record));
                    record.status = record.attempts.empty() ?
                                    DispatchStatus::unconfirmed : DispatchStatus::spedUp;
                }
                TXC_CHECK(emit(txn, item, NewsEvent::reorg,
                               "Depth fell from " + std::to_string(previous) +
                               " to " + std::to_string(confirmations)));
            }
            else if (confirmations < previous)
            {
                TXC_DebugLog("%s lost depth, %d to %d", item.id.c_str(),
                             static_cast<int>(previous),
                             static_cast<int>(confirmations));
            }
        }
        else if (threshold <= confirmations)
        {
            TXC_CHECK(registry_.transition(item, MonitorStatus::confirmed));
            if (dispatched)
            {
                TXC_CHECK(engine_.settle(txn, record, winner));
                record.winner = winner;
                record.status = DispatchStatus::confirmed;
            }
            TXC_CHECK(emit(txn, item, NewsEvent::confirmed, winner));
        }
        else
        {
            if (depth.found && MonitorStatus::registered == item.status)
                TXC_CHECK(registry_.transition(item, MonitorStatus::unconfirmed));
            // Anything already in a block only needs to wait:
            if (dispatched && !confirmations)
                TXC_CHECK(tickSpeedup(txn, item, record, batch, height, now));
        }

        if (MonitorStatus::confirmed == item.status &&
                static_cast<size_t>(settings_.maxMonitoringConfirmations()) <=
                confirmations)
        {
            TXC_CHECK(registry_.transition(item, MonitorStatus::finalized));
            if (dispatched)
                record.status = DispatchStatus::finalized;
            TXC_CHECK(emit(txn, item, NewsEvent::finalized, ""));
        }
    }

    if (itemChanged(itemBefore, item))
        TXC_CHECK(registry_.save(txn, item));
    if (dispatched && dispatchChanged(recordBefore, record))
        TXC_CHECK(dispatchSave(txn, record));
    return Status();
}

Status
Coordinator::tickBroadcast(bool &result, StoreTransaction &txn,
                           MonitoredItem &item, DispatchRecord &record,
                           const ChainDepth &depth, size_t height, time_t now)
{
    result = true;
    if (DispatchStatus::scheduled != record.status &&
            DispatchStatus::broadcasting != record.status)
    {
        // Stall timing runs on the tick clock, starting from the first tick:
        if (!record.broadcastHeight)
            record.broadcastHeight = height;
        if (!record.broadcastTime)
            record.broadcastTime = now;
        return Status();
    }

    if (!depth.found)
    {
        Status s = broadcaster_.broadcast(record.rawTx);
        if (!s)
        {
            s.log();
            result = false;
            ++record.broadcastFailures;
            if (DispatchStatus::scheduled == record.status ||
                    policy_.settings().maxBroadcastAttempts <= record.broadcastFailures)
            {
                record.status = DispatchStatus::failed;
                // A reorg may have undone a confirmation we reported:
                if (MonitorStatus::confirmed == item.status)
                    TXC_CHECK(registry_.transition(item, MonitorStatus::unconfirmed));
                TXC_CHECK(registry_.transition(item,
                                               MonitorStatus::needsManualIntervention));
                TXC_CHECK(emit(txn, item, NewsEvent::dispatchFailed,
                               "Rejected " + std::to_string(record.broadcastFailures) +
                               " times: " + s.message()));
            }
            return Status();
        }
    }

    record.status = DispatchStatus::unconfirmed;
    record.broadcastHeight = height;
    record.broadcastTime = now;
    record.broadcastFailures = 0;
    if (MonitorStatus::broadcasting == item.status)
        TXC_CHECK(registry_.transition(item, MonitorStatus::unconfirmed));
    return Status();
}

Status
Coordinator::tickSpeedup(StoreTransaction &txn, MonitoredItem &item,
                         DispatchRecord &record,
                         std::vector<std::string> &batch,
                         size_t height, time_t now)
{
    if (!record.hasSpeedup)
        return Status();
    if (DispatchStatus::unconfirmed != record.status &&
            DispatchStatus::spedUp != record.status)
        return Status();
    if (!policy_.isStalled(record, height, now))
        return Status();

    // Wait for the other stalled dispatches, which may share the child:
    if (engine_.canBatch(record))
    {
        batch.push_back(record.id);
        return Status();
    }

    SpeedupOutcome outcome;
    TXC_CHECK(engine_.speedup(outcome, txn, record, height, now));
    return speedupTransition(item, outcome);
}

Status
Coordinator::tickBatch(StoreTransaction &txn,
                       const std::vector<std::string> &batch,
                       size_t height, time_t now)
{
    // Unbumped dispatches go together, and earlier batches go again whole:
    std::map<std::string, std::vector<DispatchRecord>> groups;
    for (const auto &id: batch)
    {
        DispatchRecord record;
        TXC_CHECK(dispatchLoad(record, txn, id));
        std::string key;
        if (!record.attempts.empty())
            key = record.attempts.back().txid;
        groups[key].push_back(std::move(record));
    }

    for (auto &group: groups)
    {
        auto &records = group.second;
        std::vector<SpeedupOutcome> outcomes;
        TXC_CHECK(engine_.speedupBatch(outcomes, txn, records, height, now));

        for (size_t i = 0; i < records.size(); ++i)
        {
            MonitoredItem item;
            TXC_CHECK(registry_.get(item, txn, records[i].id));
            TXC_CHECK(speedupTransition(item, outcomes[i]));
            TXC_CHECK(registry_.save(txn, item));
            TXC_CHECK(dispatchSave(txn, records[i]));
        }
    }
    return Status();
}

Status
Coordinator::speedupTransition(MonitoredItem &item, SpeedupOutcome outcome)
{
    if (MonitorStatus::needsSpeedup != item.status &&
            MonitorStatus::speedingUp != item.status)
        TXC_CHECK(registry_.transition(item, MonitorStatus::needsSpeedup));

    switch (outcome)
    {
    case SpeedupOutcome::sent:
        TXC_CHECK(registry_.transition(item, MonitorStatus::speedingUp));
        break;
    case SpeedupOutcome::waiting:
        TXC_CHECK(registry_.transition(item, MonitorStatus::needsSpeedup));
        break;
    case SpeedupOutcome::gaveUp:
        TXC_CHECK(registry_.transition(item,
                                       MonitorStatus::needsManualIntervention));
        break;
    }
    return Status();
}

Status
Coordinator::dispatchDepth(ChainDepth &result, std::string &winner,
                           const DispatchRecord &record)
{
    ChainDepth out;
    TXC_CHECK(confirmationDepth(out, record.id));
    winner = record.id;

    // Any fee bump that made it into a block spent the funding:
    size_t best = 0;
    for (const auto &attempt: record.attempts)
    {
        ChainDepth depth;
        TXC_CHECK(confirmationDepth(depth, attempt.txid));
        if (!depth.found)
            continue;

        if (!out.found || out.confirmations < depth.confirmations)
        {
            out.found = true;
            out.confirmations = depth.confirmations;
        }
        if (best < depth.confirmations)
        {
            best = depth.confirmations;
            winner = attempt.txid;
        }
    }

    result = out;
    return Status();
}

Status
Coordinator::emit(StoreTransaction &txn, const MonitoredItem &item,
                  NewsEvent event, const std::string &detail)
{
    NewsItem news;
    news.event = event;
    news.id = item.id;
    news.context = item.context;
    news.detail = detail;
    news.confirmations = item.confirmations;
    TXC_CHECK(news_.append(txn, news));
    return Status();
}

} // namespace txcoord
