/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_MONITOR_MONITOR_REGISTRY_HPP
#define TXCOORD_MONITOR_MONITOR_REGISTRY_HPP

#include "../util/Status.hpp"
#include <vector>

namespace txcoord {

class StoreTransaction;

enum class MonitorKind
{
    /// A txid the chain observer can look up.
    transaction,
    /// A caller-defined key, tracked but never looked up.
    other
};

enum class MonitorStatus
{
    registered,
    broadcasting,
    unconfirmed,
    needsSpeedup,
    speedingUp,
    confirmed,
    finalized,
    needsManualIntervention,
    cancelled
};

const char *
monitorKindName(MonitorKind kind);

const char *
monitorStatusName(MonitorStatus status);

/**
 * Returns true if the state machine allows moving between two states.
 */
bool
monitorTransitionAllowed(MonitorStatus from, MonitorStatus to);

struct MonitorTarget
{
    std::string id;
    MonitorKind kind = MonitorKind::transaction;
};

typedef std::vector<MonitorTarget> MonitorTargetList;

struct MonitoredItem
{
    std::string id;
    MonitorKind kind = MonitorKind::transaction;
    std::string context;
    MonitorStatus status = MonitorStatus::registered;
    size_t firstSeenHeight = 0;
    size_t lastCheckedHeight = 0;
    size_t confirmations = 0;
    /// The coordinator broadcast this one itself.
    bool dispatched = false;
};

typedef std::vector<MonitoredItem> MonitoredItemList;

/**
 * The identifiers the coordinator is watching, and where each one stands.
 */
class MonitorRegistry
{
public:
    /**
     * Starts watching a batch of identifiers, all or nothing.
     * Registering the same identifier twice with the same context
     * does nothing, but a different context or kind fails with
     * TXC_CC_DuplicateMonitor.
     */
    Status
    monitor(StoreTransaction &txn, const MonitorTargetList &targets,
            const std::string &context);

    /**
     * Starts watching a transaction the coordinator is about to broadcast.
     */
    Status
    monitorDispatch(StoreTransaction &txn, const std::string &id,
                    const std::string &context);

    /**
     * Stops watching an identifier.
     * Fails with TXC_CC_UnknownIdentifier if it was never registered.
     */
    Status
    cancel(StoreTransaction &txn, const std::string &id);

    /**
     * Moves an item to a new state, after checking the move is legal.
     * The caller still needs to `save` the item.
     */
    Status
    transition(MonitoredItem &item, MonitorStatus to);

    Status
    get(MonitoredItem &result, StoreTransaction &txn, const std::string &id);

    bool
    exists(StoreTransaction &txn, const std::string &id);

    /**
     * Lists every item, sorted by identifier.
     */
    Status
    list(MonitoredItemList &result, StoreTransaction &txn);

    Status
    save(StoreTransaction &txn, const MonitoredItem &item);
};

} // namespace txcoord

#endif
