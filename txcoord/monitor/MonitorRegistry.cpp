/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "MonitorRegistry.hpp"
#include "../json/JsonObject.hpp"
#include "../store/Store.hpp"
#include "../util/Debug.hpp"
#include "../util/Names.hpp"
#include <set>

namespace txcoord {

#define MONITOR_TABLE "monitors"

static const char *kindNames[] =
{
    "transaction",
    "other"
};

static const char *statusNames[] =
{
    "registered",
    "broadcasting",
    "unconfirmed",
    "needsSpeedup",
    "speedingUp",
    "confirmed",
    "finalized",
    "needsManualIntervention",
    "cancelled"
};

const char *
monitorKindName(MonitorKind kind)
{
    return kindNames[static_cast<size_t>(kind)];
}

const char *
monitorStatusName(MonitorStatus status)
{
    return statusNames[static_cast<size_t>(status)];
}

bool
monitorTransitionAllowed(MonitorStatus from, MonitorStatus to)
{
    typedef MonitorStatus S;

    if (from == to)
        return true;
    if (S::cancelled == from)
        return false;
    if (S::cancelled == to)
        return true;

    switch (from)
    {
    case S::registered:
        return S::broadcasting == to || S::unconfirmed == to ||
               S::confirmed == to;
    case S::broadcasting:
        return S::unconfirmed == to || S::confirmed == to ||
               S::needsSpeedup == to || S::needsManualIntervention == to;
    case S::unconfirmed:
        return S::confirmed == to || S::needsSpeedup == to ||
               S::needsManualIntervention == to || S::broadcasting == to;
    case S::needsSpeedup:
        return S::speedingUp == to || S::unconfirmed == to ||
               S::confirmed == to || S::needsManualIntervention == to;
    case S::speedingUp:
        return S::needsSpeedup == to || S::unconfirmed == to ||
               S::confirmed == to || S::needsManualIntervention == to;
    case S::confirmed:
        return S::unconfirmed == to || S::speedingUp == to ||
               S::finalized == to;
    case S::needsManualIntervention:
        return S::confirmed == to || S::unconfirmed == to;
    case S::finalized:
    case S::cancelled:
        return false;
    }
    return false;
}

struct MonitorJson:
    public JsonObject
{
    TXC_JSON_CONSTRUCTORS(MonitorJson, JsonObject)

    TXC_JSON_STRING(id, "id", nullptr)
    TXC_JSON_STRING(kind, "kind", "transaction")
    TXC_JSON_STRING(context, "context", "")
    TXC_JSON_STRING(status, "status", nullptr)
    TXC_JSON_INTEGER(firstSeenHeight, "firstSeenHeight", 0)
    TXC_JSON_INTEGER(lastCheckedHeight, "lastCheckedHeight", 0)
    TXC_JSON_INTEGER(confirmations, "confirmations", 0)
    TXC_JSON_BOOLEAN(dispatched, "dispatched", false)

    Status
    pack(const MonitoredItem &in)
    {
        TXC_CHECK(idSet(in.id));
        TXC_CHECK(kindSet(monitorKindName(in.kind)));
        TXC_CHECK(contextSet(in.context));
        TXC_CHECK(statusSet(monitorStatusName(in.status)));
        TXC_CHECK(firstSeenHeightSet(in.firstSeenHeight));
        TXC_CHECK(lastCheckedHeightSet(in.lastCheckedHeight));
        TXC_CHECK(confirmationsSet(in.confirmations));
        TXC_CHECK(dispatchedSet(in.dispatched));
        return Status();
    }

    Status
    unpack(MonitoredItem &result) const
    {
        TXC_CHECK(idOk());
        TXC_CHECK(statusOk());

        MonitoredItem out;
        out.id = id();
        TXC_CHECK(nameParse(out.kind, kindNames, kind()));
        out.context = context();
        TXC_CHECK(nameParse(out.status, statusNames, status()));
        out.firstSeenHeight = firstSeenHeight();
        out.lastCheckedHeight = lastCheckedHeight();
        out.confirmations = confirmations();
        out.dispatched = dispatched();

        result = std::move(out);
        return Status();
    }
};

Status
MonitorRegistry::monitor(StoreTransaction &txn,
                         const MonitorTargetList &targets,
                         const std::string &context)
{
    if (targets.empty())
        return TXC_ERROR(TXC_CC_InvalidRequest, "Nothing to monitor");

    // Check the whole batch before writing anything:
    MonitoredItemList fresh;
    std::set<std::string> seen;
    for (const auto &target: targets)
    {
        if (target.id.empty())
            return TXC_ERROR(TXC_CC_InvalidRequest, "Empty identifier");
        if (!seen.insert(target.id).second)
            continue;

        MonitoredItem existing;
        if (exists(txn, target.id))
        {
            TXC_CHECK(get(existing, txn, target.id));
            if (existing.context != context || existing.kind != target.kind)
                return TXC_ERROR(TXC_CC_DuplicateMonitor,
                                 "Already monitoring " + target.id);
            continue;
        }

        MonitoredItem item;
        item.id = target.id;
        item.kind = target.kind;
        item.context = context;
        fresh.push_back(item);
    }

    for (const auto &item: fresh)
    {
        TXC_CHECK(save(txn, item));
        TXC_DebugLog("Monitoring %s", item.id.c_str());
    }
    return Status();
}

Status
MonitorRegistry::monitorDispatch(StoreTransaction &txn, const std::string &id,
                                 const std::string &context)
{
    MonitoredItem item;
    if (exists(txn, id))
    {
        TXC_CHECK(get(item, txn, id));
        if (item.context != context || MonitorKind::transaction != item.kind)
            return TXC_ERROR(TXC_CC_DuplicateMonitor,
                             "Already monitoring " + id);
        if (MonitorStatus::registered == item.status)
            TXC_CHECK(transition(item, MonitorStatus::broadcasting));
    }
    else
    {
        item.id = id;
        item.context = context;
        item.status = MonitorStatus::broadcasting;
    }

    item.dispatched = true;
    TXC_CHECK(save(txn, item));
    return Status();
}

Status
MonitorRegistry::cancel(StoreTransaction &txn, const std::string &id)
{
    MonitoredItem item;
    TXC_CHECK(get(item, txn, id));
    TXC_CHECK(transition(item, MonitorStatus::cancelled));

    txn.erase(MONITOR_TABLE, id);
    TXC_DebugLog("Cancelled %s", id.c_str());
    return Status();
}

Status
MonitorRegistry::transition(MonitoredItem &item, MonitorStatus to)
{
    if (!monitorTransitionAllowed(item.status, to))
        return TXC_ERROR(TXC_CC_Error, "Illegal transition for " + item.id +
                         " from " + monitorStatusName(item.status) +
                         " to " + monitorStatusName(to));

    if (item.status != to)
        TXC_DebugLog("%s: %s -> %s", item.id.c_str(),
                     monitorStatusName(item.status), monitorStatusName(to));
    item.status = to;
    return Status();
}

Status
MonitorRegistry::get(MonitoredItem &result, StoreTransaction &txn,
                     const std::string &id)
{
    JsonPtr json;
    if (!txn.find(json, MONITOR_TABLE, id))
        return TXC_ERROR(TXC_CC_UnknownIdentifier, "Not monitoring " + id);

    TXC_CHECK(MonitorJson(json).unpack(result));
    return Status();
}

bool
MonitorRegistry::exists(StoreTransaction &txn, const std::string &id)
{
    JsonPtr json;
    return txn.find(json, MONITOR_TABLE, id);
}

Status
MonitorRegistry::list(MonitoredItemList &result, StoreTransaction &txn)
{
    MonitoredItemList out;
    for (const auto &row: txn.scan(MONITOR_TABLE))
    {
        MonitoredItem item;
        TXC_CHECK(MonitorJson(row.second).unpack(item));
        out.push_back(item);
    }

    result = std::move(out);
    return Status();
}

Status
MonitorRegistry::save(StoreTransaction &txn, const MonitoredItem &item)
{
    MonitorJson json;
    TXC_CHECK(json.pack(item));
    txn.put(MONITOR_TABLE, item.id, json);
    return Status();
}

} // namespace txcoord
