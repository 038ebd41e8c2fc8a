/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Store.hpp"
#include "../json/JsonObject.hpp"
#include "../util/Debug.hpp"
#include "../util/FileIO.hpp"

namespace txcoord {

Store::~Store()
{
}

Store::Store()
{
}

Status
Store::open(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);

    Tables tables;
    uint64_t counter = counter_;
    if (!path.empty() && fileExists(path))
    {
        JsonObject json;
        TXC_CHECK(json.load(path));

        const char *name;
        json_t *table;
        json_object_foreach(json.get(), name, table)
        {
            if (!json_is_object(table))
                return TXC_ERROR(TXC_CC_JSONError,
                                 "Bad table " + std::string(name) + " in " + path);

            auto &out = tables[name];
            out.version = ++counter;

            const char *key;
            json_t *value;
            json_object_foreach(table, key, value)
                out.rows[key] = Row{JsonPtr(json_incref(value)), ++counter};
        }
        TXC_DebugLog("Loaded %d tables from %s",
                     static_cast<int>(tables.size()), path.c_str());
    }

    open_ = true;
    path_ = path;
    counter_ = counter;
    tables_ = std::move(tables);
    return Status();
}

void
Store::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    tables_.clear();
}

bool
Store::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

Status
Store::persist(const JsonObject &document)
{
    if (path_.empty())
        return Status();
    return document.save(path_);
}

JsonObject
Store::document(const Tables &tables)
{
    JsonObject out;
    for (const auto &table: tables)
    {
        json_t *rows = json_object();
        for (const auto &row: table.second.rows)
            json_object_set(rows, row.first.c_str(), row.second.value.get());
        json_object_set_new(out.get(), table.first.c_str(), rows);
    }
    return out;
}

StoreTransaction::StoreTransaction(Store &store):
    store_(store)
{
}

bool
StoreTransaction::find(JsonPtr &result, const std::string &table,
                       const std::string &key)
{
    // Our own writes come first:
    auto wt = writes_.find(table);
    if (writes_.end() != wt)
    {
        auto w = wt->second.find(key);
        if (wt->second.end() != w)
        {
            if (w->second.erase)
                return false;
            result = w->second.value.clone();
            return true;
        }
    }

    std::lock_guard<std::mutex> lock(store_.mutex_);

    uint64_t version = 0;
    JsonPtr value;
    auto t = store_.tables_.find(table);
    if (store_.tables_.end() != t)
    {
        auto row = t->second.rows.find(key);
        if (t->second.rows.end() != row)
        {
            version = row->second.version;
            value = row->second.value.clone();
        }
    }

    // Keep the first version we saw:
    reads_.insert(std::make_pair(std::make_pair(table, key), version));

    if (!version)
        return false;
    result = value;
    return true;
}

std::map<std::string, JsonPtr>
StoreTransaction::scan(const std::string &table)
{
    std::map<std::string, JsonPtr> out;
    {
        std::lock_guard<std::mutex> lock(store_.mutex_);

        uint64_t version = 0;
        auto t = store_.tables_.find(table);
        if (store_.tables_.end() != t)
        {
            version = t->second.version;
            for (const auto &row: t->second.rows)
                out[row.first] = row.second.value.clone();
        }
        scans_.insert(std::make_pair(table, version));
    }

    // Overlay our own writes:
    auto wt = writes_.find(table);
    if (writes_.end() != wt)
    {
        for (const auto &w: wt->second)
        {
            if (w.second.erase)
                out.erase(w.first);
            else
                out[w.first] = w.second.value.clone();
        }
    }

    return out;
}

void
StoreTransaction::put(const std::string &table, const std::string &key,
                      const JsonPtr &value)
{
    writes_[table][key] = Write{false, value.clone()};
}

void
StoreTransaction::erase(const std::string &table, const std::string &key)
{
    writes_[table][key] = Write{true, JsonPtr()};
}

Status
StoreTransaction::commit()
{
    if (committed_)
        return TXC_ERROR(TXC_CC_Error, "Transaction already committed");

    std::lock_guard<std::mutex> lock(store_.mutex_);
    if (!store_.open_)
        return TXC_ERROR(TXC_CC_StorageError, "Store is not open");

    // Check that nothing we depend on has changed:
    for (const auto &read: reads_)
    {
        uint64_t version = 0;
        auto t = store_.tables_.find(read.first.first);
        if (store_.tables_.end() != t)
        {
            auto row = t->second.rows.find(read.first.second);
            if (t->second.rows.end() != row)
                version = row->second.version;
        }
        if (version != read.second)
            return TXC_ERROR(TXC_CC_StorageConflict,
                             "Conflicting write to " + read.first.first +
                             "/" + read.first.second);
    }
    for (const auto &scan: scans_)
    {
        auto t = store_.tables_.find(scan.first);
        uint64_t version = store_.tables_.end() == t ? 0 : t->second.version;
        if (version != scan.second)
            return TXC_ERROR(TXC_CC_StorageConflict,
                             "Conflicting write to " + scan.first);
    }

    committed_ = true;
    if (writes_.empty())
        return Status();

    // Apply the changes to a copy, so a failed save leaves nothing behind:
    auto tables = store_.tables_;
    uint64_t counter = store_.counter_;
    for (const auto &wt: writes_)
    {
        auto &table = tables[wt.first];
        table.version = ++counter;
        for (const auto &w: wt.second)
        {
            if (w.second.erase)
                table.rows.erase(w.first);
            else
                table.rows[w.first] = Store::Row{w.second.value, ++counter};
        }
    }

    Status s = store_.persist(Store::document(tables));
    if (!s)
    {
        s.log();
        return TXC_ERROR(TXC_CC_StorageError,
                         "Cannot save store: " + s.message());
    }

    store_.tables_ = std::move(tables);
    store_.counter_ = counter;
    return Status();
}

} // namespace txcoord
