/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_STORE_STORE_HPP
#define TXCOORD_STORE_STORE_HPP

#include "../json/JsonPtr.hpp"
#include "../util/Status.hpp"
#include <map>
#include <mutex>

namespace txcoord {

class JsonObject;

/**
 * A durable collection of JSON tables, keyed by string.
 *
 * Every table lives inside a single JSON document on disk,
 * which is replaced atomically on each commit.
 * Readers and writers go through a StoreTransaction,
 * which commits all-or-nothing with optimistic conflict detection.
 */
class Store
{
public:
    virtual ~Store();
    Store();

    /**
     * Loads the tables from the given file, if it exists.
     * An empty path keeps everything in memory.
     */
    Status
    open(const std::string &path);

    /**
     * Forgets the in-memory tables.
     * Anything committed is already on disk.
     */
    void
    close();

    bool
    isOpen() const;

    const std::string &
    path() const { return path_; }

protected:
    /**
     * Writes a complete copy of the tables to durable storage.
     */
    virtual Status
    persist(const JsonObject &document);

private:
    friend class StoreTransaction;

    struct Row
    {
        JsonPtr value;
        uint64_t version;
    };

    struct Table
    {
        std::map<std::string, Row> rows;
        uint64_t version = 0;
    };

    typedef std::map<std::string, Table> Tables;

    mutable std::mutex mutex_;
    bool open_ = false;
    std::string path_;
    uint64_t counter_ = 0;
    Tables tables_;

    static JsonObject
    document(const Tables &tables);
};

/**
 * A unit of work against the store.
 *
 * Reads see the committed state plus this transaction's own writes.
 * Each read records the version it saw, and `commit` refuses to apply
 * the writes if any of those versions have changed in the meantime.
 * A transaction that is never committed has no effect.
 */
class StoreTransaction
{
public:
    StoreTransaction(Store &store);

    /**
     * Looks up a single row.
     * @return false if the row does not exist.
     */
    bool
    find(JsonPtr &result, const std::string &table, const std::string &key);

    /**
     * Reads every row in a table, sorted by key.
     * Any later change to the table will conflict with this transaction.
     */
    std::map<std::string, JsonPtr>
    scan(const std::string &table);

    /**
     * Inserts or replaces a row.
     */
    void
    put(const std::string &table, const std::string &key,
        const JsonPtr &value);

    /**
     * Removes a row, if present.
     */
    void
    erase(const std::string &table, const std::string &key);

    /**
     * Applies the staged writes.
     * Fails with TXC_CC_StorageConflict if another transaction
     * changed something this one read,
     * or TXC_CC_StorageError if the data cannot be saved.
     */
    Status
    commit();

private:
    struct Write
    {
        bool erase;
        JsonPtr value;
    };

    Store &store_;
    bool committed_ = false;
    std::map<std::pair<std::string, std::string>, uint64_t> reads_;
    std::map<std::string, uint64_t> scans_;
    std::map<std::string, std::map<std::string, Write>> writes_;
};

} // namespace txcoord

#endif
