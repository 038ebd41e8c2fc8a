/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_UTIL_STATUS_HPP
#define TXCOORD_UTIL_STATUS_HPP

#include <ostream>
#include <string>

namespace txcoord {

/**
 * Condition codes returned by the core.
 */
typedef enum eTXC_CC
{
    /** The operation completed successfully. */
    TXC_CC_Ok = 0,
    /** An unclassified error occurred. */
    TXC_CC_Error = 1,
    /** The coordinator has not finished initializing. */
    TXC_CC_NotReady = 2,
    /** The identifier is already monitored with a different context. */
    TXC_CC_DuplicateMonitor = 3,
    /** The identifier is not tracked or was never dispatched. */
    TXC_CC_UnknownIdentifier = 4,
    /** The transaction was already handed to the coordinator. */
    TXC_CC_AlreadyDispatched = 5,
    /** The broadcaster rejected the transaction. */
    TXC_CC_DispatchFailed = 6,
    /** No funding output can pay for the requested speedup. */
    TXC_CC_InsufficientFunding = 7,
    /** The funding outpoint is already in the pool. */
    TXC_CC_DuplicateUtxo = 8,
    /** A speedup would cost more than the caller allows. */
    TXC_CC_FeeBudgetExceeded = 9,
    /** Every attempt to broadcast a speedup was rejected. */
    TXC_CC_SpeedupFailed = 10,
    /** The persistent store could not complete a transaction. */
    TXC_CC_StorageError = 11,
    /** Another writer changed the data this transaction read. */
    TXC_CC_StorageConflict = 12,
    /** The chain observer did not answer in time. */
    TXC_CC_ObserverTimeout = 13,
    /** Malformed binary data, such as a raw transaction. */
    TXC_CC_ParseError = 14,
    /** Malformed or unexpected JSON. */
    TXC_CC_JSONError = 15,
    /** A file could not be read or written. */
    TXC_CC_FileError = 16,
    /** The caller passed arguments that make no sense. */
    TXC_CC_InvalidRequest = 17,
    /** A signing key handle could not be resolved. */
    TXC_CC_KeyError = 18
} tTXC_CC;

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tTXC_CC value, std::string message,
           const char *file, const char *function, size_t line);

    // Read accessors:
    tTXC_CC value()             const { return value_; }
    const std::string &message() const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == TXC_CC_Ok; }

    /**
     * Write this status to the debug log if it represents an error.
     * @return the status, so this can be chained into an `if`.
     */
    const Status &
    log() const;

private:
    // Error information:
    tTXC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Returns a short human-readable name for a condition code.
 */
const char *
statusCodeName(tTXC_CC value);

/**
 * Constructs an error status using the current source location.
 */
#define TXC_ERROR(value, message) \
    txcoord::Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define TXC_CHECK(f) \
    do { \
        txcoord::Status txcCheckStatus_ = (f); \
        if (!txcCheckStatus_) return txcCheckStatus_; \
    } while (false)

} // namespace txcoord

#endif
