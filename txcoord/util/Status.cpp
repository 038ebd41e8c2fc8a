/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Status.hpp"
#include "Debug.hpp"

namespace txcoord {

Status::Status() :
    value_(TXC_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tTXC_CC value, std::string message,
               const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        TXC_DebugLog("%s:%d: %s returned error %d (%s): %s",
                     file_, static_cast<int>(line_), function_,
                     static_cast<int>(value_), statusCodeName(value_),
                     message_.c_str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
           s.file() << ":" << s.line() << ": " << s.function() <<
           " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

const char *
statusCodeName(tTXC_CC value)
{
    switch (value)
    {
    case TXC_CC_Ok:
        return "ok";
    case TXC_CC_Error:
        return "error";
    case TXC_CC_NotReady:
        return "not ready";
    case TXC_CC_DuplicateMonitor:
        return "duplicate monitor";
    case TXC_CC_UnknownIdentifier:
        return "unknown identifier";
    case TXC_CC_AlreadyDispatched:
        return "already dispatched";
    case TXC_CC_DispatchFailed:
        return "dispatch failed";
    case TXC_CC_InsufficientFunding:
        return "insufficient funding";
    case TXC_CC_DuplicateUtxo:
        return "duplicate utxo";
    case TXC_CC_FeeBudgetExceeded:
        return "fee budget exceeded";
    case TXC_CC_SpeedupFailed:
        return "speedup failed";
    case TXC_CC_StorageError:
        return "storage error";
    case TXC_CC_StorageConflict:
        return "storage conflict";
    case TXC_CC_ObserverTimeout:
        return "observer timeout";
    case TXC_CC_ParseError:
        return "parse error";
    case TXC_CC_JSONError:
        return "json error";
    case TXC_CC_FileError:
        return "file error";
    case TXC_CC_InvalidRequest:
        return "invalid request";
    case TXC_CC_KeyError:
        return "key error";
    }
    return "unknown";
}

} // namespace txcoord
