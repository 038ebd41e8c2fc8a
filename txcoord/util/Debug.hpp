/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_UTIL_DEBUG_HPP
#define TXCOORD_UTIL_DEBUG_HPP

#include "Status.hpp"
#include "Data.hpp"

#define DEBUG_LEVEL 1

#define TXC_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        TXC_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace txcoord {

/**
 * Opens the log file inside the given directory.
 * Logging to stdout works even without this.
 */
Status
debugInitialize(const std::string &logDir);

void
debugTerminate();

/**
 * Returns the contents of the current and previous log files.
 */
DataChunk
debugLogLoad();

void TXC_DebugLog(const char *format, ...);

} // namespace txcoord

#endif
