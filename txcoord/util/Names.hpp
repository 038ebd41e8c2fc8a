/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_UTIL_NAMES_HPP
#define TXCOORD_UTIL_NAMES_HPP

#include "Status.hpp"
#include <string.h>

namespace txcoord {

/**
 * Maps a name back to its enum value,
 * given a table of names in enum order.
 */
template<typename T, size_t N> Status
nameParse(T &result, const char *(&names)[N], const char *name)
{
    for (size_t i = 0; i < N; ++i)
    {
        if (!strcmp(names[i], name))
        {
            result = static_cast<T>(i);
            return Status();
        }
    }
    return TXC_ERROR(TXC_CC_JSONError, "Unknown name " + std::string(name));
}

} // namespace txcoord

#endif
