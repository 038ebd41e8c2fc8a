/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_JSON_JSON_ARRAY_HPP
#define TXCOORD_JSON_JSON_ARRAY_HPP

#include "JsonPtr.hpp"

namespace txcoord {

/**
 * A JsonPtr with an array as its root element.
 */
class JsonArray:
    public JsonPtr
{
public:
    JsonArray();
    JsonArray(JsonPtr &&move);
    JsonArray(const JsonPtr &copy);

    /**
     * Ensures the root is an array, replacing anything else.
     */
    Status
    create();

    size_t
    size() const;

    JsonPtr
    operator[](size_t i) const;

    Status
    append(JsonPtr value);
};

} // namespace txcoord

#endif
