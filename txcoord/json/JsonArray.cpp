/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonArray.hpp"

namespace txcoord {

JsonArray::JsonArray():
    JsonPtr(json_array())
{}

JsonArray::JsonArray(JsonPtr &&move):
    JsonPtr(std::move(move))
{
    if (!json_is_array(root_))
        reset(json_array());
}

JsonArray::JsonArray(const JsonPtr &copy):
    JsonPtr(copy)
{
    if (!json_is_array(root_))
        reset(json_array());
}

Status
JsonArray::create()
{
    if (!json_is_array(root_))
        reset(json_array());
    if (!root_)
        return TXC_ERROR(TXC_CC_JSONError, "Cannot create array");
    return Status();
}

size_t
JsonArray::size() const
{
    return json_array_size(root_);
}

JsonPtr
JsonArray::operator[](size_t i) const
{
    return json_incref(json_array_get(root_, i));
}

Status
JsonArray::append(JsonPtr value)
{
    TXC_CHECK(create());
    if (json_array_append(root_, value.get()) < 0)
        return TXC_ERROR(TXC_CC_JSONError, "Cannot append to array");
    return Status();
}

} // namespace txcoord
