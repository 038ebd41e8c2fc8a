/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace txcoord {

JsonObject::JsonObject():
    JsonPtr(json_object())
{}

JsonObject::JsonObject(JsonPtr &&move):
    JsonPtr(std::move(move))
{
    if (!json_is_object(root_))
        reset(json_object());
}

JsonObject::JsonObject(const JsonPtr &copy):
    JsonPtr(copy)
{
    if (!json_is_object(root_))
        reset(json_object());
}

#define IMPLEMENT_HAS(test) \
    json_t *value = json_object_get(root_, key); \
    if (!value || !(test)) \
        return TXC_ERROR(TXC_CC_JSONError, "Bad JSON value for " + std::string(key)); \
    return Status();

Status
JsonObject::setValue(const char *key, json_t *value)
{
    if (!root_)
        root_ = json_object();
    if (!root_)
        return TXC_ERROR(TXC_CC_JSONError, "Cannot create root object.");
    if (json_object_set_new(root_, key, value) < 0)
        return TXC_ERROR(TXC_CC_JSONError, "Cannot set " + std::string(key));
    return Status();
}

Status
JsonObject::hasString (const char *key) const
{
    IMPLEMENT_HAS(json_is_string(value))
}

Status
JsonObject::hasNumber (const char *key) const
{
    IMPLEMENT_HAS(json_is_number(value))
}

Status
JsonObject::hasBoolean(const char *key) const
{
    IMPLEMENT_HAS(json_is_boolean(value))
}

Status
JsonObject::hasInteger(const char *key) const
{
    IMPLEMENT_HAS(json_is_integer(value))
}

#define IMPLEMENT_GET(type) \
    json_t *value = json_object_get(root_, key); \
    if (!value || !json_is_##type(value)) \
        return fallback; \
    return json_##type##_value(value);

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    IMPLEMENT_GET(string)
}

double
JsonObject::getNumber(const char *key, double fallback) const
{
    IMPLEMENT_GET(number)
}

bool
JsonObject::getBoolean(const char *key, bool fallback) const
{
    json_t *value = json_object_get(root_, key);
    if (!value || !json_is_boolean(value))
        return fallback;
    return json_is_true(value);
}

json_int_t
JsonObject::getInteger(const char *key, json_int_t fallback) const
{
    IMPLEMENT_GET(integer)
}

} // namespace txcoord
