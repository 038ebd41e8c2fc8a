/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_JSON_JSON_OBJECT_HPP
#define TXCOORD_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace txcoord {

/**
 * A JsonPtr with an object (key-value pair) as its root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    JsonObject();
    JsonObject(JsonPtr &&move);
    JsonObject(const JsonPtr &copy);

protected:
    /**
     * Writes a key-value pair to the root object,
     * creating the root if necessary.
     * Takes ownership of the passed-in value.
     */
    Status
    setValue(const char *key, json_t *value);

    // Type helpers:
    Status hasString (const char *key) const;
    Status hasNumber (const char *key) const;
    Status hasBoolean(const char *key) const;
    Status hasInteger(const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;
    double      getNumber (const char *key, double fallback) const;
    bool        getBoolean(const char *key, bool fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
};

// Helper macros for implementing JsonObject child classes:

#define TXC_JSON_VALUE(name, key, Type) \
    Type name() const                              { return Type(JsonPtr(json_incref(json_object_get(root_, key)))); } \
    txcoord::Status name##Set(const JsonPtr &value){ return setValue(key, json_incref(value.get())); }

#define TXC_JSON_STRING(name, key, fallback) \
    const char *name() const                       { return getString(key, fallback); } \
    txcoord::Status name##Ok() const               { return hasString(key); } \
    txcoord::Status name##Set(const std::string &value) { return setValue(key, json_string(value.c_str())); }

#define TXC_JSON_NUMBER(name, key, fallback) \
    double name() const                            { return getNumber(key, fallback); } \
    txcoord::Status name##Ok() const               { return hasNumber(key); } \
    txcoord::Status name##Set(double value)        { return setValue(key, json_real(value)); }

#define TXC_JSON_BOOLEAN(name, key, fallback) \
    bool name() const                              { return getBoolean(key, fallback); } \
    txcoord::Status name##Ok() const               { return hasBoolean(key); } \
    txcoord::Status name##Set(bool value)          { return setValue(key, json_boolean(value)); }

#define TXC_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                        { return getInteger(key, fallback); } \
    txcoord::Status name##Ok() const               { return hasInteger(key); } \
    txcoord::Status name##Set(json_int_t value)    { return setValue(key, json_integer(value)); }

} // namespace txcoord

#endif
