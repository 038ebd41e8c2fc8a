/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_JSON_JSON_PTR_HPP
#define TXCOORD_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace txcoord {

/**
 * A json_t smart pointer.
 */
class JsonPtr
{
public:
    ~JsonPtr();
    JsonPtr();
    JsonPtr(JsonPtr &&move);
    JsonPtr(const JsonPtr &copy);
    JsonPtr &operator=(const JsonPtr &copy);

    /**
     * Accepts a JSON value for use as the root.
     * Takes ownership of the passed-in value.
     */
    JsonPtr(json_t *root);

    /**
     * Frees the JSON root value and replaces it with a new one.
     * Takes ownership of the passed-in value.
     */
    void
    reset(json_t *root=nullptr);

    /**
     * Obtains the root JSON node. Do not free.
     */
    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

    /**
     * Makes a deep copy of the JSON value,
     * so the copy can be modified without affecting this one.
     */
    JsonPtr
    clone() const;

    /**
     * Loads the JSON value from disk.
     */
    Status
    load(const std::string &filename);

    /**
     * Loads the JSON value from an in-memory string.
     */
    Status
    decode(const std::string &data);

    /**
     * Saves the JSON value to disk, replacing the old file atomically.
     */
    Status
    save(const std::string &filename) const;

    /**
     * Saves the JSON value to an in-memory string.
     */
    std::string
    encode(bool compact=false) const;

protected:
    json_t *root_;
};

/**
 * Adds the standard constructors to JsonPtr child classes.
 */
#define TXC_JSON_CONSTRUCTORS(This, Base) \
    This() {} \
    This(JsonPtr &&move): Base(std::move(move)) {} \
    This(const JsonPtr &copy): Base(copy) {}

} // namespace txcoord

#endif
