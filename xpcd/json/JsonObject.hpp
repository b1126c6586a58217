/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef XPCD_JSON_JSON_OBJECT_HPP
#define XPCD_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace xpcd {

/**
 * A JsonPtr with an object (key-value pair) as it's root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    XPC_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

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
    Status hasInteger(const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
};

// Helper macros for implementing JsonObject child classes:

#define XPC_JSON_STRING(name, key, fallback) \
    const char *name() const                    { return getString(key, fallback); } \
    xpcd::Status name##Ok() const               { return hasString(key); } \
    xpcd::Status name##Set(const char *value)   { return setValue(key, json_string(value)); }

#define XPC_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                     { return getInteger(key, fallback); } \
    xpcd::Status name##Ok() const               { return hasInteger(key); } \
    xpcd::Status name##Set(json_int_t value)    { return setValue(key, json_integer(value)); }

} // namespace xpcd

#endif
