/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_JSON_JSON_OBJECT_HPP
#define TXAUTHOR_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace txauthor {

/**
 * A JSON object with named, typed members.
 * Subclasses declare their members with the TXA_JSON_* macros below.
 * Missing or mistyped members read back as the declared fallback.
 */
class JsonObject:
    public JsonPtr
{
public:
    TXA_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

protected:
    /**
     * Stores a member, creating the object if needed.
     * Takes over the caller's reference to the value.
     */
    Status
    setValue(const char *key, json_t *value);

    /**
     * Looks up a member, or returns null.
     */
    json_t *
    member(const char *key) const;

    /**
     * Fails unless the member exists and the type test passed.
     */
    Status
    expect(const char *key, bool typeOk) const;

    const char *getString (const char *key, const char *fallback) const;
    bool        getBoolean(const char *key, bool fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
};

#define TXA_JSON_VALUE(name, key, Type) \
    Type name() const { return Type(json_incref(member(key))); } \
    txauthor::Status name##Set(const JsonPtr &value) { return setValue(key, json_incref(value.get())); }

#define TXA_JSON_STRING(name, key, fallback) \
    const char *name() const { return getString(key, fallback); } \
    txauthor::Status name##Ok() const { return expect(key, json_is_string(member(key))); } \
    txauthor::Status name##Set(const char *value) { return setValue(key, json_string(value)); }

#define TXA_JSON_BOOLEAN(name, key, fallback) \
    bool name() const { return getBoolean(key, fallback); } \
    txauthor::Status name##Ok() const { return expect(key, json_is_boolean(member(key))); } \
    txauthor::Status name##Set(bool value) { return setValue(key, json_boolean(value)); }

#define TXA_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const { return getInteger(key, fallback); } \
    txauthor::Status name##Ok() const { return expect(key, json_is_integer(member(key))); } \
    txauthor::Status name##Set(json_int_t value) { return setValue(key, json_integer(value)); }

} // namespace txauthor

#endif
