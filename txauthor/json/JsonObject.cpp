/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace txauthor {

Status
JsonObject::setValue(const char *key, json_t *value)
{
    if (!root_)
        reset(json_object());
    if (!json_is_object(root_))
    {
        json_decref(value);
        return TXA_ERROR(TXA_CC_JSONError,
                         std::string("Cannot set ") + key + " on a non-object");
    }

    if (json_object_set_new(root_, key, value) < 0)
        return TXA_ERROR(TXA_CC_JSONError, std::string("Cannot set ") + key);
    return Status();
}

json_t *
JsonObject::member(const char *key) const
{
    return json_object_get(root_, key);
}

Status
JsonObject::expect(const char *key, bool typeOk) const
{
    if (!member(key))
        return TXA_ERROR(TXA_CC_JSONError, std::string("Missing ") + key);
    if (!typeOk)
        return TXA_ERROR(TXA_CC_JSONError, std::string("Wrong type for ") + key);
    return Status();
}

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    json_t *value = member(key);
    return json_is_string(value) ? json_string_value(value) : fallback;
}

bool
JsonObject::getBoolean(const char *key, bool fallback) const
{
    json_t *value = member(key);
    return json_is_boolean(value) ? json_is_true(value) : fallback;
}

json_int_t
JsonObject::getInteger(const char *key, json_int_t fallback) const
{
    json_t *value = member(key);
    return json_is_integer(value) ? json_integer_value(value) : fallback;
}

} // namespace txauthor
