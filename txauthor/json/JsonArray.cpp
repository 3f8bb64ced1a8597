/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonArray.hpp"
#include <utility>

namespace txauthor {

JsonPtr
JsonArray::operator[](size_t i) const
{
    return json_incref(json_array_get(root_, i));
}

Status
JsonArray::append(JsonPtr value)
{
    if (!root_)
        reset(json_array());
    if (!json_is_array(root_))
        return TXA_ERROR(TXA_CC_JSONError, "Cannot append to a non-array");

    if (json_array_append(root_, value.get()) < 0)
        return TXA_ERROR(TXA_CC_JSONError, "Cannot append to array");
    return Status();
}

Status
JsonArray::strings(std::vector<std::string> &result) const
{
    std::vector<std::string> out;
    for (size_t i = 0; i < size(); ++i)
    {
        json_t *value = json_array_get(root_, i);
        if (!json_is_string(value))
            return TXA_ERROR(TXA_CC_JSONError,
                             "Element " + std::to_string(i) + " is not a string");
        out.push_back(json_string_value(value));
    }

    result = std::move(out);
    return Status();
}

} // namespace txauthor
