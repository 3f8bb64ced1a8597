/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_JSON_JSON_ARRAY_HPP
#define TXAUTHOR_JSON_JSON_ARRAY_HPP

#include "JsonPtr.hpp"
#include <vector>

namespace txauthor {

/**
 * A JSON array. A missing array reads as empty.
 */
class JsonArray:
    public JsonPtr
{
public:
    TXA_JSON_CONSTRUCTORS(JsonArray, JsonPtr)

    size_t
    size() const { return json_array_size(root_); }

    /**
     * Returns the element at the given index, or null if out of range.
     */
    JsonPtr
    operator[](size_t i) const;

    /**
     * Adds an element to the end, creating the array if needed.
     */
    Status
    append(JsonPtr value);

    /**
     * Reads out an array whose elements are all strings.
     */
    Status
    strings(std::vector<std::string> &result) const;
};

} // namespace txauthor

#endif
