/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_JSON_JSON_PTR_HPP
#define TXAUTHOR_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>
#include <utility>

namespace txauthor {

/**
 * Owns one reference to a jansson value.
 * Copies share the value, bumping its reference count.
 */
class JsonPtr
{
public:
    ~JsonPtr();
    JsonPtr();
    JsonPtr(JsonPtr &&move);
    JsonPtr(const JsonPtr &copy);
    JsonPtr &operator=(JsonPtr other);

    /**
     * Takes over the caller's reference to the value.
     */
    JsonPtr(json_t *root);

    /**
     * Drops the current value, taking over the caller's reference
     * to the new one.
     */
    void
    reset(json_t *root=nullptr);

    /**
     * The underlying value. The caller must not release it.
     */
    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

    /**
     * Parses a JSON file.
     * A missing file is TXA_CC_FileReadError,
     * and anything jansson rejects is TXA_CC_JSONError.
     */
    Status
    load(const std::string &path);

    /**
     * Parses JSON text.
     */
    Status
    decode(const std::string &text);

    /**
     * Writes the value out with sorted keys,
     * either indented or on one line.
     */
    std::string
    encode(bool compact=false) const;

protected:
    json_t *root_;
};

/**
 * Gives JsonPtr subclasses the same set of constructors.
 */
#define TXA_JSON_CONSTRUCTORS(This, Base) \
    This() {} \
    This(JsonPtr &&move): Base(std::move(move)) {} \
    This(const JsonPtr &copy): Base(copy) {}

} // namespace txauthor

#endif
