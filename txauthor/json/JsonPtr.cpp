/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/FileIO.hpp"
#include <stdlib.h>
#include <utility>

namespace txauthor {

static std::string
parseError(const std::string &source, const json_error_t &error)
{
    return source + ":" + std::to_string(error.line) + ":" +
        std::to_string(error.column) + ": " + error.text;
}

JsonPtr::~JsonPtr()
{
    json_decref(root_);
}

JsonPtr::JsonPtr():
    root_(nullptr)
{
}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(move.root_)
{
    move.root_ = nullptr;
}

JsonPtr::JsonPtr(const JsonPtr &copy):
    root_(json_incref(copy.root_))
{
}

JsonPtr &
JsonPtr::operator=(JsonPtr other)
{
    std::swap(root_, other.root_);
    return *this;
}

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{
}

void
JsonPtr::reset(json_t *root)
{
    JsonPtr old(root_);
    root_ = root;
}

Status
JsonPtr::load(const std::string &path)
{
    if (!fileExists(path))
        return TXA_ERROR(TXA_CC_FileReadError, "Cannot find " + path);

    json_error_t error;
    json_t *root = json_load_file(path.c_str(), 0, &error);
    if (!root)
        return TXA_ERROR(TXA_CC_JSONError, parseError(path, error));

    reset(root);
    return Status();
}

Status
JsonPtr::decode(const std::string &text)
{
    json_error_t error;
    json_t *root = json_loadb(text.data(), text.size(), 0, &error);
    if (!root)
        return TXA_ERROR(TXA_CC_JSONError, parseError("<text>", error));

    reset(root);
    return Status();
}

std::string
JsonPtr::encode(bool compact) const
{
    const size_t flags = JSON_SORT_KEYS |
        (compact ? JSON_COMPACT : JSON_INDENT(4));

    char *raw = root_ ? json_dumps(root_, flags) : nullptr;
    if (!raw)
        return "null";

    std::string out(raw);
    free(raw);
    return out;
}

} // namespace txauthor
