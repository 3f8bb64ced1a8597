/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Change.hpp"

namespace txauthor {

ChangeSource::~ChangeSource()
{
}

AddressPool::AddressPool(const std::vector<std::string> &addresses):
    addresses_(addresses),
    next_(0)
{
}

Status
AddressPool::newChangeAddress(std::string &result, uint32_t account)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (addresses_.size() <= next_)
        return TXA_ERROR(TXA_CC_Error, "Change address pool is empty");

    result = addresses_[next_++];
    return Status();
}

size_t
AddressPool::remaining() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return addresses_.size() - next_;
}

} // namespace txauthor
