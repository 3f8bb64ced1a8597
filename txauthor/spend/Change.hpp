/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_CHANGE_HPP
#define TXAUTHOR_SPEND_CHANGE_HPP

#include "../util/Status.hpp"
#include <mutex>
#include <vector>

namespace txauthor {

/**
 * Hands out fresh change addresses.
 * Implementations must be safe to call from several threads at once.
 */
class ChangeSource
{
public:
    virtual ~ChangeSource();

    /**
     * Returns an unused change address belonging to the account.
     */
    virtual Status
    newChangeAddress(std::string &result, uint32_t account) = 0;
};

/**
 * A change source backed by a fixed list of addresses,
 * handed out in order. Every account draws from the same list.
 */
class AddressPool:
    public ChangeSource
{
public:
    explicit AddressPool(const std::vector<std::string> &addresses);

    Status
    newChangeAddress(std::string &result, uint32_t account) override;

    /**
     * The number of addresses not yet handed out.
     */
    size_t
    remaining() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> addresses_;
    size_t next_;
};

} // namespace txauthor

#endif
