/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_DESTINATIONS_HPP
#define TXAUTHOR_SPEND_DESTINATIONS_HPP

#include "../bitcoin/Network.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>
#include <vector>

namespace txauthor {

/**
 * A place to send money.
 * If sendMax is set, the amount is ignored and the destination
 * receives whatever is left after the other outputs and fees.
 */
struct TransactionDestination
{
    std::string address;
    int64_t amount = 0;
    bool sendMax = false;
};

typedef std::vector<TransactionDestination> DestinationList;

/**
 * The payment outputs described by a destination list.
 */
struct ParsedDestinations
{
    /**
     * Fixed-amount outputs, in caller order.
     */
    bc::transaction_output_list outputs;

    /**
     * Sum of the fixed amounts.
     */
    int64_t totalSend = 0;

    /**
     * The send-max address, or empty if there isn't one.
     */
    std::string maxAmountAddress;
};

/**
 * Checks that an amount is positive and no larger than
 * a single output can carry.
 */
Status
amountValidate(int64_t amount, const NetworkParams &network);

/**
 * Turns the caller's destinations into payment outputs.
 * At most one destination may be marked sendMax.
 */
Status
destinationsParse(ParsedDestinations &result,
                  const DestinationList &destinations,
                  const NetworkParams &network);

/**
 * Checks an explicit change list. Each entry needs a fixed
 * amount and a payable address.
 */
Status
changeDestinationsValidate(const DestinationList &destinations,
                           const NetworkParams &network);

} // namespace txauthor

#endif
