/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_AUTHOR_HPP
#define TXAUTHOR_SPEND_AUTHOR_HPP

#include "Change.hpp"
#include "Destinations.hpp"
#include "Inputs.hpp"
#include "../bitcoin/Network.hpp"
#include "../crypto/Random.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txauthor {

/**
 * An unsigned transaction, ready to be handed to a signer.
 */
struct AuthoredTx
{
    bc::transaction_type tx;

    /**
     * The value of all the inputs.
     */
    uint64_t totalInput = 0;

    /**
     * The expected size once every input is signed.
     * With several explicit change destinations, their scripts are
     * counted as one output, so this can come in a few bytes low.
     */
    size_t estimatedSignedSize = 0;

    /**
     * The amount left over for the miners.
     */
    uint64_t fee() const;
};

/**
 * Builds an unsigned transaction spending the given inputs.
 *
 * Change goes to the send-max destination if there is one,
 * otherwise to the explicit change destinations if there are any,
 * otherwise to a fresh address from the change source.
 * Change that would be dust is left to the miners instead.
 * When that happens to a send-max request with no other payments,
 * the transaction comes back with no outputs at all.
 * An explicit change amount that would be dust is TXA_CC_InvalidAmount.
 */
Status
authorTx(AuthoredTx &result,
         const InputList &inputs,
         const DestinationList &sendDestinations,
         const DestinationList &changeDestinations,
         uint32_t account, ChangeSource &changeSource,
         const NetworkParams &network, int64_t feeRatePerKb,
         const RandomIndex &random);

/**
 * Same as above, using the network's relay fee and
 * the system random number generator.
 */
Status
authorTx(AuthoredTx &result,
         const InputList &inputs,
         const DestinationList &sendDestinations,
         const DestinationList &changeDestinations,
         uint32_t account, ChangeSource &changeSource,
         const NetworkParams &network);

} // namespace txauthor

#endif
