/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_TX_AUTHOR_HPP
#define TXAUTHOR_SPEND_TX_AUTHOR_HPP

#include "Author.hpp"

namespace txauthor {

/**
 * Options for building a transaction.
 */
class TxAuthor
{
public:
    TxAuthor(ChangeSource &changeSource, const NetworkParams &network);

    /**
     * Spend this previous output.
     */
    Status
    inputAdd(const SelectedInput &input);

    /**
     * Send money to this address.
     */
    Status
    destinationAdd(const std::string &address, int64_t amount);

    /**
     * Send everything left over to this address.
     */
    Status
    destinationAddMax(const std::string &address);

    /**
     * Send this much of the change to this address,
     * rather than using an address from the change source.
     */
    Status
    changeAdd(const std::string &address, int64_t amount);

    /**
     * Overrides the network's default fee rate.
     */
    Status
    feeRateSet(int64_t feeRatePerKb);

    /**
     * Selects the account new change addresses come from.
     */
    Status
    accountSet(uint32_t account);

    /**
     * Replaces the source used to shuffle the change outputs.
     */
    Status
    randomSet(const RandomIndex &random);

    /**
     * Calculate the fees that will be required to perform this send.
     */
    Status
    calculateFees(uint64_t &totalFees);

    /**
     * Calculate the amount the send-max destination would receive.
     */
    Status
    calculateMax(uint64_t &maxAmount);

    /**
     * Builds the unsigned transaction.
     */
    Status
    makeTx(AuthoredTx &result);

private:
    ChangeSource &changeSource_;
    NetworkParams network_;

    InputList inputs_;
    DestinationList destinations_;
    DestinationList change_;
    int64_t feeRatePerKb_;
    uint32_t account_;
    RandomIndex random_;
};

} // namespace txauthor

#endif
