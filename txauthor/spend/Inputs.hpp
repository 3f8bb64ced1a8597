/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_INPUTS_HPP
#define TXAUTHOR_SPEND_INPUTS_HPP

#include "TxSizes.hpp"
#include "../bitcoin/Network.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>
#include <vector>

namespace txauthor {

/**
 * An unspent output that the caller has already chosen to spend.
 */
struct SelectedInput
{
    bc::output_point point;
    uint64_t value = 0;

    /**
     * The size of the signature script this input will have once signed,
     * such as redeemP2pkhSigScriptSize.
     */
    size_t sigScriptSize = redeemP2pkhSigScriptSize;

    /**
     * Placeholder script, replaced when the transaction is signed.
     */
    bc::script_type script;

    uint32_t sequence = 0xffffffff;
};

typedef std::vector<SelectedInput> InputList;

/**
 * Adds up the value of the inputs.
 * Fails if any input, or the total, is above the network's maximum amount.
 */
Status
inputsTotal(uint64_t &result, const InputList &inputs,
            const NetworkParams &network);

/**
 * Lists the expected signature script size of each input.
 */
std::vector<size_t>
inputsScriptSizes(const InputList &inputs);

/**
 * Converts the inputs into transaction inputs, preserving their order.
 */
bc::transaction_input_list
inputsForTx(const InputList &inputs);

} // namespace txauthor

#endif
