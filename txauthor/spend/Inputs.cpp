/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Inputs.hpp"

namespace txauthor {

Status
inputsTotal(uint64_t &result, const InputList &inputs,
            const NetworkParams &network)
{
    const uint64_t limit = network.maxAmount;

    uint64_t out = 0;
    for (const auto &input: inputs)
    {
        // Checking against the remaining room keeps the sum from wrapping:
        if (limit < input.value || limit - out < input.value)
            return TXA_ERROR(TXA_CC_InvalidAmount,
                             "Input value " + std::to_string(input.value) +
                             " puts the total above the maximum amount");
        out += input.value;
    }

    result = out;
    return Status();
}

std::vector<size_t>
inputsScriptSizes(const InputList &inputs)
{
    std::vector<size_t> out;
    out.reserve(inputs.size());
    for (const auto &input: inputs)
        out.push_back(input.sigScriptSize);
    return out;
}

bc::transaction_input_list
inputsForTx(const InputList &inputs)
{
    bc::transaction_input_list out;
    for (const auto &input: inputs)
    {
        bc::transaction_input_type txInput;
        txInput.previous_output = input.point;
        txInput.script = input.script;
        txInput.sequence = input.sequence;
        out.push_back(txInput);
    }
    return out;
}

} // namespace txauthor
