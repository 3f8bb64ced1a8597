/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Destinations.hpp"
#include "Outputs.hpp"
#include <utility>

namespace txauthor {

Status
amountValidate(int64_t amount, const NetworkParams &network)
{
    if (amount <= 0)
        return TXA_ERROR(TXA_CC_InvalidAmount,
                         "Amount " + std::to_string(amount) + " is not positive");
    if (network.maxAmount < amount)
        return TXA_ERROR(TXA_CC_InvalidAmount,
                         "Amount " + std::to_string(amount) + " is too large");
    return Status();
}

Status
destinationsParse(ParsedDestinations &result,
                  const DestinationList &destinations,
                  const NetworkParams &network)
{
    ParsedDestinations out;

    for (const auto &destination: destinations)
    {
        if (!destination.sendMax)
            TXA_CHECK(amountValidate(destination.amount, network));

        if (destination.sendMax)
        {
            if (!out.maxAmountAddress.empty())
                return TXA_ERROR(TXA_CC_MultipleMaxAmountRecipients,
                                 "Only one destination may receive the maximum amount");
            TXA_CHECK(addressValidate(destination.address, network));
            out.maxAmountAddress = destination.address;
            continue;
        }

        bc::transaction_output_type output;
        TXA_CHECK(makeTxOutput(output, destination.address,
                               destination.amount, network));
        out.outputs.push_back(output);

        out.totalSend += destination.amount;
        if (network.maxAmount < out.totalSend)
            return TXA_ERROR(TXA_CC_InvalidAmount, "Total send amount is too large");
    }

    result = std::move(out);
    return Status();
}

Status
changeDestinationsValidate(const DestinationList &destinations,
                           const NetworkParams &network)
{
    for (const auto &destination: destinations)
    {
        if (destination.sendMax)
            return TXA_ERROR(TXA_CC_InvalidAmount,
                             "Change destinations cannot receive the maximum amount");
        TXA_CHECK(amountValidate(destination.amount, network));
        TXA_CHECK(addressValidate(destination.address, network));
    }
    return Status();
}

} // namespace txauthor
