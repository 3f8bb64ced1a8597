/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Author.hpp"
#include "Fees.hpp"
#include "Outputs.hpp"
#include "TxSizes.hpp"
#include <utility>

namespace txauthor {

uint64_t
AuthoredTx::fee() const
{
    return totalInput - outputsTotal(tx.outputs);
}

Status
authorTx(AuthoredTx &result,
         const InputList &inputs,
         const DestinationList &sendDestinations,
         const DestinationList &changeDestinations,
         uint32_t account, ChangeSource &changeSource,
         const NetworkParams &network, int64_t feeRatePerKb,
         const RandomIndex &random)
{
    if (feeRatePerKb < 0 || network.maxAmount < feeRatePerKb)
        return TXA_ERROR(TXA_CC_InvalidAmount,
                         "Bad fee rate " + std::to_string(feeRatePerKb));

    uint64_t totalInput;
    TXA_CHECK(inputsTotal(totalInput, inputs, network));

    ParsedDestinations parsed;
    TXA_CHECK(destinationsParse(parsed, sendDestinations, network));
    bc::transaction_output_list outputs = parsed.outputs;

    // Figure out where the change goes:
    std::string changeAddress = parsed.maxAmountAddress;
    if (!changeAddress.empty() && !changeDestinations.empty())
        return TXA_ERROR(TXA_CC_ConflictingChangeSpecification,
                         "Cannot send the maximum amount and also specify change");
    TXA_CHECK(changeDestinationsValidate(changeDestinations, network));
    if (changeAddress.empty() && changeDestinations.empty())
        TXA_CHECK_WRAP(changeSource.newChangeAddress(changeAddress, account),
                       TXA_CC_ChangeAddressGenerationFailed,
                       "Cannot get a change address");

    DestinationList change = changeDestinations;
    if (!changeAddress.empty())
    {
        TransactionDestination destination;
        destination.address = changeAddress;
        change.push_back(destination);
    }

    size_t changeSize = 0;
    for (const auto &destination: change)
    {
        size_t scriptSize;
        TXA_CHECK(changeScriptSize(scriptSize, destination.address, network));
        changeSize += scriptSize;
    }

    // Size the transaction assuming it has change:
    const auto inputScriptSizes = inputsScriptSizes(inputs);
    size_t size = estimateSignedSize(inputScriptSizes, outputs, changeSize);
    const int64_t fee = minerFee(size, feeRatePerKb, network);

    const int64_t changeAmount =
        static_cast<int64_t>(totalInput) - parsed.totalSend - fee;
    if (changeAmount < 0)
        return TXA_ERROR(TXA_CC_InsufficientFunds,
                         "Insufficient funds, short by " +
                         std::to_string(-changeAmount));

    if (!changeAmount ||
        outputIsDust(changeAmount, changeSize, feeRatePerKb, network))
    {
        // The leftover goes to the miners:
        size = estimateSignedSize(inputScriptSizes, outputs, 0);
    }
    else
    {
        if (!changeAddress.empty())
            change.back().amount = changeAmount;

        int64_t totalChange = 0;
        for (const auto &destination: change)
        {
            bc::transaction_output_type output;
            TXA_CHECK(makeTxOutput(output, destination.address,
                                   destination.amount, network));
            if (network.maxScriptElementSize < outputScriptSize(output.script))
                return TXA_ERROR(TXA_CC_ScriptTooLarge,
                                 "Change script is too large");
            if (outputIsDust(destination.amount,
                             outputScriptSize(output.script),
                             feeRatePerKb, network))
                return TXA_ERROR(TXA_CC_InvalidAmount,
                                 "Change of " +
                                 std::to_string(destination.amount) + " to " +
                                 destination.address + " would be dust");

            totalChange += destination.amount;
            outputs.push_back(output);
            TXA_CHECK(outputRandomizePosition(outputs, outputs.size() - 1,
                                              random));
        }

        if (changeAmount < totalChange)
            return TXA_ERROR(TXA_CC_ChangeAllocationExceedsAvailable,
                             "Change destinations want " +
                             std::to_string(totalChange) + " but only " +
                             std::to_string(changeAmount) + " is available");
    }

    AuthoredTx out;
    out.tx.version = 1;
    out.tx.locktime = 0;
    out.tx.inputs = inputsForTx(inputs);
    out.tx.outputs = std::move(outputs);
    out.totalInput = totalInput;
    out.estimatedSignedSize = size;

    result = std::move(out);
    return Status();
}

Status
authorTx(AuthoredTx &result,
         const InputList &inputs,
         const DestinationList &sendDestinations,
         const DestinationList &changeDestinations,
         uint32_t account, ChangeSource &changeSource,
         const NetworkParams &network)
{
    return authorTx(result, inputs, sendDestinations, changeDestinations,
                    account, changeSource, network, network.relayFeePerKb,
                    randomIndex);
}

} // namespace txauthor
