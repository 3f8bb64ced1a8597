/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Fees.hpp"
#include "TxSizes.hpp"

namespace txauthor {

int64_t
minerFee(size_t size, int64_t feeRatePerKb, const NetworkParams &network)
{
    if (feeRatePerKb <= 0)
        return 0;
    if (network.maxAmount < feeRatePerKb)
        feeRatePerKb = network.maxAmount;

    // Split the size so the multiplication stays in range:
    const int64_t kb = size / 1000;
    const int64_t rest = size % 1000;
    if (kb && network.maxAmount / kb < feeRatePerKb)
        return network.maxAmount;

    int64_t fee = kb * feeRatePerKb + (rest * feeRatePerKb + 999) / 1000;
    if (network.maxAmount < fee)
        fee = network.maxAmount;
    return fee;
}

bool
outputIsDust(int64_t value, size_t pkScriptSize, int64_t feeRatePerKb,
             const NetworkParams &network)
{
    const size_t spendSize = outputSize(pkScriptSize) +
        network.dustSpendInputSize;
    return value < network.dustFactor *
        minerFee(spendSize, feeRatePerKb, network);
}

} // namespace txauthor
