/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_FEES_HPP
#define TXAUTHOR_SPEND_FEES_HPP

#include "../bitcoin/Network.hpp"
#include <stdint.h>
#include <stddef.h>

namespace txauthor {

/**
 * Returns the fee a transaction of the given size must pay,
 * rounding partial kilobytes up.
 * Never returns more than the network's maximum amount.
 */
int64_t
minerFee(size_t size, int64_t feeRatePerKb, const NetworkParams &network);

/**
 * Returns true if an output with this value and script size costs
 * too much to spend at the given fee rate.
 */
bool
outputIsDust(int64_t value, size_t pkScriptSize, int64_t feeRatePerKb,
             const NetworkParams &network);

} // namespace txauthor

#endif
