/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../txauthor/spend/Fees.hpp"
#include "../../txauthor/spend/Outputs.hpp"
#include "../../txauthor/spend/TxSizes.hpp"
#include <iostream>
#include <stdlib.h>
#include <string.h>

using namespace txauthor;

COMMAND(CliEstimateSize, "estimate-size",
        " <inputs> <p2pkh-outputs> [--change]")
{
    if (argc < 2 || 3 < argc)
        return TXA_ERROR(TXA_CC_Error, helpString(*this));
    const auto inputCount = atol(argv[0]);
    const auto outputCount = atol(argv[1]);
    bool change = false;
    if (argc == 3)
    {
        if (strcmp(argv[2], "--change"))
            return TXA_ERROR(TXA_CC_Error, helpString(*this));
        change = true;
    }
    if (inputCount < 0 || outputCount < 0)
        return TXA_ERROR(TXA_CC_Error, "Counts cannot be negative");

    // Every output pays the same placeholder script:
    bc::short_hash hash;
    hash.fill(0);
    bc::transaction_output_type output;
    output.value = 0;
    output.script = outputScriptForPubkey(hash);

    std::vector<size_t> inputScriptSizes(inputCount, redeemP2pkhSigScriptSize);
    bc::transaction_output_list outputs(outputCount, output);
    const auto size = estimateSignedSize(inputScriptSizes, outputs,
                                         change ? p2pkhPkScriptSize : 0);

    std::cout << "Estimated size: " << size << " bytes" << std::endl;
    std::cout << "Fee at " << session.network.relayFeePerKb << "/kB: " <<
              minerFee(size, session.network.relayFeePerKb, session.network) <<
              std::endl;

    return Status();
}
