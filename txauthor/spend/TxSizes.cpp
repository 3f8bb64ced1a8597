/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TxSizes.hpp"
#include "Outputs.hpp"
#include "../bitcoin/Utility.hpp"

namespace txauthor {

size_t
inputSize(size_t sigScriptSize)
{
    // Outpoint hash, outpoint index, script, sequence:
    return 32 + 4 + varIntSize(sigScriptSize) + sigScriptSize + 4;
}

size_t
outputSize(size_t pkScriptSize)
{
    // Value, script:
    return 8 + varIntSize(pkScriptSize) + pkScriptSize;
}

Status
changeScriptSize(size_t &result, const std::string &address,
                 const NetworkParams &network)
{
    AddressType type;
    bc::short_hash hash;
    TXA_CHECK(addressDecode(type, hash, address, network));

    switch (type)
    {
    case AddressType::pubkeyHash:
        result = p2pkhPkScriptSize;
        break;
    case AddressType::scriptHash:
        result = p2shPkScriptSize;
        break;
    }
    return Status();
}

size_t
estimateSignedSize(const std::vector<size_t> &inputScriptSizes,
                   const bc::transaction_output_list &outputs,
                   size_t changeScriptSize)
{
    const size_t outputCount = outputs.size() + (changeScriptSize ? 1 : 0);

    // Version, input count, output count, locktime:
    size_t size = 4 + varIntSize(inputScriptSizes.size()) +
        varIntSize(outputCount) + 4;

    for (auto scriptSize: inputScriptSizes)
        size += inputSize(scriptSize);
    for (const auto &output: outputs)
        size += outputSize(outputScriptSize(output.script));
    if (changeScriptSize)
        size += outputSize(changeScriptSize);

    return size;
}

} // namespace txauthor
