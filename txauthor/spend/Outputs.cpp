/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */

#include "Outputs.hpp"
#include <utility>

namespace txauthor {

Status
addressDecode(AddressType &type, bc::short_hash &hash,
              const std::string &address, const NetworkParams &network)
{
    bc::payment_address parsed;
    if (!parsed.set_encoded(address))
        return TXA_ERROR(TXA_CC_InvalidAddress, "Bad address " + address);

    if (parsed.version() == network.pubkeyVersion)
        type = AddressType::pubkeyHash;
    else if (parsed.version() == network.scriptVersion)
        type = AddressType::scriptHash;
    else
        return TXA_ERROR(TXA_CC_UnsupportedAddressType,
                         "Not a " + network.name + " address " + address);

    hash = parsed.hash();
    return Status();
}

Status
addressValidate(const std::string &address, const NetworkParams &network)
{
    AddressType type;
    bc::short_hash hash;
    return addressDecode(type, hash, address, network);
}

bc::script_type
outputScriptForPubkey(const bc::short_hash &hash)
{
    bc::script_type result;
    result.push_operation({bc::opcode::dup, bc::data_chunk()});
    result.push_operation({bc::opcode::hash160, bc::data_chunk()});
    result.push_operation({bc::opcode::special, bc::data_chunk(hash.begin(), hash.end())});
    result.push_operation({bc::opcode::equalverify, bc::data_chunk()});
    result.push_operation({bc::opcode::checksig, bc::data_chunk()});
    return result;
}

bc::script_type
outputScriptForScript(const bc::short_hash &hash)
{
    bc::script_type result;
    result.push_operation({bc::opcode::hash160, bc::data_chunk()});
    result.push_operation({bc::opcode::special, bc::data_chunk(hash.begin(), hash.end())});
    result.push_operation({bc::opcode::equal, bc::data_chunk()});
    return result;
}

Status
outputScriptForAddress(bc::script_type &result, const std::string &address,
                       const NetworkParams &network)
{
    AddressType type;
    bc::short_hash hash;
    TXA_CHECK(addressDecode(type, hash, address, network));

    switch (type)
    {
    case AddressType::pubkeyHash:
        result = outputScriptForPubkey(hash);
        break;
    case AddressType::scriptHash:
        result = outputScriptForScript(hash);
        break;
    }
    return Status();
}

Status
makeTxOutput(bc::transaction_output_type &result, const std::string &address,
             int64_t amount, const NetworkParams &network)
{
    if (amount < 0)
        return TXA_ERROR(TXA_CC_InvalidAmount, "Negative output amount");

    bc::transaction_output_type output;
    output.value = amount;
    TXA_CHECK(outputScriptForAddress(output.script, address, network));

    result = std::move(output);
    return Status();
}

size_t
outputScriptSize(const bc::script_type &script)
{
    return bc::save_script(script).size();
}

uint64_t
outputsTotal(const bc::transaction_output_list &outputs)
{
    uint64_t out = 0;
    for (const auto &output: outputs)
        out += output.value;
    return out;
}

Status
outputRandomizePosition(bc::transaction_output_list &outputs, size_t index,
                        const RandomIndex &random)
{
    if (outputs.size() <= index)
        return TXA_ERROR(TXA_CC_Error, "Output index out of range");

    size_t other;
    TXA_CHECK(random(other, outputs.size()));
    if (outputs.size() <= other)
        return TXA_ERROR(TXA_CC_Error, "Random index out of range");

    std::swap(outputs[index], outputs[other]);
    return Status();
}

} // namespace txauthor
