/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_OUTPUTS_HPP
#define TXAUTHOR_SPEND_OUTPUTS_HPP

#include "../bitcoin/Network.hpp"
#include "../crypto/Random.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txauthor {

/**
 * The kinds of address the spend code knows how to pay.
 */
enum class AddressType
{
    pubkeyHash,
    scriptHash
};

/**
 * Decodes an address and works out what kind it is.
 * Fails with TXA_CC_InvalidAddress if the address doesn't decode,
 * or TXA_CC_UnsupportedAddressType if its version byte
 * isn't one the network uses.
 */
Status
addressDecode(AddressType &type, bc::short_hash &hash,
              const std::string &address, const NetworkParams &network);

/**
 * Succeeds if the address is payable on the given network.
 */
Status
addressValidate(const std::string &address, const NetworkParams &network);

bc::script_type
outputScriptForPubkey(const bc::short_hash &hash);

bc::script_type
outputScriptForScript(const bc::short_hash &hash);

/**
 * Creates an output script for sending money to an address.
 */
Status
outputScriptForAddress(bc::script_type &result, const std::string &address,
                       const NetworkParams &network);

/**
 * Creates an output paying the given amount to an address.
 */
Status
makeTxOutput(bc::transaction_output_type &result, const std::string &address,
             int64_t amount, const NetworkParams &network);

/**
 * Returns the serialized length of an output script.
 */
size_t
outputScriptSize(const bc::script_type &script);

uint64_t
outputsTotal(const bc::transaction_output_list &outputs);

/**
 * Swaps the output at the given index with one picked at random
 * from the whole list.
 */
Status
outputRandomizePosition(bc::transaction_output_list &outputs, size_t index,
                        const RandomIndex &random);

} // namespace txauthor

#endif
