/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_SPEND_TX_SIZES_HPP
#define TXAUTHOR_SPEND_TX_SIZES_HPP

#include "../bitcoin/Network.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>
#include <vector>

namespace txauthor {

/**
 * OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
 */
constexpr size_t p2pkhPkScriptSize = 25;

/**
 * OP_HASH160 <20 bytes> OP_EQUAL
 */
constexpr size_t p2shPkScriptSize = 23;

/**
 * <73-byte DER signature> <33-byte compressed pubkey>, with push opcodes.
 */
constexpr size_t redeemP2pkhSigScriptSize = 1 + 73 + 1 + 33;

/**
 * Same as above, but with a 65-byte uncompressed pubkey.
 */
constexpr size_t redeemP2pkhUncompressedSigScriptSize = 1 + 73 + 1 + 65;

/**
 * Serialized size of an input with a signature script of the given size.
 */
size_t
inputSize(size_t sigScriptSize);

/**
 * Serialized size of an output with an output script of the given size.
 */
size_t
outputSize(size_t pkScriptSize);

/**
 * Works out how big a change output script paying this address will be.
 */
Status
changeScriptSize(size_t &result, const std::string &address,
                 const NetworkParams &network);

/**
 * Estimates the size of the fully-signed transaction.
 * A changeScriptSize of 0 means the transaction has no change slot.
 */
size_t
estimateSignedSize(const std::vector<size_t> &inputScriptSizes,
                   const bc::transaction_output_list &outputs,
                   size_t changeScriptSize);

} // namespace txauthor

#endif
