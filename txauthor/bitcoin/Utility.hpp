/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utility functions that should probably go into libbitcoin one day.
 */

#ifndef TXAUTHOR_BITCOIN_UTILITY_HPP
#define TXAUTHOR_BITCOIN_UTILITY_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace txauthor {

/**
 * Returns the number of bytes needed to serialize a variable-length integer.
 */
size_t
varIntSize(uint64_t value);

/**
 * Serializes a transaction into its raw wire format.
 */
DataChunk
txSerialize(const bc::transaction_type &tx);

/**
 * Decodes a transaction id from its usual byte-reversed hex display form.
 */
Status
txidDecode(bc::hash_digest &result, const std::string &txid);

} // namespace txauthor

#endif
