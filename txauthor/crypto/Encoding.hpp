/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_CRYPTO_ENCODING_HPP
#define TXAUTHOR_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace txauthor {

/**
 * Encodes data into a hex string.
 */
std::string
base16Encode(const DataChunk &data);

/**
 * Decodes a hex string.
 * Accepts both upper and lower case digits.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

} // namespace txauthor

#endif
