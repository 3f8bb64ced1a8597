/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_UTIL_DATA_HPP
#define TXAUTHOR_UTIL_DATA_HPP

#include <stdint.h>
#include <vector>

namespace txauthor {

/**
 * Raw bytes, such as a serialized transaction or a random buffer.
 */
typedef std::vector<uint8_t> DataChunk;

} // namespace txauthor

#endif
