/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_CRYPTO_RANDOM_HPP
#define TXAUTHOR_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <functional>

namespace txauthor {

/**
 * Picks an index in the range [0, size).
 */
typedef std::function<Status (size_t &result, size_t size)> RandomIndex;

/**
 * Creates a buffer of random data.
 */
Status
randomData(DataChunk &result, size_t size);

/**
 * Picks a uniformly-distributed index in the range [0, size)
 * using the OpenSSL random number generator.
 */
Status
randomIndex(size_t &result, size_t size);

} // namespace txauthor

#endif
