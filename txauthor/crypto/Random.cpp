/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/rand.h>
#include <limits>

namespace txauthor {

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out(size);
    if (size && 1 != RAND_bytes(out.data(), out.size()))
        return TXA_ERROR(TXA_CC_SysError, "Random data generation failed");

    result = std::move(out);
    return Status();
}

Status
randomIndex(size_t &result, size_t size)
{
    if (!size)
        return TXA_ERROR(TXA_CC_Error, "Cannot pick from an empty range");

    // Values at or above this limit would favor the low indices:
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    const uint64_t limit = max - max % size;

    uint64_t value;
    do
    {
        DataChunk data;
        TXA_CHECK(randomData(data, sizeof(value)));
        value = 0;
        for (auto byte: data)
            value = value << 8 | byte;
    }
    while (limit <= value);

    result = value % size;
    return Status();
}

} // namespace txauthor
