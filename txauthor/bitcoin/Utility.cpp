/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Utility.hpp"
#include "../crypto/Encoding.hpp"
#include <algorithm>

namespace txauthor {

size_t
varIntSize(uint64_t value)
{
    if (value < 0xfd)
        return 1;
    if (value <= 0xffff)
        return 3;
    if (value <= 0xffffffff)
        return 5;
    return 9;
}

DataChunk
txSerialize(const bc::transaction_type &tx)
{
    DataChunk out(bc::satoshi_raw_size(tx));
    bc::satoshi_save(tx, out.begin());
    return out;
}

Status
txidDecode(bc::hash_digest &result, const std::string &txid)
{
    DataChunk data;
    TXA_CHECK(base16Decode(data, txid));
    if (data.size() != result.size())
        return TXA_ERROR(TXA_CC_ParseError, "Bad txid length: " + txid);

    std::reverse_copy(data.begin(), data.end(), result.begin());
    return Status();
}

} // namespace txauthor
