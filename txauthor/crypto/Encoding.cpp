/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"

namespace txauthor {

static const char base16Chars[] = "0123456789abcdef";

std::string
base16Encode(const DataChunk &data)
{
    std::string out;
    out.reserve(2 * data.size());
    for (auto i: data)
    {
        out += base16Chars[i >> 4];
        out += base16Chars[i & 0x0f];
    }
    return out;
}

static int
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return c - 'a' + 10;
    if ('A' <= c && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    if (in.size() % 2)
        return TXA_ERROR(TXA_CC_ParseError, "Bad hex: odd length");

    DataChunk out;
    out.reserve(in.size() / 2);
    for (size_t i = 0; i < in.size(); i += 2)
    {
        int hi = base16Value(in[i]);
        int lo = base16Value(in[i + 1]);
        if (hi < 0 || lo < 0)
            return TXA_ERROR(TXA_CC_ParseError, "Bad hex: " + in);
        out.push_back(static_cast<uint8_t>(hi << 4 | lo));
    }

    result = std::move(out);
    return Status();
}

} // namespace txauthor
