/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Request.hpp"
#include "../../txauthor/bitcoin/Utility.hpp"
#include "../../txauthor/crypto/Encoding.hpp"
#include "../../txauthor/util/Debug.hpp"
#include <iostream>

using namespace txauthor;

COMMAND(CliAuthor, "author",
        " <request.json>")
{
    if (argc != 1)
        return TXA_ERROR(TXA_CC_Error, helpString(*this));

    Request request;
    TXA_CHECK(requestLoad(request, argv[0]));

    AddressPool pool(request.changePool);
    TxAuthor author(pool, session.network);
    TXA_CHECK(requestApply(author, request));

    AuthoredTx authored;
    TXA_CHECK(author.makeTx(authored));
    TXA_DebugLog("%s", bc::pretty(authored.tx).c_str());

    for (const auto &output: authored.tx.outputs)
        std::cout << "output: " << output.value << " " <<
                  bc::pretty(output.script) << std::endl;
    std::cout << "total input: " << authored.totalInput << std::endl;
    std::cout << "fee: " << authored.fee() << std::endl;
    std::cout << "estimated size: " << authored.estimatedSignedSize << std::endl;
    std::cout << base16Encode(txSerialize(authored.tx)) << std::endl;

    return Status();
}

COMMAND(CliFee, "fee",
        " <request.json>")
{
    if (argc != 1)
        return TXA_ERROR(TXA_CC_Error, helpString(*this));

    Request request;
    TXA_CHECK(requestLoad(request, argv[0]));

    AddressPool pool(request.changePool);
    TxAuthor author(pool, session.network);
    TXA_CHECK(requestApply(author, request));

    uint64_t fee;
    TXA_CHECK(author.calculateFees(fee));
    std::cout << "fee: " << fee << std::endl;

    return Status();
}

COMMAND(CliMax, "max",
        " <request.json>")
{
    if (argc != 1)
        return TXA_ERROR(TXA_CC_Error, helpString(*this));

    Request request;
    TXA_CHECK(requestLoad(request, argv[0]));

    AddressPool pool(request.changePool);
    TxAuthor author(pool, session.network);
    TXA_CHECK(requestApply(author, request));

    uint64_t max;
    TXA_CHECK(author.calculateMax(max));
    std::cout << "max: " << max << std::endl;

    return Status();
}
