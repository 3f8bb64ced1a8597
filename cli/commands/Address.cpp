/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../txauthor/spend/Outputs.hpp"
#include "../../txauthor/spend/TxSizes.hpp"
#include <iostream>

using namespace txauthor;

COMMAND(CliAddressCheck, "address-check",
        " <address>")
{
    if (argc != 1)
        return TXA_ERROR(TXA_CC_Error, helpString(*this));
    const std::string address = argv[0];

    AddressType type;
    bc::short_hash hash;
    Status s = addressDecode(type, hash, address, session.network);
    if (!s)
    {
        std::cout << address << " is not valid: " << s.message() << std::endl;
        return Status();
    }

    size_t scriptSize;
    TXA_CHECK(changeScriptSize(scriptSize, address, session.network));
    std::cout << address << " is a valid " << session.network.name << " " <<
              (AddressType::pubkeyHash == type ? "pubkey-hash" : "script-hash") <<
              " address (" << scriptSize << "-byte script)" << std::endl;

    return Status();
}
