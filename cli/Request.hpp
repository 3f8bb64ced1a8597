/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_REQUEST_HPP
#define CLI_REQUEST_HPP

#include "../txauthor/spend/TxAuthor.hpp"
#include <vector>

/**
 * A transaction request, as read from a JSON file.
 */
struct Request
{
    txauthor::InputList inputs;
    txauthor::DestinationList destinations;
    txauthor::DestinationList change;
    std::vector<std::string> changePool;

    bool hasFeeRate = false;
    int64_t feeRatePerKb = 0;
    uint32_t account = 0;
};

/**
 * Reads a request file from disk.
 */
txauthor::Status
requestLoad(Request &result, const std::string &path);

/**
 * Feeds a request into a transaction builder.
 */
txauthor::Status
requestApply(txauthor::TxAuthor &author, const Request &request);

#endif
