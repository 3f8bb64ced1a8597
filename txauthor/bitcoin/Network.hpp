/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Routines for dealing with network-specific parameters.
 */

#ifndef TXAUTHOR_BITCOIN_NETWORK_HPP
#define TXAUTHOR_BITCOIN_NETWORK_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <string>

namespace txauthor {

/**
 * Everything the spend code needs to know about the active network.
 */
struct NetworkParams
{
    std::string name;

    /**
     * Base58check version bytes.
     */
    uint8_t pubkeyVersion;
    uint8_t scriptVersion;

    /**
     * The largest amount any single output or total may carry.
     */
    int64_t maxAmount;

    /**
     * The default fee rate, in atoms per 1000 bytes.
     */
    int64_t relayFeePerKb;

    /**
     * An output is dust if spending it would cost more than
     * 1 / dustFactor of its value.
     */
    int64_t dustFactor;

    /**
     * The size of the input needed to spend a typical output,
     * used when deciding if an output is dust.
     */
    size_t dustSpendInputSize;

    /**
     * The largest data push the script interpreter accepts.
     */
    size_t maxScriptElementSize;
};

/**
 * Parameters for the main network.
 */
NetworkParams
networkMainnet();

/**
 * Parameters for the test network.
 */
NetworkParams
networkTestnet();

/**
 * Looks up a network preset by name ("mainnet" or "testnet").
 */
Status
networkByName(NetworkParams &result, const std::string &name);

/**
 * Reads network parameters from a JSON string.
 * Missing keys keep their mainnet values.
 */
Status
networkDecode(NetworkParams &result, const std::string &json);

/**
 * Reads network parameters from a JSON file.
 */
Status
networkLoad(NetworkParams &result, const std::string &path);

} // namespace txauthor

#endif
