/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txauthor/spend/Fees.hpp"
#include <catch.hpp>

TEST_CASE("Miner fees", "[spend][fee]")
{
    const auto mainnet = txauthor::networkMainnet();

    REQUIRE(227 == txauthor::minerFee(227, 1000, mainnet));
    REQUIRE(1000 == txauthor::minerFee(1000, 1000, mainnet));
    REQUIRE(0 == txauthor::minerFee(0, 1000, mainnet));
    REQUIRE(0 == txauthor::minerFee(227, 0, mainnet));

    SECTION("partial units round up")
    {
        REQUIRE(1 == txauthor::minerFee(1, 1000, mainnet));
        REQUIRE(1 == txauthor::minerFee(250, 1, mainnet));
        REQUIRE(46 == txauthor::minerFee(227, 200, mainnet));
        REQUIRE(2 == txauthor::minerFee(1001, 1, mainnet));
    }
    SECTION("monotonic in size")
    {
        int64_t last = 0;
        for (size_t size = 0; size < 3000; ++size)
        {
            const auto fee = txauthor::minerFee(size, 1234, mainnet);
            REQUIRE(last <= fee);
            last = fee;
        }
    }
    SECTION("clamped to the maximum amount")
    {
        REQUIRE(mainnet.maxAmount ==
                txauthor::minerFee(100000, mainnet.maxAmount, mainnet));
        REQUIRE(mainnet.maxAmount ==
                txauthor::minerFee(100000, INT64_MAX, mainnet));
    }
}

TEST_CASE("Dust threshold", "[spend][fee]")
{
    const auto mainnet = txauthor::networkMainnet();

    // P2PKH outputs are dust below 546 at the default relay fee:
    REQUIRE(txauthor::outputIsDust(545, 25, 1000, mainnet));
    REQUIRE_FALSE(txauthor::outputIsDust(546, 25, 1000, mainnet));

    // P2SH outputs are a little smaller to spend:
    REQUIRE(txauthor::outputIsDust(539, 23, 1000, mainnet));
    REQUIRE_FALSE(txauthor::outputIsDust(540, 23, 1000, mainnet));

    // The threshold scales with the fee rate:
    REQUIRE(txauthor::outputIsDust(1091, 25, 2000, mainnet));
    REQUIRE_FALSE(txauthor::outputIsDust(1092, 25, 2000, mainnet));

    // Nothing is dust when fees are free:
    REQUIRE_FALSE(txauthor::outputIsDust(1, 25, 0, mainnet));
}
