/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txauthor/crypto/Encoding.hpp"
#include "../txauthor/spend/Outputs.hpp"
#include <catch.hpp>

TEST_CASE("Address decoding", "[spend][address]")
{
    const auto mainnet = txauthor::networkMainnet();
    const auto testnet = txauthor::networkTestnet();

    REQUIRE(txauthor::addressValidate("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2", mainnet));
    REQUIRE(txauthor::addressValidate("3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy", mainnet));
    REQUIRE(txauthor::addressValidate("mfyVgnHh5ckyiVaTibb1agi4qSC7km4XBF", testnet));
    REQUIRE(txauthor::addressValidate("2Mso5FxTvV51bcp3nzs2E9hLtL11acjHZZa", testnet));

    txauthor::AddressType type;
    bc::short_hash hash;
    REQUIRE(txauthor::addressDecode(type, hash, "16Jswqk47s9PUcyCc88MMVwzgvHPvtEpf", mainnet));
    REQUIRE(type == txauthor::AddressType::pubkeyHash);
    REQUIRE(0x01 == hash[0]);
    REQUIRE(txauthor::addressDecode(type, hash, "324FSKrQmNmxe5BJvXA6q3Mj8Gxr3ijc2q", mainnet));
    REQUIRE(type == txauthor::AddressType::scriptHash);
    REQUIRE(0x04 == hash[19]);

    SECTION("bad checksum")
    {
        auto s = txauthor::addressValidate("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN3", mainnet);
        REQUIRE(s.value() == txauthor::TXA_CC_InvalidAddress);
    }
    SECTION("not base58")
    {
        auto s = txauthor::addressValidate("not an address", mainnet);
        REQUIRE(s.value() == txauthor::TXA_CC_InvalidAddress);
        s = txauthor::addressValidate("", mainnet);
        REQUIRE(s.value() == txauthor::TXA_CC_InvalidAddress);
    }
    SECTION("wrong network")
    {
        auto s = txauthor::addressValidate("mfyVgnHh5ckyiVaTibb1agi4qSC7km4XBF", mainnet);
        REQUIRE(s.value() == txauthor::TXA_CC_UnsupportedAddressType);
        s = txauthor::addressValidate("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2", testnet);
        REQUIRE(s.value() == txauthor::TXA_CC_UnsupportedAddressType);
    }
    SECTION("unknown version byte")
    {
        auto s = txauthor::addressValidate("LKs7QqC2TVJ4y92waNrBjVZQB2oFhcmZqB", mainnet);
        REQUIRE(s.value() == txauthor::TXA_CC_UnsupportedAddressType);
    }
}

TEST_CASE("Output scripts", "[spend][address]")
{
    const auto mainnet = txauthor::networkMainnet();
    bc::script_type script;

    REQUIRE(txauthor::outputScriptForAddress(script,
            "16Jswqk47s9PUcyCc88MMVwzgvHPvtEpf", mainnet));
    REQUIRE(txauthor::base16Encode(bc::save_script(script)) ==
            "76a914010101010101010101010101010101010101010188ac");
    REQUIRE(25 == txauthor::outputScriptSize(script));

    REQUIRE(txauthor::outputScriptForAddress(script,
            "324FSKrQmNmxe5BJvXA6q3Mj8Gxr3ijc2q", mainnet));
    REQUIRE(txauthor::base16Encode(bc::save_script(script)) ==
            "a9140404040404040404040404040404040404040487");
    REQUIRE(23 == txauthor::outputScriptSize(script));

    bc::transaction_output_type output;
    REQUIRE(txauthor::makeTxOutput(output,
            "1BcktgV7EjHmxEwQDFFhhztzNqZkd5gdm", 5000, mainnet));
    REQUIRE(5000 == output.value);
    REQUIRE(25 == txauthor::outputScriptSize(output.script));

    auto s = txauthor::makeTxOutput(output,
             "1BcktgV7EjHmxEwQDFFhhztzNqZkd5gdm", -1, mainnet);
    REQUIRE(s.value() == txauthor::TXA_CC_InvalidAmount);
}

TEST_CASE("Output position randomization", "[spend]")
{
    bc::transaction_output_list outputs(3);
    outputs[0].value = 10;
    outputs[1].value = 20;
    outputs[2].value = 30;

    SECTION("swap with the front")
    {
        auto front = [](size_t &result, size_t size)
        {
            result = 0;
            return txauthor::Status();
        };
        REQUIRE(txauthor::outputRandomizePosition(outputs, 2, front));
        REQUIRE(30 == outputs[0].value);
        REQUIRE(20 == outputs[1].value);
        REQUIRE(10 == outputs[2].value);
        REQUIRE(60 == txauthor::outputsTotal(outputs));
    }
    SECTION("stay in place")
    {
        auto back = [](size_t &result, size_t size)
        {
            result = size - 1;
            return txauthor::Status();
        };
        REQUIRE(txauthor::outputRandomizePosition(outputs, 2, back));
        REQUIRE(30 == outputs[2].value);
    }
    SECTION("bad random source")
    {
        auto broken = [](size_t &result, size_t size)
        {
            result = size;
            return txauthor::Status();
        };
        REQUIRE_FALSE(txauthor::outputRandomizePosition(outputs, 2, broken));
        REQUIRE_FALSE(txauthor::outputRandomizePosition(outputs, 3,
                      txauthor::randomIndex));
    }
}
