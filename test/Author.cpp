/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txauthor/bitcoin/Utility.hpp"
#include "../txauthor/spend/Author.hpp"
#include "../txauthor/spend/Fees.hpp"
#include "../txauthor/spend/Outputs.hpp"
#include <catch.hpp>
#include <memory>
#include <random>
#include <set>

using namespace txauthor;

#define PAYMENT_ADDRESS "1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2"
#define CHANGE_ADDRESS "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa"
#define CHANGE_ADDRESS_2 "1BcktgV7EjHmxEwQDFFhhztzNqZkd5gdm"

/**
 * Hands out a fixed address and remembers how it was asked.
 */
class CountingSource:
    public ChangeSource
{
public:
    Status
    newChangeAddress(std::string &result, uint32_t account) override
    {
        ++calls;
        lastAccount = account;
        result = CHANGE_ADDRESS;
        return Status();
    }

    int calls = 0;
    uint32_t lastAccount = 0;
};

static SelectedInput
makeInput(uint64_t value, uint32_t index=0)
{
    SelectedInput out;
    out.point.hash.fill(0x11);
    out.point.index = index;
    out.value = value;
    return out;
}

static TransactionDestination
destination(const std::string &address, int64_t amount, bool sendMax=false)
{
    TransactionDestination out;
    out.address = address;
    out.amount = amount;
    out.sendMax = sendMax;
    return out;
}

static Status
alwaysFront(size_t &result, size_t size)
{
    result = 0;
    return Status();
}

static Status
alwaysBack(size_t &result, size_t size)
{
    result = size - 1;
    return Status();
}

static bool
paysTo(const bc::transaction_output_type &output, const std::string &address)
{
    bc::script_type script;
    REQUIRE(outputScriptForAddress(script, address, networkMainnet()));
    return bc::save_script(output.script) == bc::save_script(script);
}

TEST_CASE("Payment with change", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    const InputList inputs{makeInput(100000000)};
    const DestinationList send{destination(PAYMENT_ADDRESS, 50000000)};
    REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                     mainnet, 1000, alwaysBack));

    REQUIRE(1 == source.calls);
    REQUIRE(100000000 == authored.totalInput);
    REQUIRE(227 == authored.estimatedSignedSize);
    REQUIRE(227 == authored.fee());
    REQUIRE(authored.fee() ==
            uint64_t(minerFee(authored.estimatedSignedSize, 1000, mainnet)));

    const auto &outputs = authored.tx.outputs;
    REQUIRE(2 == outputs.size());
    REQUIRE(50000000 == outputs[0].value);
    REQUIRE(paysTo(outputs[0], PAYMENT_ADDRESS));
    REQUIRE(49999773 == outputs[1].value);
    REQUIRE(paysTo(outputs[1], CHANGE_ADDRESS));
    REQUIRE(outputsTotal(outputs) + authored.fee() == authored.totalInput);

    // Protocol constants:
    REQUIRE(1 == authored.tx.version);
    REQUIRE(0 == authored.tx.locktime);
    REQUIRE(1 == authored.tx.inputs.size());
    REQUIRE(0xffffffff == authored.tx.inputs[0].sequence);

    // Unsigned inputs carry empty scripts:
    REQUIRE(119 == txSerialize(authored.tx).size());
}

TEST_CASE("Send everything to one address", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    const InputList inputs{makeInput(100000000)};
    const DestinationList send{destination(PAYMENT_ADDRESS, 0, true)};
    REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                     mainnet, 1000, alwaysBack));

    REQUIRE(0 == source.calls);
    REQUIRE(193 == authored.estimatedSignedSize);
    REQUIRE(193 == authored.fee());

    const auto &outputs = authored.tx.outputs;
    REQUIRE(1 == outputs.size());
    REQUIRE(99999807 == outputs[0].value);
    REQUIRE(paysTo(outputs[0], PAYMENT_ADDRESS));
}

TEST_CASE("Dust change goes to the miners", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    SECTION("default fee rate")
    {
        // 273 left over is below the 546 threshold:
        const InputList inputs{makeInput(100000)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 99500)};
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 1000, alwaysBack));

        REQUIRE(1 == authored.tx.outputs.size());
        REQUIRE(99500 == authored.tx.outputs[0].value);
        REQUIRE(193 == authored.estimatedSignedSize);
        REQUIRE(500 == authored.fee());
    }
    SECTION("small payment")
    {
        // 1000 in, 900 out leaves 54 after a 46 fee, which is dust:
        const InputList inputs{makeInput(1000)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 900)};
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 200, alwaysBack));

        REQUIRE(1 == authored.tx.outputs.size());
        REQUIRE(900 == authored.tx.outputs[0].value);
        REQUIRE(1000 - 900 == authored.fee());
        REQUIRE(193 == authored.estimatedSignedSize);
    }
    SECTION("exact payment")
    {
        const InputList inputs{makeInput(50227)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 50000)};
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 1000, alwaysBack));

        REQUIRE(1 == authored.tx.outputs.size());
        REQUIRE(227 == authored.fee());
        REQUIRE(193 == authored.estimatedSignedSize);
    }
    SECTION("max recipient gets nothing")
    {
        const InputList inputs{makeInput(700)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 0, true)};
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 1000, alwaysBack));

        REQUIRE(authored.tx.outputs.empty());
        REQUIRE(700 == authored.fee());
    }
}

TEST_CASE("Authoring failures", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;
    const InputList inputs{makeInput(100000000)};

    SECTION("insufficient funds")
    {
        const InputList small{makeInput(1000)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 900)};
        auto s = authorTx(authored, small, send, DestinationList(), 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InsufficientFunds);
        REQUIRE(std::string::npos != s.message().find("127"));
    }
    SECTION("no inputs")
    {
        const DestinationList send{destination(PAYMENT_ADDRESS, 900)};
        auto s = authorTx(authored, InputList(), send, DestinationList(), 0,
                          source, mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InsufficientFunds);
    }
    SECTION("zero amount")
    {
        const DestinationList send{destination(PAYMENT_ADDRESS, 0)};
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("two max recipients")
    {
        const DestinationList send{
            destination(PAYMENT_ADDRESS, 0, true),
            destination(CHANGE_ADDRESS, 0, true)
        };
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_MultipleMaxAmountRecipients);
    }
    SECTION("max recipient with explicit change")
    {
        const DestinationList send{destination(PAYMENT_ADDRESS, 0, true)};
        const DestinationList change{destination(CHANGE_ADDRESS, 1000)};
        auto s = authorTx(authored, inputs, send, change, 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_ConflictingChangeSpecification);
        REQUIRE(0 == source.calls);
    }
    SECTION("change source fails")
    {
        AddressPool empty(std::vector<std::string>{});
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, empty,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_ChangeAddressGenerationFailed);
        REQUIRE(std::string::npos != s.message().find("pool is empty"));
    }
    SECTION("negative fee rate")
    {
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, source,
                          mainnet, -1, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("change script too large")
    {
        auto tiny = mainnet;
        tiny.maxScriptElementSize = 20;
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, source,
                          tiny, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_ScriptTooLarge);
    }
    SECTION("input above the maximum amount")
    {
        const InputList huge{makeInput(mainnet.maxAmount + 1)};
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, huge, send, DestinationList(), 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
        REQUIRE(0 == source.calls);
    }
    SECTION("inputs that would wrap around")
    {
        const InputList wrapping{
            makeInput(1ull << 63, 0),
            makeInput(1ull << 63, 1),
            makeInput(100000000, 2)
        };
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, wrapping, send, DestinationList(), 0,
                          source, mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("inputs whose total is above the maximum amount")
    {
        const InputList many{
            makeInput(mainnet.maxAmount, 0),
            makeInput(1, 1)
        };
        const DestinationList send{destination(PAYMENT_ADDRESS, 0, true)};
        auto s = authorTx(authored, many, send, DestinationList(), 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("random source fails")
    {
        auto broken = [](size_t &result, size_t size)
        {
            return TXA_ERROR(TXA_CC_SysError, "No entropy");
        };
        const DestinationList send{destination(PAYMENT_ADDRESS, 1000)};
        auto s = authorTx(authored, inputs, send, DestinationList(), 0, source,
                          mainnet, 1000, broken);
        REQUIRE(s.value() == TXA_CC_SysError);
    }
}

TEST_CASE("Explicit change destinations", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    const InputList inputs{makeInput(100000000)};
    const DestinationList send{destination(PAYMENT_ADDRESS, 50000000)};

    SECTION("partial allocation")
    {
        const DestinationList change{
            destination(CHANGE_ADDRESS, 10000000),
            destination(CHANGE_ADDRESS_2, 20000000)
        };
        REQUIRE(authorTx(authored, inputs, send, change, 0, source,
                         mainnet, 1000, alwaysBack));

        REQUIRE(0 == source.calls);
        REQUIRE(252 == authored.estimatedSignedSize);

        const auto &outputs = authored.tx.outputs;
        REQUIRE(3 == outputs.size());
        REQUIRE(50000000 == outputs[0].value);
        REQUIRE(10000000 == outputs[1].value);
        REQUIRE(paysTo(outputs[1], CHANGE_ADDRESS));
        REQUIRE(20000000 == outputs[2].value);
        REQUIRE(paysTo(outputs[2], CHANGE_ADDRESS_2));

        // The unallocated change goes to the miners:
        REQUIRE(20000000 == authored.fee());
    }
    SECTION("allocation exceeds the change")
    {
        const DestinationList change{
            destination(CHANGE_ADDRESS, 30000000),
            destination(CHANGE_ADDRESS_2, 30000000)
        };
        auto s = authorTx(authored, inputs, send, change, 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_ChangeAllocationExceedsAvailable);
    }
    SECTION("zero change amount")
    {
        const DestinationList change{destination(CHANGE_ADDRESS, 0)};
        auto s = authorTx(authored, inputs, send, change, 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("dust change amount")
    {
        const DestinationList change{destination(CHANGE_ADDRESS, 1)};
        auto s = authorTx(authored, inputs, send, change, 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
        REQUIRE(std::string::npos != s.message().find("dust"));
    }
    SECTION("one of several is dust")
    {
        const DestinationList change{
            destination(CHANGE_ADDRESS, 10000000),
            destination(CHANGE_ADDRESS_2, 545)
        };
        auto s = authorTx(authored, inputs, send, change, 0, source,
                          mainnet, 1000, alwaysBack);
        REQUIRE(s.value() == TXA_CC_InvalidAmount);
    }
    SECTION("smallest amount that is not dust")
    {
        const DestinationList change{destination(CHANGE_ADDRESS, 546)};
        REQUIRE(authorTx(authored, inputs, send, change, 0, source,
                         mainnet, 1000, alwaysBack));
        REQUIRE(2 == authored.tx.outputs.size());
        REQUIRE(546 == authored.tx.outputs[1].value);
    }
}

TEST_CASE("Change position", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    const InputList inputs{makeInput(100000000)};
    const DestinationList send{destination(PAYMENT_ADDRESS, 50000000)};

    SECTION("moved to the front")
    {
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 1000, alwaysFront));
        REQUIRE(paysTo(authored.tx.outputs[0], CHANGE_ADDRESS));
        REQUIRE(paysTo(authored.tx.outputs[1], PAYMENT_ADDRESS));
    }
    SECTION("each change output is placed independently")
    {
        const DestinationList change{
            destination(CHANGE_ADDRESS, 10000000),
            destination(CHANGE_ADDRESS_2, 20000000)
        };
        REQUIRE(authorTx(authored, inputs, send, change, 0, source,
                         mainnet, 1000, alwaysFront));
        REQUIRE(paysTo(authored.tx.outputs[0], CHANGE_ADDRESS_2));
        REQUIRE(paysTo(authored.tx.outputs[1], PAYMENT_ADDRESS));
        REQUIRE(paysTo(authored.tx.outputs[2], CHANGE_ADDRESS));
    }
    SECTION("seeded source is repeatable")
    {
        const DestinationList many{
            destination(PAYMENT_ADDRESS, 1000000),
            destination(CHANGE_ADDRESS_2, 2000000),
            destination(PAYMENT_ADDRESS, 3000000)
        };
        auto seeded = [](unsigned seed) -> RandomIndex
        {
            auto engine = std::make_shared<std::mt19937>(seed);
            return [engine](size_t &result, size_t size)
            {
                result = (*engine)() % size;
                return Status();
            };
        };

        AuthoredTx first, second;
        REQUIRE(authorTx(first, inputs, many, DestinationList(), 0, source,
                         mainnet, 1000, seeded(7)));
        REQUIRE(authorTx(second, inputs, many, DestinationList(), 0, source,
                         mainnet, 1000, seeded(7)));

        REQUIRE(4 == first.tx.outputs.size());
        for (size_t i = 0; i < first.tx.outputs.size(); ++i)
            REQUIRE(first.tx.outputs[i].value == second.tx.outputs[i].value);
        REQUIRE(first.fee() == second.fee());
    }
}

TEST_CASE("Change lands at varying positions", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;

    const InputList inputs{makeInput(100000000)};
    const DestinationList send{
        destination(PAYMENT_ADDRESS, 1000000),
        destination(CHANGE_ADDRESS_2, 2000000),
        destination(PAYMENT_ADDRESS, 3000000)
    };

    auto engine = std::make_shared<std::mt19937>(1234);
    const RandomIndex random = [engine](size_t &result, size_t size)
    {
        result = (*engine)() % size;
        return Status();
    };

    std::set<size_t> positions;
    for (int i = 0; i < 64; ++i)
    {
        AuthoredTx authored;
        REQUIRE(authorTx(authored, inputs, send, DestinationList(), 0, source,
                         mainnet, 1000, random));
        REQUIRE(4 == authored.tx.outputs.size());

        size_t changeCount = 0;
        for (size_t j = 0; j < authored.tx.outputs.size(); ++j)
        {
            if (paysTo(authored.tx.outputs[j], CHANGE_ADDRESS))
            {
                positions.insert(j);
                ++changeCount;
            }
        }
        REQUIRE(1 == changeCount);
    }
    REQUIRE(1 < positions.size());
}

TEST_CASE("Inputs pass through unchanged", "[spend][author]")
{
    const auto mainnet = networkMainnet();
    CountingSource source;
    AuthoredTx authored;

    auto uncompressed = makeInput(30000, 7);
    uncompressed.sigScriptSize = redeemP2pkhUncompressedSigScriptSize;
    const InputList inputs{makeInput(20000, 3), uncompressed};
    const DestinationList send{destination(PAYMENT_ADDRESS, 10000)};
    REQUIRE(authorTx(authored, inputs, send, DestinationList(), 4, source,
                     mainnet, 1000, alwaysBack));

    REQUIRE(4 == source.lastAccount);
    REQUIRE(50000 == authored.totalInput);
    REQUIRE(2 == authored.tx.inputs.size());
    REQUIRE(3 == authored.tx.inputs[0].previous_output.index);
    REQUIRE(7 == authored.tx.inputs[1].previous_output.index);

    // 10 + 149 + 181 + 34 + 34:
    REQUIRE(408 == authored.estimatedSignedSize);
    REQUIRE(408 == authored.fee());
}
