/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Request.hpp"
#include "../txauthor/bitcoin/Utility.hpp"
#include "../txauthor/json/JsonArray.hpp"
#include "../txauthor/json/JsonObject.hpp"

using namespace txauthor;

struct InputJson:
    public JsonObject
{
    TXA_JSON_CONSTRUCTORS(InputJson, JsonObject)
    TXA_JSON_STRING(txid, "txid", nullptr)
    TXA_JSON_INTEGER(index, "index", 0)
    TXA_JSON_INTEGER(value, "value", 0)
    TXA_JSON_STRING(sigScript, "sigScript", "p2pkh")
};

struct DestinationJson:
    public JsonObject
{
    TXA_JSON_CONSTRUCTORS(DestinationJson, JsonObject)
    TXA_JSON_STRING(address, "address", nullptr)
    TXA_JSON_INTEGER(amount, "amount", 0)
    TXA_JSON_BOOLEAN(sendMax, "sendMax", false)
};

struct RequestJson:
    public JsonObject
{
    TXA_JSON_CONSTRUCTORS(RequestJson, JsonObject)
    TXA_JSON_VALUE(inputs, "inputs", JsonArray)
    TXA_JSON_VALUE(destinations, "destinations", JsonArray)
    TXA_JSON_VALUE(change, "change", JsonArray)
    TXA_JSON_VALUE(changePool, "changePool", JsonArray)
    TXA_JSON_INTEGER(feeRate, "feeRate", 0)
    TXA_JSON_INTEGER(account, "account", 0)
};

static Status
inputDecode(SelectedInput &result, InputJson json)
{
    TXA_CHECK(json.txidOk());
    TXA_CHECK(json.valueOk());
    if (json.value() < 0)
        return TXA_ERROR(TXA_CC_InvalidAmount, "Negative input value");
    if (json.index() < 0 || 0xffffffff < json.index())
        return TXA_ERROR(TXA_CC_JSONError, "Bad input index");

    SelectedInput out;
    TXA_CHECK(txidDecode(out.point.hash, json.txid()));
    out.point.index = json.index();
    out.value = json.value();

    const std::string sigScript = json.sigScript();
    if ("p2pkh" == sigScript)
        out.sigScriptSize = redeemP2pkhSigScriptSize;
    else if ("p2pkh-uncompressed" == sigScript)
        out.sigScriptSize = redeemP2pkhUncompressedSigScriptSize;
    else
        return TXA_ERROR(TXA_CC_JSONError, "Unknown sigScript " + sigScript);

    result = out;
    return Status();
}

static Status
destinationsDecode(DestinationList &result, JsonArray array)
{
    DestinationList out;
    for (size_t i = 0; i < array.size(); ++i)
    {
        DestinationJson json(array[i]);
        TXA_CHECK(json.addressOk());

        TransactionDestination destination;
        destination.address = json.address();
        destination.amount = json.amount();
        destination.sendMax = json.sendMax();
        out.push_back(destination);
    }

    result = out;
    return Status();
}

Status
requestLoad(Request &result, const std::string &path)
{
    RequestJson json;
    TXA_CHECK(json.load(path));

    Request out;
    auto inputs = json.inputs();
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        SelectedInput input;
        TXA_CHECK(inputDecode(input, inputs[i]));
        out.inputs.push_back(input);
    }
    TXA_CHECK(destinationsDecode(out.destinations, json.destinations()));
    TXA_CHECK(destinationsDecode(out.change, json.change()));

    TXA_CHECK(json.changePool().strings(out.changePool));

    if (json.feeRateOk())
    {
        out.hasFeeRate = true;
        out.feeRatePerKb = json.feeRate();
    }
    if (json.account() < 0 || 0xffffffff < json.account())
        return TXA_ERROR(TXA_CC_JSONError, "Bad account number");
    out.account = json.account();

    result = out;
    return Status();
}

Status
requestApply(TxAuthor &author, const Request &request)
{
    for (const auto &input: request.inputs)
        TXA_CHECK(author.inputAdd(input));

    for (const auto &destination: request.destinations)
    {
        if (destination.sendMax)
            TXA_CHECK(author.destinationAddMax(destination.address));
        else
            TXA_CHECK(author.destinationAdd(destination.address,
                                            destination.amount));
    }

    for (const auto &destination: request.change)
    {
        if (destination.sendMax)
            return TXA_ERROR(TXA_CC_InvalidAmount,
                             "Change destinations cannot receive the maximum amount");
        TXA_CHECK(author.changeAdd(destination.address, destination.amount));
    }

    if (request.hasFeeRate)
        TXA_CHECK(author.feeRateSet(request.feeRatePerKb));
    TXA_CHECK(author.accountSet(request.account));

    return Status();
}
