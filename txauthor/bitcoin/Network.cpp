/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Network.hpp"
#include "../json/JsonObject.hpp"

namespace txauthor {

#define MAX_MONEY (21000000 * INT64_C(100000000))
#define DEFAULT_RELAY_FEE_PER_KB 1000
#define DUST_FACTOR 3
#define DUST_SPEND_INPUT_SIZE 148 // 32 + 4 + 1 + 107 + 4
#define MAX_SCRIPT_ELEMENT_SIZE 520

struct NetworkJson:
    public JsonObject
{
    TXA_JSON_STRING(name, "name", "custom")
    TXA_JSON_INTEGER(pubkeyVersion, "pubkeyVersion", 0x00)
    TXA_JSON_INTEGER(scriptVersion, "scriptVersion", 0x05)
    TXA_JSON_INTEGER(maxAmount, "maxAmount", MAX_MONEY)
    TXA_JSON_INTEGER(relayFeePerKb, "relayFeePerKb", DEFAULT_RELAY_FEE_PER_KB)
    TXA_JSON_INTEGER(dustFactor, "dustFactor", DUST_FACTOR)
    TXA_JSON_INTEGER(dustSpendInputSize, "dustSpendInputSize", DUST_SPEND_INPUT_SIZE)
    TXA_JSON_INTEGER(maxScriptElementSize, "maxScriptElementSize", MAX_SCRIPT_ELEMENT_SIZE)
};

NetworkParams
networkMainnet()
{
    NetworkParams out;
    out.name = "mainnet";
    out.pubkeyVersion = 0x00;
    out.scriptVersion = 0x05;
    out.maxAmount = MAX_MONEY;
    out.relayFeePerKb = DEFAULT_RELAY_FEE_PER_KB;
    out.dustFactor = DUST_FACTOR;
    out.dustSpendInputSize = DUST_SPEND_INPUT_SIZE;
    out.maxScriptElementSize = MAX_SCRIPT_ELEMENT_SIZE;
    return out;
}

NetworkParams
networkTestnet()
{
    NetworkParams out = networkMainnet();
    out.name = "testnet";
    out.pubkeyVersion = 0x6f;
    out.scriptVersion = 0xc4;
    return out;
}

Status
networkByName(NetworkParams &result, const std::string &name)
{
    if (name == "mainnet")
        result = networkMainnet();
    else if (name == "testnet")
        result = networkTestnet();
    else
        return TXA_ERROR(TXA_CC_Error, "Unknown network " + name);
    return Status();
}

static Status
versionByte(uint8_t &result, json_int_t value, const char *key)
{
    if (value < 0 || 0xff < value)
        return TXA_ERROR(TXA_CC_JSONError,
                         std::string(key) + " must fit in one byte");
    result = static_cast<uint8_t>(value);
    return Status();
}

static Status
networkFromJson(NetworkParams &result, const NetworkJson &json)
{
    NetworkParams out;
    out.name = json.name();
    TXA_CHECK(versionByte(out.pubkeyVersion, json.pubkeyVersion(), "pubkeyVersion"));
    TXA_CHECK(versionByte(out.scriptVersion, json.scriptVersion(), "scriptVersion"));

    if (json.maxAmount() <= 0)
        return TXA_ERROR(TXA_CC_JSONError, "maxAmount must be positive");
    if (json.relayFeePerKb() < 0)
        return TXA_ERROR(TXA_CC_JSONError, "relayFeePerKb must not be negative");
    if (json.dustFactor() < 1)
        return TXA_ERROR(TXA_CC_JSONError, "dustFactor must be at least 1");
    if (json.dustSpendInputSize() < 0)
        return TXA_ERROR(TXA_CC_JSONError, "dustSpendInputSize must not be negative");
    if (json.maxScriptElementSize() <= 0)
        return TXA_ERROR(TXA_CC_JSONError, "maxScriptElementSize must be positive");

    out.maxAmount = json.maxAmount();
    out.relayFeePerKb = json.relayFeePerKb();
    out.dustFactor = json.dustFactor();
    out.dustSpendInputSize = json.dustSpendInputSize();
    out.maxScriptElementSize = json.maxScriptElementSize();

    result = std::move(out);
    return Status();
}

Status
networkDecode(NetworkParams &result, const std::string &json)
{
    NetworkJson networkJson;
    TXA_CHECK(networkJson.decode(json));
    if (!json_is_object(networkJson.get()))
        return TXA_ERROR(TXA_CC_JSONError, "Network parameters must be an object");
    return networkFromJson(result, networkJson);
}

Status
networkLoad(NetworkParams &result, const std::string &path)
{
    NetworkJson networkJson;
    TXA_CHECK(networkJson.load(path));
    if (!json_is_object(networkJson.get()))
        return TXA_ERROR(TXA_CC_JSONError, path + " must hold an object");
    return networkFromJson(result, networkJson);
}

} // namespace txauthor
