/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../txauthor/json/JsonObject.hpp"
#include "../txauthor/util/Debug.hpp"
#include "../txauthor/util/FileIO.hpp"
#include <iostream>
#include <stdlib.h>
#include <getopt.h>

using namespace txauthor;

/**
 * Defaults read from ~/.config/txauthor/txauthor.conf.
 */
struct ConfigJson:
    public JsonObject
{
    TXA_JSON_STRING(network, "network", "mainnet")
    TXA_JSON_STRING(logFile, "logFile", nullptr)
};

struct Options
{
    std::string network;
    bool wantHelp = false;
};

static std::string
configPath()
{
    const char *home = getenv("HOME");
    return std::string(home && *home ? home : "") +
        "/.config/txauthor/txauthor.conf";
}

/**
 * Consumes the leading options, leaving optind at the command name.
 */
static Status
optionsParse(Options &result, int argc, char *argv[])
{
    static const struct option longOptions[] =
    {
        {"network", required_argument, nullptr, 'n'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+hn:", longOptions, nullptr)))
    {
        switch (c)
        {
        case 'h':
            result.wantHelp = true;
            break;
        case 'n':
            result.network = optarg;
            break;
        case '?':
            if ('n' == optopt)
                return TXA_ERROR(TXA_CC_Error, "--network needs a name or file");
            return TXA_ERROR(TXA_CC_Error, "Unknown option " +
                             std::string(argv[optind - 1]));
        default:
            return TXA_ERROR(TXA_CC_Error, "Cannot parse options");
        }
    }
    return Status();
}

/**
 * Accepts a preset name, or the path to a network parameter file.
 */
static Status
networkSelect(NetworkParams &result, const std::string &network)
{
    if (fileExists(network))
        return networkLoad(result, network);
    return networkByName(result, network);
}

static Status
run(int argc, char *argv[])
{
    ConfigJson config;
    const auto path = configPath();
    if (fileExists(path))
        TXA_CHECK(config.load(path));

    Options options;
    options.network = config.network();
    TXA_CHECK(optionsParse(options, argc, argv));
    argc -= optind;
    argv += optind;

    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }
    Command *command = CommandRegistry::find(argv[0]);
    if (!command)
        return TXA_ERROR(TXA_CC_Error, "unknown command " + std::string(argv[0]));
    if (options.wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    if (config.logFileOk())
        TXA_CHECK(debugInitialize(config.logFile()));

    Session session;
    TXA_CHECK(networkSelect(session.network, options.network));
    TXA_DebugLog("%s on %s", command->name(), session.network.name.c_str());

    Status s = (*command)(session, argc - 1, argv + 1);
    s.log();
    debugTerminate();
    return s;
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
