/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../txauthor/bitcoin/Network.hpp"
#include "../txauthor/util/Status.hpp"

/**
 * State shared by every command.
 */
struct Session
{
    txauthor::NetworkParams network;
};

#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

/**
 * A sub-command of txauthor-cli.
 */
class Command
{
public:
    virtual ~Command();
    virtual txauthor::Status COMMAND_PROTO = 0;
    virtual const char *name() const = 0;
    virtual const char *help() const = 0;
};

/**
 * Adds a command to the table at static-initialization time.
 */
class CommandRegistry
{
public:
    CommandRegistry(Command *command);

    static Command *
    find(const std::string &name);

    /**
     * Writes a usage line for every command.
     */
    static void
    print();
};

/**
 * Declares and registers a command. The body follows in braces.
 */
#define COMMAND(NAME, TEXT, HELP) \
    class NAME: public Command { \
        txauthor::Status COMMAND_PROTO override; \
        const char *name() const override { return TEXT; } \
        const char *help() const override { return HELP; } \
    } implement##NAME; \
    CommandRegistry register##NAME(&implement##NAME); \
    txauthor::Status NAME::COMMAND_PROTO

std::string
helpString(const Command &command);

#endif
