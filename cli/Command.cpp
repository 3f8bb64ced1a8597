/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iostream>
#include <map>

typedef std::map<std::string, Command *> CommandMap;

/**
 * The table lives in a function so it exists before
 * the first registration runs.
 */
static CommandMap &
commandMap()
{
    static CommandMap map;
    return map;
}

Command::~Command()
{
}

CommandRegistry::CommandRegistry(Command *command)
{
    auto inserted = commandMap().insert(std::make_pair(command->name(), command));
    if (!inserted.second)
        std::cerr << "warning: Duplicate command " << command->name() << std::endl;
}

Command *
CommandRegistry::find(const std::string &name)
{
    auto i = commandMap().find(name);
    return commandMap().end() == i ? nullptr : i->second;
}

void
CommandRegistry::print()
{
    std::cout << "commands:" << std::endl;
    for (const auto &i: commandMap())
        std::cout << "  " << i.first << i.second->help() << std::endl;
}

std::string
helpString(const Command &command)
{
    return std::string("usage: txauthor-cli [--network <name|file>] ") +
        command.name() + command.help();
}
