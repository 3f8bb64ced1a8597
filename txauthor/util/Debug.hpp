/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXAUTHOR_UTIL_DEBUG_HPP
#define TXAUTHOR_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define TXA_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        TXA_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace txauthor {

/**
 * Opens the log file, moving any previous log out of the way.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

/**
 * Writes a line to the log.
 */
void
logInfo(const std::string &message);

void TXA_DebugLog(const char *format, ...);

} // namespace txauthor

#endif
