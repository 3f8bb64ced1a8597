/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <mutex>
#include <vector>

namespace txauthor {

#define MAX_LOG_SIZE (1 << 19) // 512 KiB

// Guards everything below:
static std::mutex gLogMutex;
static FILE *gLogFile = nullptr;
static std::string gLogPath;

/**
 * Moves the current log to the ".prev" slot and starts a fresh one.
 * The caller must hold gLogMutex.
 */
static Status
logRotate()
{
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;

    const auto oldPath = gLogPath + ".prev";
    if (fileExists(gLogPath) && rename(gLogPath.c_str(), oldPath.c_str()))
        return TXA_ERROR(TXA_CC_SysError, "Cannot move " + gLogPath);

    gLogFile = fopen(gLogPath.c_str(), "w");
    if (!gLogFile)
        return TXA_ERROR(TXA_CC_SysError, "Cannot open " + gLogPath);
    return Status();
}

Status
debugInitialize(const std::string &path)
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    gLogPath = path;
    return logRotate();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

static std::string
logTimestamp()
{
    time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);

    char out[32];
    strftime(out, sizeof(out), "%Y-%m-%d %H:%M:%S", &utc);
    return out;
}

void
logInfo(const std::string &message)
{
    std::string line = logTimestamp() + " TXA_Log: " + message;
    if (line.empty() || '\n' != line[line.size() - 1])
        line += '\n';

#ifdef DEBUG
    fputs(line.c_str(), stdout);
#endif

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (!gLogFile)
        return;

    // A failed rotation leaves gLogFile null, which stops logging:
    if (MAX_LOG_SIZE < ftell(gLogFile) && !logRotate())
        return;

    fputs(line.c_str(), gLogFile);
    fflush(gLogFile);
}

void TXA_DebugLog(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    int size = vsnprintf(nullptr, 0, format, args);
    va_end(args);
    if (size < 0)
        return;

    std::vector<char> message(size + 1);
    va_start(args, format);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    logInfo(message.data());
}

} // namespace txauthor
