// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2020 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef TCT_LOGGING_H
#define TCT_LOGGING_H

#include "fs.h"

#include <atomic>
#include <string>

#include <tinyformat.h>

static const bool DEFAULT_LOGTIMEMICROS = false;
static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;

extern bool fLogTimestamps;
extern bool fLogTimeMicros;
extern std::atomic<bool> fReopenDebugLog;

/** Read the logging flags (-debug, -printtoconsole, -logtimestamps, ...) from mapArgs. */
void InitLogging();

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

/** Send a single formatted line to the console and/or debug.log. */
void LogPrintStr(const char* level, const char* category, const std::string& str);

/** Print to debug.log with level INFO and category "main". */
#define LogPrintf(...) LogPrintInner("info", "main", __VA_ARGS__)

/** Print to debug.log with level DEBUG. */
#define LogPrint(category, ...) LogPrintInner("debug", category, __VA_ARGS__)

#define LogPrintInner(level, category, ...) do {           \
    if (level[0] == 'd' && !LogAcceptCategory(category)) { \
        break;                                             \
    }                                                      \
    std::string T_MSG = tfm::format(__VA_ARGS__);          \
    if (!T_MSG.empty() && T_MSG[T_MSG.size()-1] == '\n') { \
        T_MSG.erase(T_MSG.size()-1);                       \
    }                                                      \
    LogPrintStr(level, category, T_MSG);                   \
} while(0)

#define LogError(category, ...) ([&]() {          \
    std::string T_MSG = tfm::format(__VA_ARGS__); \
    LogPrintStr("error", category, T_MSG);        \
    return false;                                 \
}())

fs::path GetDebugLogPath();

#endif // TCT_LOGGING_H
