// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2020 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_LOGGING_H
#define SHIELDPOOL_LOGGING_H

#include "fs.h"
#include "tinyformat.h"

#include <atomic>
#include <string>

static const bool DEFAULT_LOGTIMEMICROS = false;
static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;

extern bool fLogTimestamps;
extern bool fLogTimeMicros;
extern std::atomic<bool> fReopenDebugLog;

/** Returns the filtering directive set by the -debug flags. */
std::string LogConfigFilter();

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

/** Send a string to the log output */
int LogPrintStr(const std::string& str);

/** Print to debug.log with level INFO and category "main". */
#define LogPrintf(...) LogPrintInner("info", "main", __VA_ARGS__)

/** Print to debug.log with level DEBUG. */
#define LogPrint(category, ...) do {                   \
    if (LogAcceptCategory(category)) {                 \
        LogPrintInner("debug", category, __VA_ARGS__); \
    }                                                  \
} while(0)

#define LogPrintInner(level, category, ...) do {           \
    std::string T_MSG = tfm::format(__VA_ARGS__);          \
    if (!T_MSG.empty() && T_MSG[T_MSG.size()-1] == '\n') { \
        T_MSG.erase(T_MSG.size()-1);                       \
    }                                                      \
    LogPrintStr(tfm::format("%5s %s: %s\n", level, category, T_MSG)); \
} while(0)

#define LogError(category, ...) ([&]() {          \
    std::string T_MSG = tfm::format(__VA_ARGS__); \
    LogPrintStr(tfm::format("ERROR %s: %s\n", category, T_MSG)); \
    return false;                                 \
}())

fs::path GetDebugLogPath();
/** Open the debug log, flushing any lines buffered before it existed. */
void OpenDebugLog();
/** Close the debug log and return to buffering. Used by the test harness. */
void CloseDebugLog();
void ShrinkDebugFile();

#endif // SHIELDPOOL_LOGGING_H
