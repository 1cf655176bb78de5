// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "logging.h"

#include "util/system.h"
#include "util/time.h"

#include <cassert>
#include <set>
#include <stdio.h>
#include <vector>

#include <boost/thread/mutex.hpp>
#include <boost/thread/once.hpp>
#include <boost/thread/tss.hpp>

using namespace std;

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

bool fPrintToConsole = false;
bool fPrintToDebugLog = true;

bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;
bool fLogTimeMicros = DEFAULT_LOGTIMEMICROS;
std::atomic<bool> fReopenDebugLog(false);

/**
 * fileout is opened lazily on the first line written, and the mutex guarding
 * it is allocated once and never freed, so that logging from global
 * destructors still works.
 */
static boost::once_flag debugPrintInitFlag = BOOST_ONCE_INIT;
static FILE* fileout = NULL;
static boost::mutex* mutexDebugLog = NULL;

static void DebugPrintInit()
{
    assert(mutexDebugLog == NULL);
    mutexDebugLog = new boost::mutex();
}

fs::path GetDebugLogPath()
{
    fs::path logfile(GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));
    return AbsPathForConfigVal(logfile);
}

void InitLogging()
{
    fPrintToConsole = GetBoolArg("-printtoconsole", false);
    fPrintToDebugLog = GetBoolArg("-printtodebuglog", true);
    fLogTimestamps = GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    fLogTimeMicros = GetBoolArg("-logtimemicros", DEFAULT_LOGTIMEMICROS);
    fDebug = !mapMultiArgs["-debug"].empty();
    fReopenDebugLog = true;
}

bool LogAcceptCategory(const char* category)
{
    if (category != NULL)
    {
        if (!fDebug)
            return false;

        // Give each thread quick access to -debug settings.
        // This helps prevent issues debugging global destructors,
        // where mapMultiArgs might be deleted before another
        // global destructor calls LogPrint()
        static boost::thread_specific_ptr<set<string> > ptrCategory;
        if (ptrCategory.get() == NULL)
        {
            const vector<string>& categories = mapMultiArgs["-debug"];
            ptrCategory.reset(new set<string>(categories.begin(), categories.end()));
            // thread_specific_ptr automatically deletes the set when the thread ends.
        }
        const set<string>& setCategories = *ptrCategory.get();

        // if not debugging everything and not debugging specific category, LogPrint does nothing.
        if (setCategories.count(string("")) == 0 &&
            setCategories.count(string("1")) == 0 &&
            setCategories.count(string(category)) == 0)
            return false;
    }
    return true;
}

static std::string LogTimestampStr(const std::string& str)
{
    if (!fLogTimestamps)
        return str;

    int64_t nTimeMicros = GetTimeMicros();
    std::string strStamped = DateTimeStrFormat("%Y-%m-%d %H:%M:%S", nTimeMicros/1000000);
    if (fLogTimeMicros)
        strStamped += tfm::format(".%06d", nTimeMicros%1000000);
    return strStamped + ' ' + str;
}

void LogPrintStr(const char* level, const char* category, const std::string& str)
{
    std::string strLine = LogTimestampStr(tfm::format("%5s %s: %s\n", level, category, str));

    if (fPrintToConsole)
    {
        // print to console
        fwrite(strLine.data(), 1, strLine.size(), stdout);
        fflush(stdout);
    }
    if (!fPrintToDebugLog)
        return;

    boost::call_once(&DebugPrintInit, debugPrintInitFlag);
    boost::mutex::scoped_lock scoped_lock(*mutexDebugLog);

    // reopen the log file, if requested
    if (fReopenDebugLog || fileout == NULL) {
        fReopenDebugLog = false;
        if (fileout != NULL)
            fclose(fileout);
        fileout = fsbridge::fopen(GetDebugLogPath(), "a");
        if (fileout == NULL)
            return;
        setbuf(fileout, NULL); // unbuffered
    }

    fwrite(strLine.data(), 1, strLine.size(), fileout);
}
