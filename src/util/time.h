// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2019-2022 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef TCT_UTIL_TIME_H
#define TCT_UTIL_TIME_H

#include <stdint.h>
#include <string>

/** Returns the current time in seconds since the POSIX epoch. */
int64_t GetTime();
/** Returns the current time in microseconds since the POSIX epoch. */
int64_t GetTimeMicros();

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // TCT_UTIL_TIME_H
