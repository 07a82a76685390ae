// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_UTIL_TIME_H
#define GOVCHAIN_UTIL_TIME_H

#include <stdint.h>
#include <string>

/**
 * GetTimeMicros() and GetTimeMillis() both return the system time, but in
 * different units. GetTime() returns the system time in seconds, but also
 * supports mocktime, where the time can be specified by the user, eg for
 * testing (eg with the -mocktime command line argument).
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();

/** For testing. Set e.g. with the -mocktime command line argument */
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

/** ISO 8601 formatting of a unix timestamp in UTC. */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // GOVCHAIN_UTIL_TIME_H
