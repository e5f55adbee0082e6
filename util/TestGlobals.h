/*
 * HornerHash
 * Copyright (C) 2021-2023  Frank J. T. Wojcik
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see
 * <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "Platform.h"
#include "Hashinfo.h"

#include <cstdio>
#include <cinttypes>
#include <vector>
#include <utility>

//-----------------------------------------------------------------------------
// Run-wide settings, from the command line

// Seed for every check that doesn't pick its own (--seed)
extern seed_t g_seed;

// Worker threads for the threaded checks (--ncpu)
#if defined(HAVE_THREADS)
extern unsigned g_NCPU;
#else
extern const unsigned g_NCPU;
#endif

// Falls back to a single thread for the rest of the run
void DisableThreads( void );

// Printed under a suite's output when it fails
extern const char * g_failstr;

//-----------------------------------------------------------------------------
// What to print, as a bitmask tested with REPORT(VERBOSE, flags) etc.

typedef uint32_t flags_t;

enum ReportFlags : flags_t {
    FLAG_REPORT_QUIET     = 1 << 0,
    FLAG_REPORT_VERBOSE   = 1 << 1,
    FLAG_REPORT_DIAGRAMS  = 1 << 2,
    FLAG_REPORT_MORESTATS = 1 << 3,
    FLAG_REPORT_PROGRESS  = 1 << 4,
};

#define REPORT(flagname, var) (((var) & FLAG_REPORT_ ## flagname) != 0)

//-----------------------------------------------------------------------------
// Results, collected for the summary at the end of a run

// g_log2pValueCounts[i] counts statistical checks whose p-value was about
// 2**-i; the last slot collects everything past COUNT_MAX_PVALUE.
#define COUNT_MAX_PVALUE 24
extern uint32_t g_log2pValueCounts[COUNT_MAX_PVALUE + 2];

void recordLog2PValue( uint32_t log_pvalue );

extern uint32_t g_testPass, g_testFail;
// (suite, check) for each failed check; the check names are owned here
extern std::vector<std::pair<const char *, char *>> g_testFailures;

// With --time-tests, each recorded result also prints the time since
// the previous one.
extern bool     g_showTestTimes;
extern uint64_t g_prevtime;

void recordTestResult( bool pass, const char * suitename, const char * testname );
void recordTestResult( bool pass, const char * suitename, uint64_t testnum );

//-----------------------------------------------------------------------------
// Prints the dots for step cur of [min, max], such that totaldots have
// been printed once cur reaches max.
static inline void progressdots( int cur, int min, int max, int totaldots ) {
    const int64_t span  = (int64_t)max - min + 1;
    const int64_t done  = (int64_t)(cur - min) * totaldots / span;
    const int64_t after = (int64_t)(cur - min + 1) * totaldots / span;

    for (int64_t i = done; i < after; i++) {
        putchar('.');
    }
}
