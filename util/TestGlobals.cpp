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
#include "Platform.h"
#include "Hashinfo.h"
#include "TestGlobals.h"
#include "Timing.h"

seed_t g_seed = 0;

#if defined(HAVE_THREADS)
unsigned g_NCPU = 4;
#else
extern const unsigned g_NCPU = 1;
#endif

void DisableThreads( void ) {
#if defined(HAVE_THREADS)
    if (g_NCPU > 1) {
        printf("WARNING: running the rest single-threaded\n");
        g_NCPU = 1;
    }
#endif
}

const char * g_failstr = "*********FAIL*********\n";

//-----------------------------------------------------------------------------
uint32_t g_log2pValueCounts[COUNT_MAX_PVALUE + 2];
uint32_t g_testPass, g_testFail;
std::vector<std::pair<const char *, char *>> g_testFailures;

bool     g_showTestTimes;
uint64_t g_prevtime;

void recordLog2PValue( uint32_t log_pvalue ) {
    g_log2pValueCounts[(log_pvalue > COUNT_MAX_PVALUE) ? (COUNT_MAX_PVALUE + 1) : log_pvalue]++;
}

void recordTestResult( bool pass, const char * suitename, const char * testname ) {
    while ((testname != NULL) && (*testname == ' ')) {
        testname++;
    }

    if (g_showTestTimes) {
        const uint64_t now = monotonic_clock();
        printf("Elapsed: %f seconds\t[%s\t%s]\n\n", (double)(now - g_prevtime) / (double)NSEC_PER_SEC,
                suitename, (testname != NULL) ? testname : "");
        g_prevtime = now;
    }

    if (pass) {
        g_testPass++;
        return;
    }
    g_testFail++;
    g_testFailures.push_back(std::make_pair(suitename, (testname != NULL) ? strdup(testname) : (char *)NULL));
}

void recordTestResult( bool pass, const char * suitename, uint64_t testnum ) {
    char testname[24];

    snprintf(testname, sizeof(testname), "%" PRIu64, testnum);
    recordTestResult(pass, suitename, testname);
}
