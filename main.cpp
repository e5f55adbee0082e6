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
#include "Timing.h"
#include "Hashlib.h"
#include "TestGlobals.h"
#include "Random.h"

#include "SanityTest.h"
#include "ChunkingTest.h"
#include "BoundaryTest.h"
#include "SeedAvalancheTest.h"
#include "DistributionTest.h"
#include "SpeedTest.h"
#include "HashMapTest.h"

#include <cstdio>
#include <cinttypes>
#include <cerrno>
#include <cctype>

#if !defined(VERSION)
  #define VERSION "unknown"
#endif

//-----------------------------------------------------------------------------
// Run options

static bool g_forceSummary   = false;
static bool g_exitOnFailure  = false;
static bool g_exitCodeResult = false;
static bool g_testExtra      = false; // More reps, more lengths

// One entry per --test= name. "All" selects every entry whose inAll is
// set. VerifyAll and SanityAll run across every registered hash and
// replace the per-hash run.
enum TestId {
    TEST_VERIFYALL, TEST_SANITYALL, TEST_SANITY, TEST_CHUNKING, TEST_BOUNDARY,
    TEST_SEEDAVALANCHE, TEST_DISTRIBUTION, TEST_SPEED, TEST_HASHMAP, TEST_COUNT
};

struct TestSelection {
    const char *  name;
    bool          inAll;
    bool          enabled;
};

static TestSelection g_tests[TEST_COUNT] = {
    { "VerifyAll",     false, false },
    { "SanityAll",     false, false },
    { "Sanity",        true,  true  },
    { "Chunking",      true,  true  },
    { "Boundary",      true,  true  },
    { "SeedAvalanche", true,  true  },
    { "Distribution",  true,  true  },
    { "Speed",         true,  true  },
    { "Hashmap",       true,  true  },
};

#define RUNNING(id) (g_tests[TEST_ ## id].enabled)

static bool allSelected( void ) {
    for (int i = 0; i < TEST_COUNT; i++) {
        if (g_tests[i].inAll && !g_tests[i].enabled) {
            return false;
        }
    }
    return true;
}

static void printTestNames( const char * sep ) {
    printf("All");
    for (int i = 0; i < TEST_COUNT; i++) {
        printf("%s%s", sep, g_tests[i].name);
    }
    printf("\n");
}

// A comma-separated list of names or unambiguous prefixes of them, in
// any case. "All" stands for every test it covers.
static void selectTests( const char * list, bool enable ) {
    const char * optname = enable ? "--test" : "--notest";

    while (*list != '\0') {
        const size_t len   = strcspn(list, ",");
        int          found = -1, matches = 0;

        if ((len > 0) && (strncasecmp(list, "All", len) == 0)) {
            for (int i = 0; i < TEST_COUNT; i++) {
                if (g_tests[i].inAll) { g_tests[i].enabled = enable; }
            }
            found = TEST_COUNT;
            matches = 1;
        }
        for (int i = 0; (found != TEST_COUNT) && (i < TEST_COUNT); i++) {
            if ((len == 0) || (strncasecmp(list, g_tests[i].name, len) != 0)) {
                continue;
            }
            if (g_tests[i].name[len] == '\0') {
                found = i; matches = 1;
                break;
            }
            found = i; matches++;
        }

        if (matches != 1) {
            printf("%s test name: %s=%.*s\nValid tests: ",
                    (matches == 0) ? "Invalid" : "Ambiguous", optname, (int)len, list);
            printTestNames(",");
            exit(1);
        }
        if (found != TEST_COUNT) {
            g_tests[found].enabled = enable;
        }

        list += len;
        if (*list == ',') { list++; }
    }
}

//-----------------------------------------------------------------------------

static void VerifyAll( flags_t flags ) {
    printf("[[[ VerifyAll Tests ]]]\n\n");

    if (!verifyAllHashes(REPORT(VERBOSE, flags))) {
        printf("Self-test FAILED!\n");
        verifyAllHashes(true);
        exit(1);
    }
    printf("PASS\n\n");
}

static bool SanityAll( flags_t flags ) {
    bool     result = true;
    uint32_t lanes  = 0;

    printf("[[[ SanityAll Tests ]]]\n\n");
    SanityTestHeader(flags);
    for (const HashInfo * h: findAllHashes()) {
        if ((lanes != 0) && (h->lanes != lanes)) { printf("\n"); }
        lanes   = h->lanes;
        result &= SanityTest(h, flags, true);
    }
    printf("\n");

    return result;
}

//-----------------------------------------------------------------------------
// End-of-run report: the -log2(p-value) histogram, the pass count, and
// the failed checks grouped by suite.

static void printSummary( const HashInfo * hinfo, bool result ) {
    const char * rule = "----------------------------------------------------------------------------------------------\n";
    const int    half = (COUNT_MAX_PVALUE + 2) / 2;

    printf("%s-log2(p-value) summary:\n", rule);
    for (int row = 0; row < 2; row++) {
        printf("\n       ");
        for (int i = row * half; i < (row + 1) * half; i++) {
            printf(" %3d%c ", i, (i == COUNT_MAX_PVALUE + 1) ? '+' : ' ');
        }
        printf("\n       ");
        for (int i = 0; i < half; i++) {
            printf(" -----");
        }
        printf("\n       ");
        for (int i = row * half; i < (row + 1) * half; i++) {
            printf(" %5u", g_log2pValueCounts[i]);
        }
        printf("\n");
    }
    printf("\n%s", rule);

    printf("Summary for: %s [%s]\n", hinfo->name, hinfo->impl);
    printf("Overall result: %s            ( %u / %u passed)\n", result ? "pass" : "FAIL",
            g_testPass, g_testPass + g_testFail);
    if (!g_testFailures.empty()) {
        const char * suite = NULL;
        printf("Failures:");
        for (size_t i = 0; i < g_testFailures.size(); i++) {
            const char * check = (g_testFailures[i].second != NULL) ? g_testFailures[i].second : "";
            if ((suite == NULL) || (strcmp(suite, g_testFailures[i].first) != 0)) {
                printf("%s\n    %-20s: [%s", (suite == NULL) ? "" : "]", g_testFailures[i].first, check);
                suite = g_testFailures[i].first;
            } else {
                printf(", %s", check);
            }
        }
        printf("]\n");
    }
    printf("\n%s", rule);
}

// Runs the selected suites on one hash, stopping early on failure if
// asked to.
static bool TestHash( const HashInfo * hinfo, flags_t flags ) {
    const bool all    = allSelected();
    bool       result = true;

    if (all) {
        printf("-------------------------------------------------------------------------------\n");
    }
    printf("--- Testing %s \"%s\" [%s]", hinfo->name, hinfo->desc, hinfo->impl);
    if (g_seed != 0) {
        printf(" seed 0x%016" PRIx64, (uint64_t)g_seed);
    }
    printf("\n\n");

#define RUN_SUITE(id, call)                              \
    if (RUNNING(id) && !(g_exitOnFailure && !result)) {  \
        result &= (call);                                \
    }

    if (RUNNING(SANITY)) {
        printf("[[[ Sanity Tests ]]]\n\n");
        const bool verified = verifyHash(hinfo, true, false);
        recordTestResult(verified, "Sanity", "Implementation verification");
        result &= verified;
        result &= SanityTest(hinfo, flags);
        printf("\n");
    }
    RUN_SUITE(CHUNKING,      ChunkingTest(hinfo, g_testExtra, flags));
    RUN_SUITE(BOUNDARY,      BoundaryTest(hinfo, g_testExtra, flags));
    RUN_SUITE(SEEDAVALANCHE, SeedAvalancheTest(hinfo, g_testExtra, flags));
    RUN_SUITE(DISTRIBUTION,  DistributionTest(hinfo, g_testExtra, flags));
    RUN_SUITE(SPEED,         SpeedTest(hinfo, flags));
    RUN_SUITE(HASHMAP,       HashMapTest(hinfo, g_testExtra, flags));

#undef RUN_SUITE

    if (all || g_forceSummary) {
        printSummary(hinfo, result);
    }
    for (size_t i = 0; i < g_testFailures.size(); i++) {
        free(g_testFailures[i].second);
    }
    g_testFailures.clear();

    return result;
}

//-----------------------------------------------------------------------------

static void usage( void ) {
    printf("Usage: HornerHash [--[no]test=<testname>[,...]] [--extra] [--verbose] [--ncpu=N]\n"
           "                  [--seed=<hash_default_seed>] [--randseed=<RNG_base_seed>]\n"
           "                  [--[no]exit-on-failure] [--[no]exit-code-on-failure]\n"
           "                  [--[no]time-tests] [--force-summary]\n"
           "                  [<hashname>]\n"
           "\n"
           "       HornerHash [--list]|[--listnames]|[--tests]|[--version]|[--help]\n"
           "\n"
           "  Hashnames can be supplied using any case letters.\n");
}

// Numeric option values, in any base strtoull accepts
static uint64_t optionValue( const char * arg, const char * what ) {
    const char * val = strchr(arg, '=') + 1;
    char *       end;

    errno = 0;
    const uint64_t v = strtoull(val, &end, 0);
    if ((errno != 0) || (*val == '\0') || (*end != '\0')) {
        printf("Error parsing %s \"%s\"\n", what, val);
        exit(1);
    }
    return v;
}

// --opt and --noopt set and clear the same switch
struct Switch {
    const char *  name;
    bool &        var;
};

static Switch g_switches[] = {
    { "exit-on-failure",      g_exitOnFailure  },
    { "exit-code-on-failure", g_exitCodeResult },
    { "time-tests",           g_showTestTimes  },
};

static bool parseSwitch( const char * opt ) {
    const bool on = (strncmp(opt, "no", 2) != 0);

    for (size_t i = 0; i < sizeof(g_switches) / sizeof(g_switches[0]); i++) {
        if (strcmp(on ? opt : opt + 2, g_switches[i].name) == 0) {
            g_switches[i].var = on;
            return true;
        }
    }
    return false;
}

int main( int argc, const char ** argv ) {
    setbuf(stdout, NULL);
    setbuf(stderr, NULL);

    if (isLE() == isBE()) {
        printf("Runtime endian detection failed! Cannot continue\n");
        exit(1);
    }

    const char * hashname = "horner-64";
    flags_t      flags    = FLAG_REPORT_PROGRESS;
    bool         picked   = false; // An explicit --test= replaces the defaults

    if (argc < 2) {
        printf("No test hash given on command line, testing %s.\n", hashname);
        usage();
    }

    for (int i = 1; i < argc; i++) {
        const char * arg = argv[i];

        if (strncmp(arg, "--", 2) != 0) {
            hashname = arg;
        } else if (strcmp(arg, "--help") == 0) {
            usage();
            exit(0);
        } else if (strcmp(arg, "--version") == 0) {
            printf("HornerHash %s\n", VERSION);
            exit(0);
        } else if ((strcmp(arg, "--list") == 0) || (strcmp(arg, "--listnames") == 0)) {
            listHashes(arg[6] != '\0');
            exit(0);
        } else if (strcmp(arg, "--tests") == 0) {
            printf("Valid tests:\n  ");
            printTestNames("\n  ");
            exit(0);
        } else if (strcmp(arg, "--verbose") == 0) {
            flags |= FLAG_REPORT_VERBOSE | FLAG_REPORT_MORESTATS | FLAG_REPORT_DIAGRAMS;
        } else if (strcmp(arg, "--extra") == 0) {
            g_testExtra = true;
        } else if (strcmp(arg, "--force-summary") == 0) {
            g_forceSummary = true;
        } else if (strncmp(arg, "--seed=", 7) == 0) {
            g_seed = optionValue(arg, "global seed value");
        } else if (strncmp(arg, "--randseed=", 11) == 0) {
            Rand::GLOBAL_SEED = optionValue(arg, "RNG seed value");
        } else if (strncmp(arg, "--ncpu=", 7) == 0) {
#if defined(HAVE_THREADS)
            const uint64_t n = optionValue(arg, "cpu number");
            if (n < 1) {
                printf("Error parsing cpu number \"%s\"\n", arg + 7);
                exit(1);
            }
            g_NCPU = (n > 32) ? 32 : (unsigned)n;
#else
            printf("WARNING: compiled without threads; ignoring --ncpu\n");
#endif
        } else if (strncmp(arg, "--test=", 7) == 0) {
            if (!picked) {
                for (int t = 0; t < TEST_COUNT; t++) { g_tests[t].enabled = false; }
                picked = true;
            }
            selectTests(arg + 7, true);
        } else if (strncmp(arg, "--notest=", 9) == 0) {
            selectTests(arg + 9, false);
        } else if (!parseSwitch(arg + 2)) {
            printf("Invalid command \"%s\"\n", arg);
            usage();
            exit(1);
        }
    }

    const uint64_t begin  = g_prevtime = monotonic_clock();
    bool           result = true;

    if (RUNNING(VERIFYALL)) {
        VerifyAll(flags);
    } else if (RUNNING(SANITYALL)) {
        result = SanityAll(flags);
    } else {
        const HashInfo * hinfo = findHash(hashname);
        if (hinfo == NULL) {
            printf("Invalid hash '%s' specified\n", hashname);
            exit(1);
        }
        result = TestHash(hinfo, flags);
    }

    fprintf(allSelected() ? stdout : stderr, "Testing took %f seconds\n\n",
            (double)(monotonic_clock() - begin) / (double)NSEC_PER_SEC);

    return (!result && g_exitCodeResult) ? 99 : 0;
}
