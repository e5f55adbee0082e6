/*
 * HornerHash
 * Copyright (C) 2021-2023  Frank J. T. Wojcik
 * Copyright (C) 2023       jason
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
#include "Random.h"
#include "Reporting.h"
#include "HornerSeeds.h"

#include "SeedAvalancheTest.h"

#include <functional>

#if defined(HAVE_THREADS)
  #include <atomic>
  #include <thread>
typedef std::atomic<unsigned> a_uint;
#else
typedef unsigned a_uint;
#endif

//-----------------------------------------------------------------------------
// Replacing either seed word with a fresh random value should cause an
// "avalanche" of changes in the hash function's output. Ideally, each
// output bit should flip 50% of the time, and so about 32 bits should
// flip per replacement. If some output bit flips more or less often than
// that, the seed words do not reach it evenly.
//
// Each rep uses 4 seed words: the original low and high words, and the
// replacement low and high words.

static const unsigned seedwords = 4;

static FORCE_INLINE uint32_t * HistogramHashBits( uint64_t v, uint32_t * cursor ) {
    for (unsigned i = 0; i < 64; i++) {
        cursor[i] += (uint32_t)((v >> i) & 1);
    }
    return cursor + 64;
}

static void calcBiasRange( const HashInfo * hinfo, std::vector<uint32_t> & bins, uint64_t & flipsum,
        const unsigned keybytes, const uint8_t * keys, const uint64_t * seeds, a_uint & irepp,
        const unsigned reps, const flags_t flags ) {
    HornerHash::SeedPair pair;
    unsigned             irep;

    while ((irep = irepp++) < reps) {
        if (REPORT(PROGRESS, flags)) {
            progressdots(irep, 0, reps - 1, 18);
        }

        const uint8_t *  keyptr  = &keys[keybytes * irep];
        const uint64_t * seedptr = &seeds[seedwords * irep];

        pair.low  = seedptr[0] | 1;
        pair.high = seedptr[1];
        const uint64_t A = hashValue(hinfo, keyptr, keybytes, rawSeed(pair));

        uint32_t * cursor = &bins[0];
        for (unsigned word = 0; word < 2; word++) {
            pair.low  = ((word == 0) ? seedptr[2] : seedptr[0]) | 1;
            pair.high =  (word == 1) ? seedptr[3] : seedptr[1];

            const uint64_t B = A ^ hashValue(hinfo, keyptr, keybytes, rawSeed(pair));

            flipsum += popcount8(B);
            cursor   = HistogramHashBits(B, cursor);
        }
    }
}

//-----------------------------------------------------------------------------

// Per-thread tallies, summed once every thread is done
struct AvalancheTally {
    std::vector<uint32_t>  bins;
    uint64_t               flipsum;

    AvalancheTally( void ) : bins( 2 * 64 ), flipsum( 0 ) {}
};

static bool SeedAvalancheImpl( const HashInfo * hinfo, const unsigned keybytes,
        const unsigned reps, flags_t flags ) {
    Rand                        r( 860319, keybytes );
    std::vector<uint8_t>        keys( reps * keybytes + 1 );
    std::vector<uint64_t>       seeds( reps * seedwords );
    std::vector<AvalancheTally> tally( g_NCPU );
    a_uint                      irep( 0 );

    printf("Testing %3d-byte keys, %6d reps", keybytes, reps);

    r.rand_n(&keys[0], reps * keybytes);
    r.rand_n(&seeds[0], seeds.size() * sizeof(uint64_t));

#if defined(HAVE_THREADS)
    std::vector<std::thread> workers;
    for (unsigned i = 1; i < g_NCPU; i++) {
        workers.push_back(std::thread(calcBiasRange, hinfo, std::ref(tally[i].bins), std::ref(tally[i].flipsum),
                keybytes, &keys[0], &seeds[0], std::ref(irep), reps, flags));
    }
#endif
    calcBiasRange(hinfo, tally[0].bins, tally[0].flipsum, keybytes, &keys[0], &seeds[0], irep, reps, flags);
#if defined(HAVE_THREADS)
    for (size_t i = 0; i < workers.size(); i++) {
        workers[i].join();
    }
#endif

    for (unsigned i = 1; i < g_NCPU; i++) {
        for (size_t b = 0; b < tally[0].bins.size(); b++) {
            tally[0].bins[b] += tally[i].bins[b];
        }
        tally[0].flipsum += tally[i].flipsum;
    }

    bool result = true;

    result &= ReportBias(&tally[0].bins[0], reps, (int)tally[0].bins.size(), 64, flags);
    printf("%34s", "");
    result &= ReportFlipMean(tally[0].flipsum, 2 * (uint64_t)reps, 64, flags);

    recordTestResult(result, "SeedAvalanche", keybytes);

    return result;
}

//-----------------------------------------------------------------------------

bool SeedAvalancheTest( const HashInfo * hinfo, bool extra, flags_t flags ) {
    bool result = true;

    printf("[[[ Seed Avalanche Tests ]]]\n\n");

    // Lane-block multiples, and with --extra lengths that leave a partial word
    std::vector<unsigned> lengths = { 0, 4, 8, 16, 24, 32, 64, 128 };
    if (extra) {
        lengths.insert(lengths.end(), { 3, 6, 12, 20, 28, 33, 127 });
    }

    for (size_t i = 0; i < lengths.size(); i++) {
        result &= SeedAvalancheImpl(hinfo, lengths[i], 100000, flags);
    }

    printf("\n%s\n", result ? "" : g_failstr);

    return result;
}
