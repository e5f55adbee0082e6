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
#include "Random.h"
#include "HornerSeeds.h"

#include "ChunkingTest.h"

//-----------------------------------------------------------------------------
// However a key is cut into chunks for the streaming interface, the digest
// must be the one-shot digest of the whole key.

#define maybeprintf(...) if (REPORT(VERBOSE, flags)) { printf(__VA_ARGS__); }

static void reportResult( bool result, const char * testname ) {
    printf("%s\n", result ? " ... pass" : " ... FAIL  !!!!!");
    recordTestResult(result, "Chunking", testname);
}

static bool chunkedMatches( const HashInfo * hinfo, const uint8_t * key, size_t len,
        const std::vector<size_t> & chunklens, seed_t seed, uint64_t expected, flags_t flags ) {
    const uint64_t h = hashValueChunked(hinfo, key, chunklens.data(), chunklens.size(), seed);

    if (h != expected) {
        maybeprintf("\n  %zu-byte key in %zu chunks: 0x%016" PRIx64 " != 0x%016" PRIx64,
                len, chunklens.size(), h, expected);
        return false;
    }
    return true;
}

//-----------------------------------------------------------------------------
// A large buffer in fixed-size pieces, including a size which is never
// a divisor of the block size.
static bool FixedChunksTest( const HashInfo * hinfo, flags_t flags ) {
    Rand r( 398117 );

    const size_t         buflen = 10000;
    const seed_t         seed   = hinfo->Seed(g_seed);
    std::vector<uint8_t> buf( buflen );
    bool result = true;

    r.rand_n(&buf[0], buflen);

    printf("Testing %zu-byte buffer in 1, 7, and %zu-byte chunks", buflen, buflen);

    const uint64_t expected = hashValue(hinfo, &buf[0], buflen, seed);
    const size_t   sizes[3] = { 1, 7, buflen };

    for (size_t i = 0; i < 3; i++) {
        std::vector<size_t> chunklens( buflen / sizes[i], sizes[i] );
        if ((buflen % sizes[i]) != 0) {
            chunklens.push_back(buflen % sizes[i]);
        }
        result &= chunkedMatches(hinfo, &buf[0], buflen, chunklens, seed, expected, flags);
    }

    reportResult(result, "Fixed chunks");

    return result;
}

//-----------------------------------------------------------------------------
// Every place a key can be cut in two, for keys up to a few blocks long.
// This puts the cut at every buffer fill level.
static bool TwoWaySplitTest( const HashInfo * hinfo, flags_t flags ) {
    Rand r( 570211 );

    const size_t         maxlen = 4 * 8 * hinfo->lanes + 7;
    const seed_t         seed   = hinfo->Seed(g_seed);
    std::vector<uint8_t> key( maxlen );
    bool result = true;

    printf("Testing all two-way splits of 0..%zu-byte keys  ", maxlen);

    for (size_t len = 0; len <= maxlen; len++) {
        r.rand_n(&key[0], maxlen);
        const uint64_t expected = hashValue(hinfo, &key[0], len, seed);

        for (size_t cut = 0; cut <= len; cut++) {
            std::vector<size_t> chunklens;
            chunklens.push_back(cut);
            chunklens.push_back(len - cut);
            if (!chunkedMatches(hinfo, &key[0], len, chunklens, seed, expected, flags)) {
                maybeprintf(" (cut at %zu)", cut);
                result = false;
                break;
            }
        }
    }

    reportResult(result, "Two-way splits");

    return result;
}

//-----------------------------------------------------------------------------
// Random cuts, with empty chunks mixed in, under many seeds.
static bool RandomSplitTest( const HashInfo * hinfo, const unsigned reps, flags_t flags ) {
    Rand r( 225893 );

    const size_t         maxlen    = 1024;
    const size_t         maxchunk  = 2 * 8 * hinfo->lanes + 1;
    std::vector<uint8_t> key( maxlen );
    bool result = true;

    printf("Testing %u random multi-way splits      ", reps);

    for (unsigned rep = 0; rep < reps; rep++) {
        if (REPORT(PROGRESS, flags)) {
            progressdots(rep, 0, reps - 1, 10);
        }

        const size_t   len      = r.rand_range(maxlen + 1);
        const seed_t   seed     = hinfo->Seed(r.rand_u64());
        r.rand_n(&key[0], len);
        const uint64_t expected = hashValue(hinfo, &key[0], len, seed);

        std::vector<size_t> chunklens;
        size_t remaining = len;
        while (remaining > 0) {
            size_t chunk = r.rand_range(maxchunk + 1);
            if (chunk > remaining) {
                chunk = remaining;
            }
            chunklens.push_back(chunk);
            remaining -= chunk;
        }
        // An empty trailing chunk must not matter either
        chunklens.push_back(0);

        if (!chunkedMatches(hinfo, &key[0], len, chunklens, seed, expected, flags)) {
            result = false;
            break;
        }
    }

    reportResult(result, "Random splits");

    return result;
}

//-----------------------------------------------------------------------------
// finalize() leaves the state alone, so asking twice gives the same
// answer, and a reset() Hasher behaves like a new one.
template <unsigned lanes>
static bool FinalizeTestImpl( const HashInfo * hinfo, flags_t flags ) {
    Rand r( 81533 );

    const HornerHash::SeedPair seed = expandedSeed(hinfo, g_seed);
    const size_t               maxlen = 3 * HornerHash::Hasher<lanes>::BLOCKBYTES + 5;
    std::vector<uint8_t>       key( maxlen );
    HornerHash::Hasher<lanes>  reused( 1, 0 );
    bool result = true;

    for (size_t len = 0; len <= maxlen; len++) {
        r.rand_n(&key[0], len);

        HornerHash::Hasher<lanes> hasher( seed );
        hasher.ingest(&key[0], len);

        const uint64_t first  = hasher.finalize();
        const uint64_t second = hasher.finalize();
        if ((first != second) || (hasher.total() != len)) {
            maybeprintf("\n  %zu-byte key: repeated finalize() differs", len);
            result = false;
            break;
        }

        if (first != HornerHash::hash<lanes>(&key[0], len, seed)) {
            maybeprintf("\n  %zu-byte key: streaming and one-shot digests differ", len);
            result = false;
            break;
        }

        reused.reset(seed.low, seed.high);
        reused.ingest(&key[0], len / 2);
        reused.ingest(&key[len / 2], len - len / 2);
        if (reused.finalize() != first) {
            maybeprintf("\n  %zu-byte key: reset() Hasher differs from a new one", len);
            result = false;
            break;
        }
    }

    return result;
}

static bool FinalizeTest( const HashInfo * hinfo, flags_t flags ) {
    bool result;

    printf("Testing repeated finalize() and reset()          ");

    if (hinfo->lanes == 4) {
        result = FinalizeTestImpl<4>(hinfo, flags);
    } else {
        result = FinalizeTestImpl<1>(hinfo, flags);
    }

    reportResult(result, "Finalize");

    return result;
}

//-----------------------------------------------------------------------------

bool ChunkingTest( const HashInfo * hinfo, bool extra, flags_t flags ) {
    bool result = true;

    printf("[[[ Chunking Tests ]]]\n\n");

    result &= FixedChunksTest(hinfo, flags);
    result &= TwoWaySplitTest(hinfo, flags);
    result &= RandomSplitTest(hinfo, extra ? 1000000 : 100000, flags);
    result &= FinalizeTest(hinfo, flags);

    printf("\n%s\n", result ? "" : g_failstr);

    return result;
}
