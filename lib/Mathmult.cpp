/*
 * Unit tests for HornerHash's Mathmult routines
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
#include "Hashlib.h"

#include "Mathmult.h"

#include <cstdio>
#include <cinttypes>

using namespace HornerHash::MathMult;

// Prints a mismatch, and returns false for it
static bool check( const char * what, int idx, uint64_t got_hi, uint64_t got_lo,
        uint64_t want_hi, uint64_t want_lo ) {
    if ((got_hi == want_hi) && (got_lo == want_lo)) {
        return true;
    }
    printf("Test %s #%d failed!\n\tGot     : %016" PRIx64 " %016" PRIx64
            "\n\tExpected: %016" PRIx64 " %016" PRIx64 "\n\n", what, idx, got_hi, got_lo, want_hi, want_lo);
    return false;
}

// { a, b, hi(a*b), lo(a*b) }
static const uint64_t tests_64[12][4] = {
    {
        UINT64_C(               0x1), UINT64_C(               0x1),
        UINT64_C(               0x0), UINT64_C(               0x1)
    },
    {
        UINT64_C(0x2F9AC342168A6741), UINT64_C(               0x0),
        UINT64_C(               0x0), UINT64_C(               0x0)
    },
    {
        UINT64_C(0x418FD883CEB217D8), UINT64_C(0x7213F60E1222CE60),
        UINT64_C(0x1D372B1B98652CD8), UINT64_C(0xC1E418E52CA8C100)
    },
    {
        UINT64_C(0x477B3604218D2514), UINT64_C(0xA6019680FBEACF3B),
        UINT64_C(0x2E5A5688195E73C4), UINT64_C(0x1E1F1A735CCAB79C)
    },
    {
        UINT64_C(0xA7E5AD86B74C236C), UINT64_C(0x1522F8FF937041C7),
        UINT64_C(0x0DDCC70B3782740B), UINT64_C(0x0249EA7D546DF4F4)
    },
    {
        UINT64_C(0x7FFFFFFFFFFFFFFF), UINT64_C(               0x2),
        UINT64_C(               0x0), UINT64_C(0xFFFFFFFFFFFFFFFE)
    },
    {
        UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(               0x1),
        UINT64_C(               0x0), UINT64_C(0xFFFFFFFFFFFFFFFF)
    },
    {
        UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0xFFFFFFFFFFFFFFFF),
        UINT64_C(0xFFFFFFFFFFFFFFFE), UINT64_C(               0x1)
    },
    {
        UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0x1111111111111111),
        UINT64_C(0x1111111111111110), UINT64_C(0xEEEEEEEEEEEEEEEF)
    },
    {
        UINT64_C(        0xFFFFFFFF), UINT64_C(        0xFFFFFFFF),
        UINT64_C(               0x0), UINT64_C(0xFFFFFFFE00000001)
    },
    {
        UINT64_C(0xFFFFFFFF00000000), UINT64_C(       0x1FFFFFFFF),
        UINT64_C(       0x1FFFFFFFD), UINT64_C(       0x100000000)
    },
    {
        UINT64_C(0x39D79811CF493F43), UINT64_C(0xD48C0D4D8C14493B),
        UINT64_C(0x30062ED7619E25E1), UINT64_C(0x93AFCEAF3E27AF71)
    },
};

// Each product is taken both ways round, through every entry point
int Mathmult_selftest( void ) {
    bool passed = true;

    for (int i = 0; i < 12; i++) {
        const uint64_t * t = tests_64[i];

        for (int swap = 0; swap < 2; swap++) {
            const uint64_t a = t[swap], b = t[1 - swap];
            uint64_t       lo, hi;

            mult64_128_portable(lo, hi, a, b);
            passed &= check("mult64_128_portable", i, hi, lo, t[2], t[3]);
            mult64_128(lo, hi, a, b);
            passed &= check("mult64_128", i, hi, lo, t[2], t[3]);
            passed &= check("mult64_hi", i, mult64_hi(a, b), 0, t[2], 0);
        }
    }

    if (!passed) {
        exit(1);
    }
    return 42;
}
