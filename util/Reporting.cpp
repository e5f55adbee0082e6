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
#include "TestGlobals.h"
#include "Stats.h"
#include "Reporting.h"

#include <math.h>

const double FAILURE_PBOUND = exp2(-20);
const double WARNING_PBOUND = exp2(-16);

// Records the p-value, finishes the result line, and says whether it
// passed.
static bool finishLine( double p_value ) {
    recordLog2PValue(GetLog2PValue(p_value));

    if (p_value <= FAILURE_PBOUND) {
        printf(" !!!!!\n");
        return false;
    }
    printf("%s\n", (p_value <= WARNING_PBOUND) ? " !" : "");
    return true;
}

static void printPValue( double p_value, flags_t flags ) {
    printf(" (^%2d)", GetLog2PValue(p_value));
    if (REPORT(MORESTATS, flags)) {
        printf(" (p<%8.6f)", p_value);
    }
}

// One character per p-value: '.' for unremarkable, then '1'..'9' as it
// nears FAILURE_PBOUND, then 'a'..'f' past it, then 'X'.
static char diagramChar( double p_value ) {
    const int steps = GetLog2PValue(p_value) - GetLog2PValue(FAILURE_PBOUND);

    if (steps < -8) { return '.'; }
    if (steps <= 0) { return (char)('9' + steps); }
    if (steps <= 6) { return (char)('a' + steps - 1); }
    return 'X';
}

//-----------------------------------------------------------------------------

bool ReportBias( const uint32_t * counts, const int coinflips, const int trials,
        const int hashbits, const flags_t flags ) {
    const int half  = coinflips / 2;
    int       worst = 0;

    for (int i = 1; i < trials; i++) {
        if (abs((int)counts[i] - half) > abs((int)counts[worst] - half)) {
            worst = i;
        }
    }

    const int    bias    = abs((int)counts[worst] - half);
    const double p_value = ScalePValue(GetCoinflipBinomialPValue(coinflips, bias), trials);
    const double pct     = 200.0 * (double)bias / (double)coinflips;

    printf("max is %6.3f%% at in %2d -> out %3d", pct, worst / hashbits, worst % hashbits);
    printPValue(p_value, flags);
    if (REPORT(MORESTATS, flags)) {
        printf(" (%+d)", (int)counts[worst] - half);
    }
    const bool result = finishLine(p_value);

    if (REPORT(DIAGRAMS, flags)) {
        for (int i = 0; i < trials; i++) {
            if ((i % hashbits) == 0) { putchar('['); }
            putchar(diagramChar(GetCoinflipBinomialPValue(coinflips, abs((int)counts[i] - half))));
            if ((i % hashbits) == (hashbits - 1)) { printf("]\n"); }
        }
    }
    return result;
}

bool ReportFlipMean( const uint64_t flipsum, const uint64_t reps, const unsigned hashbits,
        const flags_t flags ) {
    const uint64_t half  = reps * hashbits / 2;
    const uint64_t delta = (flipsum > half) ? (flipsum - half) : (half - flipsum);

    const double p_value = GetCoinflipBinomialPValue(reps * hashbits, delta);

    printf("mean flips %7.3f of %3u", (double)flipsum / (double)reps, hashbits);
    printPValue(p_value, flags);
    return finishLine(p_value);
}

bool ReportChiSq( const uint32_t * buckets, const size_t bucketcount, const uint64_t keycount,
        const flags_t flags ) {
    const double expected = (double)keycount / (double)bucketcount;
    double       chisq    = 0.0;
    uint32_t     lo       = buckets[0], hi = buckets[0];

    for (size_t i = 0; i < bucketcount; i++) {
        chisq += ((double)buckets[i] - expected) * ((double)buckets[i] - expected) / expected;
        lo     = (buckets[i] < lo) ? buckets[i] : lo;
        hi     = (buckets[i] > hi) ? buckets[i] : hi;
    }

    const double p_value = ChiSqPValue(chisq, bucketcount - 1);

    printf("chi-sq %10.3f on %3zu dof", chisq, bucketcount - 1);
    printPValue(p_value, flags);
    const bool result = finishLine(p_value);

    if (REPORT(DIAGRAMS, flags)) {
        printf("    buckets hold %u to %u keys, expected %.3f\n", lo, hi, expected);
    }
    return result;
}
