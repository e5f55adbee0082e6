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

#include "TestGlobals.h"

#include <cstddef>
#include <cstdint>

// A p-value at or below FAILURE_PBOUND fails the check it belongs to.
// One at or below WARNING_PBOUND is only flagged.
extern const double FAILURE_PBOUND;
extern const double WARNING_PBOUND;

// Each of the trials entries of counts is the number of heads seen in
// coinflips fair flips. Entry i is for output bit (i % hashbits) of
// input unit (i / hashbits). The worst one is judged.
bool ReportBias( const uint32_t * counts, const int coinflips, const int trials,
        const int hashbits, const flags_t flags );

// flipsum output bits changed over reps trials of hashbits bits each
bool ReportFlipMean( const uint64_t flipsum, const uint64_t reps, const unsigned hashbits,
        const flags_t flags );

// Pearson's chi-squared for keycount keys over bucketcount buckets.
// Only a too-large statistic fails.
bool ReportChiSq( const uint32_t * buckets, const size_t bucketcount, const uint64_t keycount,
        const flags_t flags );
