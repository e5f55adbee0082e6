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
#include "Stats.h"

#include <algorithm>
#include <math.h>

double CalcMean( const std::vector<double> & v ) {
    double sum = 0.0;

    for (size_t i = 0; i < v.size(); i++) {
        sum += v[i];
    }
    return sum / (double)v.size();
}

// Squared deviations from mean, summed. The correction term cancels
// most of the rounding in mean.
static double SumSqDev( const std::vector<double> & v, double mean ) {
    double sum = 0.0, sumsq = 0.0;

    for (size_t i = 0; i < v.size(); i++) {
        const double d = v[i] - mean;
        sum   += d;
        sumsq += d * d;
    }
    return sumsq - sum * sum / (double)v.size();
}

void FilterOutliers( std::vector<double> & v ) {
    std::sort(v.begin(), v.end());

    while (v.size() > 2) {
        const double mean = CalcMean(v);
        const double dev  = v.back() - mean;
        // dev > 3 * sample stdv, squared on both sides
        if (dev * dev * (double)(v.size() - 1) <= 9.0 * SumSqDev(v, mean)) {
            break;
        }
        v.pop_back();
    }
}

//-----------------------------------------------------------------------------

double ScalePValue( double p_value, unsigned testcount ) {
    // 1 - (1 - p)**n, without losing tiny p to rounding
    return -expm1((double)testcount * log1p(-p_value));
}

int GetLog2PValue( double p_value ) {
    const double l2 = log2(p_value);

    return (l2 <= -99.0) ? 99 : (int)-ceil(l2);
}

// Upper tail of the standard normal distribution
static double NormalUpperTail( double z ) {
    return 0.5 * erfc(z / sqrt(2.0));
}

// g(x) from the Peizer-Pratt normal approximation to the binomial; see
// M. A. Bruce, "Approximations to the Binomial".
static double PeizerPrattG( double x ) {
    if (x == 0.0) { return 1.0; }
    if (x == 1.0) { return 0.0; }
    if (x > 1.0)  { return -PeizerPrattG(1.0 / x); }
    return (1.0 - x * x + 2.0 * x * log(x)) / ((1.0 - x) * (1.0 - x));
}

double GetCoinflipBinomialPValue( unsigned long coinflips, unsigned long delta ) {
    const double n  = (double)coinflips;
    const double hi = n + 2.0 * delta; // 2 * (n/2 + delta)
    const double lo = n - 2.0 * delta; // 2 * (n/2 - delta)

    const double d  = (double)delta + 0.02 * (1.0 / (hi + 1.0) - 1.0 / (lo + 1.0));
    const double z  = d * sqrt((2.0 + PeizerPrattG(hi / n) + PeizerPrattG(lo / n)) / (n / 2.0 + 1.0 / 12.0));

    return 2.0 * NormalUpperTail(z);
}

// Exact for 1 degree of freedom, where chi-squared is a squared normal.
// Otherwise the Chernoff bound, which can only overstate the p-value.
double ChiSqPValue( double chisq, uint64_t dof ) {
    if (dof == 1) {
        return 2.0 * NormalUpperTail(sqrt(chisq));
    }

    const double ratio = chisq / (double)dof;
    if (ratio <= 1.0) {
        return 1.0;
    }
    return exp(-0.5 * (double)dof * (ratio - 1.0 - log(ratio)));
}
