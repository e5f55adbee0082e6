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

#include <cstdint>
#include <vector>

//-----------------------------------------------------------------------------
// Timings

double CalcMean( const std::vector<double> & v );
// Sorts v, then drops its largest values until the rest lie within 3
// standard deviations of their mean.
void FilterOutliers( std::vector<double> & v );

//-----------------------------------------------------------------------------
// p-values

// The chance of at least one p_value event in testcount independent tries
double ScalePValue( double p_value, unsigned testcount );
// -log2(p_value), rounded up and capped at 99
int GetLog2PValue( double p_value );
// Two-tailed: the chance of heads landing delta or more away from
// coinflips/2
double GetCoinflipBinomialPValue( unsigned long coinflips, unsigned long delta );
// Upper tail of the chi-squared distribution with dof degrees of freedom
double ChiSqPValue( double chisq, uint64_t dof );
