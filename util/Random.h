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

//-----------------------------------------------------------------------------
// Deterministic random numbers for the tests: Threefry-4x64-16 run in
// counter mode. The stream depends only on the constructor's seeds and
// on Rand::GLOBAL_SEED (--randseed), never on the platform.
class Rand {
  public:
    static uint64_t  GLOBAL_SEED;

    explicit Rand( uint64_t seed ) { reseed(seed, 0); }
    Rand( uint64_t seed, uint64_t stream ) { reseed(seed, stream); }

    void reseed( uint64_t seed, uint64_t stream );

    inline uint64_t rand_u64( void ) {
        if (unlikely(avail == 0)) {
            refill();
        }
        return block[BLOCK_WORDS - avail--];
    }

    // Uniform in [0, max)
    inline uint32_t rand_range( uint32_t max ) {
        return (uint32_t)(((rand_u64() >> 32) * max) >> 32);
    }

    // Little-endian bytes of successive rand_u64() values. A partial
    // last word is discarded.
    void rand_n( void * buf, size_t bytes );

  private:
    static const unsigned  BLOCK_WORDS = 4;

    uint64_t  key[5];
    uint64_t  counter;
    uint64_t  block[BLOCK_WORDS];
    unsigned  avail;

    void refill( void );
}; // class Rand
