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
#include "Random.h"

uint64_t Rand::GLOBAL_SEED = 0;

// The two seeds and the global seed become three odd key words, by
// multiplying rotations of a combined value by fractional parts of
// irrational numbers. Key 4 is Threefish's parity word.
void Rand::reseed( uint64_t seed, uint64_t stream ) {
    const uint64_t s = (seed * UINT64_C(0x9E3779B97F4A7C15)) ^ ROTR64(stream, 29) ^ GLOBAL_SEED;

    key[0]  = 0;
    key[1]  = (s                 | 1) * UINT64_C(0x9E3779B97F4A7C15);
    key[2]  = (ROTR64(s, 21)     | 1) * UINT64_C(0x6A09E667F3BCC90B);
    key[3]  = (ROTR64(s, 43)     | 1) * UINT64_C(0xBB67AE8584CAA73D);
    key[4]  = UINT64_C(0x1BD11BDAA9FC1A22) ^ key[0] ^ key[1] ^ key[2] ^ key[3];
    counter = 0;
    avail   = 0;
}

//-----------------------------------------------------------------------------
// One Threefry-4x64 block with 16 rounds, on the input { 0, c, c, 0 }.
// See Salmon et al., "Parallel random numbers: as easy as 1, 2, 3".

static const unsigned rotations[8][2] = {
    { 14, 16 }, { 52, 57 }, { 23, 40 }, {  5, 37 },
    { 25, 33 }, { 46, 12 }, { 58, 22 }, { 32, 32 },
};

static FORCE_INLINE void mixpair( uint64_t & a, uint64_t & b, unsigned r ) {
    a += b;
    b  = ROTL64(b, r) ^ a;
}

void Rand::refill( void ) {
    uint64_t x[4] = { key[0], key[1] + counter, key[2] + counter, key[3] };

    for (unsigned round = 0; round < 16; round++) {
        const unsigned * rot = rotations[round % 8];

        if ((round & 1) == 0) {
            mixpair(x[0], x[1], rot[0]);
            mixpair(x[2], x[3], rot[1]);
        } else {
            mixpair(x[0], x[3], rot[0]);
            mixpair(x[2], x[1], rot[1]);
        }
        if (((round & 3) == 3) && (round != 15)) {
            const unsigned inj = (round + 1) / 4;
            for (unsigned j = 0; j < 4; j++) {
                x[j] += key[(inj + j) % 5];
            }
            x[3] += inj;
        }
    }

    for (unsigned j = 0; j < BLOCK_WORDS; j++) {
        block[j] = x[j];
    }
    avail = BLOCK_WORDS;
    counter++;
}

void Rand::rand_n( void * buf, size_t bytes ) {
    uint8_t * out = static_cast<uint8_t *>(buf);

    while (bytes >= 8) {
        PUT_U64_LE(rand_u64(), out, 0);
        out   += 8;
        bytes -= 8;
    }
    if (bytes > 0) {
        uint8_t last[8];
        PUT_U64_LE(rand_u64(), last, 0);
        memcpy(out, last, bytes);
    }
}
