/*
 * Horner Hash: streaming iterated multiply-shift hashing
 * Copyright (C) 2021-2023  Frank J. T. Wojcik
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use,
 * copy, modify, merge, publish, distribute, sublicense, and/or
 * sell copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 * OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
 * WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 */
#pragma once

#include "Platform.h"
#include "Mathmult.h"

#include <cassert>
#include <string>

// String hashing by iterating Dietzfelbinger et al.'s multiply-shift
// hashing. Each 64-bit word x_i of the key is folded into an
// accumulator with
//
//   acc' = x_i * s_lo + floor((acc * (s_hi:s_lo)) / 2**64) mod 2**64
//
// where (s_hi:s_lo) is a random odd 128-bit multiplier. Iterating that
// step resembles Horner's method for evaluating a polynomial in the
// seed, hence the name.
//
// The digest can be used in hash tables by shifting it right, but not by
// taking the low-order bits. The high-order bits are the higher-quality
// ones for distinguishing keys.
//
// The 4-lane variant runs four of these chains over interleaved words and
// combines them at the end. It is a different hash function from the
// 1-lane variant, not a faster way of computing the same one.

namespace HornerHash {

struct SeedPair {
    uint64_t  low;  // Must be odd
    uint64_t  high;
};

static FORCE_INLINE bool validSeed( uint64_t seed_low ) {
    return (seed_low & 1) == 1;
}

// The one mixing step used everywhere: ingestion, lane reduction, and
// folding in the length.
static FORCE_INLINE uint64_t mix( uint64_t acc, uint64_t word, uint64_t seed_low, uint64_t seed_high ) {
    return word * seed_low + acc * seed_high + MathMult::mult64_hi(acc, seed_low);
}

//-----------------------------------------------------------------------------
// Streaming interface
//
// Any sequence of ingest() calls whose concatenated bytes are the same
// gives the same finalize() result. finalize() does not modify the state,
// so it may be called more than once. Calling ingest() after finalize()
// continues the stream; the result is well-defined but is not the hash of
// anything in particular.

template <unsigned lanecount>
class Hasher {
    static_assert((lanecount == 1) || (lanecount == 4), "Horner hash supports 1 or 4 lanes");

  public:
    static const size_t LANES      = lanecount;
    static const size_t BLOCKBYTES = 8 * lanecount;

    Hasher( uint64_t seed_low, uint64_t seed_high ) {
        reset(seed_low, seed_high);
    }

    explicit Hasher( const SeedPair & seed ) {
        reset(seed.low, seed.high);
    }

    void reset( uint64_t seed_low, uint64_t seed_high ) {
        assert(validSeed(seed_low));
        seed_lo     = seed_low;
        seed_hi     = seed_high;
        total_bytes = 0;
        for (size_t k = 0; k < LANES; k++) {
            lanes[k] = seed_low + k;
        }
    }

    void ingest( const void * in, size_t len ) {
        if (len == 0) {
            return;
        }

        const uint8_t * data = static_cast<const uint8_t *>(in);
        const size_t    fill = (size_t)(total_bytes % BLOCKBYTES);

        total_bytes += len;

        // Top up a partially-filled buffer first
        if (fill != 0) {
            const size_t room = BLOCKBYTES - fill;
            if (len < room) {
                memcpy(&buffer[fill], data, len);
                return;
            }
            memcpy(&buffer[fill], data, room);
            foldBlock(buffer);
            data += room;
            len  -= room;
        }

        while (len >= BLOCKBYTES) {
            foldBlock(data);
            data += BLOCKBYTES;
            len  -= BLOCKBYTES;
        }

        if (len > 0) {
            memcpy(buffer, data, len);
        }
    }

    uint64_t finalize( void ) const {
        const size_t remaining = (size_t)(total_bytes % BLOCKBYTES);
        uint64_t     s[lanecount];

        for (size_t k = 0; k < LANES; k++) {
            s[k] = lanes[k];
        }
        for (size_t k = 0; (8 * k) < remaining; k++) {
            const size_t wordlen = (remaining - 8 * k) < 8 ? (remaining - 8 * k) : 8;
            s[k] = mix(s[k], GET_PARTIAL_U64_LE(buffer, 8 * k, wordlen), seed_lo, seed_hi);
        }

        return finish(s, total_bytes, seed_lo, seed_hi);
    }

    uint64_t total( void ) const {
        return total_bytes;
    }

    // Lane reduction and length folding, shared with the one-shot path.
    static FORCE_INLINE uint64_t finish( const uint64_t * s, uint64_t count,
            uint64_t seed_low, uint64_t seed_high ) {
        uint64_t h;

        if (LANES == 1) {
            h = s[0];
        } else {
            uint64_t a = mix(s[0], s[1], seed_low, seed_high);
            uint64_t b = mix(s[2], s[3], seed_low, seed_high);
            h = mix(a, b, seed_low, seed_high);
        }

        return mix(h, count, seed_low, seed_high);
    }

  private:
    uint64_t  seed_lo;
    uint64_t  seed_hi;
    uint64_t  lanes[lanecount];
    uint64_t  total_bytes;
    uint8_t   buffer[8 * lanecount];

    FORCE_INLINE void foldBlock( const uint8_t * block ) {
        for (size_t k = 0; k < LANES; k++) {
            lanes[k] = mix(lanes[k], GET_U64_LE(block, 8 * k), seed_lo, seed_hi);
        }
    }
}; // class Hasher

typedef Hasher<1> Hasher1;
typedef Hasher<4> Hasher4;

//-----------------------------------------------------------------------------
// One-shot interface
//
// These compute exactly what a Hasher would give for the same bytes
// delivered in one ingest() call, without going through the buffer.

static inline uint64_t hash1( const void * in, const size_t len, uint64_t seed_low, uint64_t seed_high ) {
    const uint8_t * data = static_cast<const uint8_t *>(in);
    size_t          rem  = len;
    uint64_t        acc  = seed_low;

    assert(validSeed(seed_low));

    while (rem >= 8) {
        acc   = mix(acc, GET_U64_LE(data, 0), seed_low, seed_high);
        data += 8;
        rem  -= 8;
    }
    if (rem > 0) {
        acc = mix(acc, GET_PARTIAL_U64_LE(data, 0, rem), seed_low, seed_high);
    }

    return Hasher1::finish(&acc, len, seed_low, seed_high);
}

static inline uint64_t hash4( const void * in, const size_t len, uint64_t seed_low, uint64_t seed_high ) {
    const uint8_t * data = static_cast<const uint8_t *>(in);
    size_t          rem  = len;
    uint64_t        s[4] = { seed_low, seed_low + 1, seed_low + 2, seed_low + 3 };

    assert(validSeed(seed_low));

    while (rem >= 32) {
        s[0]  = mix(s[0], GET_U64_LE(data,  0), seed_low, seed_high);
        s[1]  = mix(s[1], GET_U64_LE(data,  8), seed_low, seed_high);
        s[2]  = mix(s[2], GET_U64_LE(data, 16), seed_low, seed_high);
        s[3]  = mix(s[3], GET_U64_LE(data, 24), seed_low, seed_high);
        data += 32;
        rem  -= 32;
    }

    // Only the lanes which have tail bytes are touched. The last live
    // lane gets a short word; the ones before it get full words.
    switch ((rem + 7) / 8) {
    case 4:
        s[0] = mix(s[0], GET_U64_LE(data,  0), seed_low, seed_high);
        s[1] = mix(s[1], GET_U64_LE(data,  8), seed_low, seed_high);
        s[2] = mix(s[2], GET_U64_LE(data, 16), seed_low, seed_high);
        s[3] = mix(s[3], GET_PARTIAL_U64_LE(data, 24, rem - 24), seed_low, seed_high);
        break;
    case 3:
        s[0] = mix(s[0], GET_U64_LE(data,  0), seed_low, seed_high);
        s[1] = mix(s[1], GET_U64_LE(data,  8), seed_low, seed_high);
        s[2] = mix(s[2], GET_PARTIAL_U64_LE(data, 16, rem - 16), seed_low, seed_high);
        break;
    case 2:
        s[0] = mix(s[0], GET_U64_LE(data,  0), seed_low, seed_high);
        s[1] = mix(s[1], GET_PARTIAL_U64_LE(data,  8, rem -  8), seed_low, seed_high);
        break;
    case 1:
        s[0] = mix(s[0], GET_PARTIAL_U64_LE(data,  0, rem     ), seed_low, seed_high);
        break;
    case 0:
        break;
    }

    return Hasher4::finish(s, len, seed_low, seed_high);
}

template <unsigned lanecount>
static FORCE_INLINE uint64_t hash( const void * in, const size_t len, uint64_t seed_low, uint64_t seed_high ) {
    static_assert((lanecount == 1) || (lanecount == 4), "Horner hash supports 1 or 4 lanes");
    return (lanecount == 1) ? hash1(in, len, seed_low, seed_high) : hash4(in, len, seed_low, seed_high);
}

template <unsigned lanecount>
static FORCE_INLINE uint64_t hash( const void * in, const size_t len, const SeedPair & seed ) {
    return hash<lanecount>(in, len, seed.low, seed.high);
}

//-----------------------------------------------------------------------------
// Hash-table policy
//
// One TableHash per table, seeded by whoever owns the table. The digest's
// high bits are kept when size_t is narrower than 64 bits.

template <unsigned lanecount>
class TableHash {
  public:
    TableHash( uint64_t seed_low, uint64_t seed_high ) {
        assert(validSeed(seed_low));
        seed.low  = seed_low;
        seed.high = seed_high;
    }

    explicit TableHash( const SeedPair & s ) : seed( s ) {
        assert(validSeed(s.low));
    }

    size_t operator () ( const void * key, size_t len ) const {
        const uint64_t h = hash<lanecount>(key, len, seed);
        return (size_t)(h >> (64 - 8 * sizeof(size_t)));
    }

    size_t operator () ( const std::string & key ) const {
        return (*this)(key.data(), key.size());
    }

    const SeedPair & seedpair( void ) const {
        return seed;
    }

  private:
    SeedPair  seed;
}; // class TableHash

} // namespace HornerHash
