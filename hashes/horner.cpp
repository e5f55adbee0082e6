/*
 * Horner Hash registration for the test harness
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
#include "Platform.h"
#include "Hashlib.h"
#include "HornerHash.h"

//------------------------------------------------------------
// The harness hands out 64-bit seeds, but a Horner hash needs an odd
// 64-bit multiplier and a second 64-bit word. Both are derived from the
// harness seed with murmur3's finalizer, each with its own offset.
static FORCE_INLINE uint64_t horner_fmix64( uint64_t k ) {
    k ^= k >> 33;
    k *= UINT64_C(0xff51afd7ed558ccd);
    k ^= k >> 33;
    k *= UINT64_C(0xc4ceb9fe1a85ec53);
    k ^= k >> 33;
    return k;
}

static thread_local HornerHash::SeedPair seedpair;

static uintptr_t horner_seed_expand( const seed_t seed ) {
    seedpair.low  = horner_fmix64((uint64_t)seed ^ UINT64_C(0x39d79811cf493f43)) | 1;
    seedpair.high = horner_fmix64((uint64_t)seed ^ UINT64_C(0xd48c0d4d8c14493b));
    return (uintptr_t)(void *)&seedpair;
}

static FORCE_INLINE const HornerHash::SeedPair & seed_as_pair( const seed_t seed ) {
    return *(const HornerHash::SeedPair *)(uintptr_t)seed;
}

//------------------------------------------------------------
template <unsigned lanes>
static void HornerOneShot( const void * in, const size_t len, const seed_t seed, void * out ) {
    const uint64_t h = HornerHash::hash<lanes>(in, len, seed_as_pair(seed));

    PUT_U64_LE(h, (uint8_t *)out, 0);
}

template <unsigned lanes>
static void HornerChunked( const void * in, const size_t * chunklens,
        const size_t nchunks, const seed_t seed, void * out ) {
    HornerHash::Hasher<lanes> hasher( seed_as_pair(seed) );
    const uint8_t *           data = (const uint8_t *)in;

    for (size_t i = 0; i < nchunks; i++) {
        hasher.ingest(data, chunklens[i]);
        data += chunklens[i];
    }

    PUT_U64_LE(hasher.finalize(), (uint8_t *)out, 0);
}

//------------------------------------------------------------
REGISTER_FAMILY(horner,
   $.src_url    = NULL
 );

REGISTER_HASH(horner_64,
   $.desc            = "Horner iterated multiply-shift, 1 lane",
   $.impl            = "hornerhash",
   $.hash_flags      =
         FLAG_HASH_XL_SEED            |
         FLAG_HASH_ENDIAN_INDEPENDENT |
         FLAG_HASH_MULTIPLY_SHIFT,
   $.impl_flags      =
         FLAG_IMPL_INCREMENTAL        |
         FLAG_IMPL_MULTIPLY_64_128    |
         FLAG_IMPL_CANONICAL_LE       |
         FLAG_IMPL_LICENSE_MIT,
   $.bits            = 64,
   $.lanes           = 1,
   $.verification    = 0x95A741CB,
   $.seedfn          = horner_seed_expand,
   $.hashfn          = HornerOneShot<1>,
   $.hashfn_chunked  = HornerChunked<1>
 );

REGISTER_HASH(horner4_64,
   $.desc            = "Horner iterated multiply-shift, 4 interleaved lanes",
   $.impl            = "hornerhash",
   $.hash_flags      =
         FLAG_HASH_XL_SEED            |
         FLAG_HASH_ENDIAN_INDEPENDENT |
         FLAG_HASH_MULTIPLY_SHIFT,
   $.impl_flags      =
         FLAG_IMPL_INCREMENTAL        |
         FLAG_IMPL_MULTIPLY_64_128    |
         FLAG_IMPL_CANONICAL_LE       |
         FLAG_IMPL_LICENSE_MIT,
   $.bits            = 64,
   $.lanes           = 4,
   $.verification    = 0x68D79754,
   $.seedfn          = horner_seed_expand,
   $.hashfn          = HornerOneShot<4>,
   $.hashfn_chunked  = HornerChunked<4>
 );
