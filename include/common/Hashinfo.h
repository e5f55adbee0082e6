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
// Properties of the hash function itself
enum HashFlags : uint32_t {
    FLAG_HASH_XL_SEED            = 1 << 0, // Seeds wider than 64 bits
    FLAG_HASH_ENDIAN_INDEPENDENT = 1 << 1,
    FLAG_HASH_MULTIPLY_SHIFT     = 1 << 2,
};

// Properties of one implementation of it
enum ImplFlags : uint32_t {
    FLAG_IMPL_INCREMENTAL        = 1 << 0, // Has a streaming interface
    FLAG_IMPL_MULTIPLY_64_128    = 1 << 1,
    FLAG_IMPL_CANONICAL_LE       = 1 << 2,
    FLAG_IMPL_LICENSE_MIT        = 1 << 3,
};

//-----------------------------------------------------------------------------
// The harness deals in 64-bit seeds. Hashes with wider seeds expand one
// into their own storage and hand back its address, so seed_t must be
// able to hold a pointer as well.
typedef uint64_t seed_t;
static_assert(sizeof(uintptr_t) <= sizeof(seed_t), "seed_t can hold a pointer");

typedef uintptr_t (* HashSeedFn)( const seed_t seed );
typedef void      (* HashFn)( const void * in, const size_t len, const seed_t seed, void * out );
// Hashes the concatenation of nchunks pieces of in, piece i being
// chunklens[i] bytes, through the streaming interface.
typedef void      (* HashChunkedFn)( const void * in, const size_t * chunklens,
        const size_t nchunks, const seed_t seed, void * out );

struct HashFamilyInfo {
    const char *  name;
    const char *  src_url;

    explicit HashFamilyInfo( const char * n ) : name( n ), src_url( NULL ) {}
};

class HashInfo {
  public:
    const char *   name;         // Underscores in the C++ name become dashes
    const char *   family;
    const char *   desc;
    const char *   impl;
    uint32_t       hash_flags;
    uint32_t       impl_flags;
    uint32_t       bits;
    uint32_t       lanes;
    uint32_t       verification; // Expected VerificationCode()
    HashSeedFn     seedfn;
    HashFn         hashfn;
    HashChunkedFn  hashfn_chunked;

    HashInfo( const char * n, const char * f ) :
        name( dashed(n) ), family( f ), desc( "" ), impl( "" ), hash_flags( 0 ),
        impl_flags( 0 ), bits( 0 ), lanes( 0 ), verification( 0 ), seedfn( NULL ),
        hashfn( NULL ), hashfn_chunked( NULL ) {}

    // For XL_SEED hashes the result refers to per-thread storage, and is
    // only good until the next Seed() call on the same thread.
    FORCE_INLINE seed_t Seed( seed_t seed ) const {
        if (seedfn != NULL) {
            const seed_t expanded = (seed_t)seedfn(seed);
            if (expanded != 0) {
                return expanded;
            }
        }
        return seed;
    }

    FORCE_INLINE bool isIncremental( void ) const {
        return (impl_flags & FLAG_IMPL_INCREMENTAL) && (hashfn_chunked != NULL);
    }

    // A 32-bit fingerprint of the hash over a fixed schedule of keys and
    // seeds. Leaves the hash seeded with 0.
    uint32_t VerificationCode( void ) const;

  private:
    // Never freed: HashInfo objects live as long as the program.
    static const char * dashed( const char * in );
}; // class HashInfo
