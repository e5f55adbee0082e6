/*
 * Horner Hash: compiler and byte-order portability
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

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#if !defined(HAVE_X86_64) && (defined(__x86_64) || defined(_M_AMD64) || defined(_M_X64))
  #define HAVE_X86_64
#endif

//------------------------------------------------------------
#if defined(_MSC_VER)

  #include <intrin.h>

  #define FORCE_INLINE    __forceinline
  #define NEVER_INLINE    __declspec(noinline)
  #define likely(x)       (x)
  #define unlikely(x)     (x)

  #define ROTL64(x, r)    _rotl64(x, r)
  #define ROTR64(x, r)    _rotr64(x, r)
  #define BSWAP64(x)      _byteswap_uint64(x)
  #define popcount8(x)    __popcnt64(x)
  #define strncasecmp     _strnicmp

  #if defined(HAVE_X86_64)
    #define HAVE_UMUL128
  #elif defined(_M_ARM64)
    #define HAVE_UMULH
  #endif

#else

  #include <strings.h>

  #define FORCE_INLINE    inline __attribute__((always_inline))
  #define NEVER_INLINE    __attribute__((noinline))
  #define likely(x)       __builtin_expect(!!(x), 1)
  #define unlikely(x)     __builtin_expect(!!(x), 0)

  // r must be in [1, 63]
  #define ROTL64(x, r)    (((x) << (r)) | ((x) >> (64 - (r))))
  #define ROTR64(x, r)    (((x) >> (r)) | ((x) << (64 - (r))))
  #define BSWAP64(x)      __builtin_bswap64(x)
  #define popcount8(x)    __builtin_popcountll(x)

#endif

//------------------------------------------------------------
// Byte order is decided at runtime; compilers fold these to constants.

static FORCE_INLINE bool isLE( void ) {
    const uint16_t marker = 0x0102;
    uint8_t        first;

    memcpy(&first, &marker, 1);
    return first == 0x02;
}

static FORCE_INLINE bool isBE( void ) {
    const uint16_t marker = 0x0102;
    uint8_t        first;

    memcpy(&first, &marker, 1);
    return first == 0x01;
}

static FORCE_INLINE uint64_t COND_BSWAP( uint64_t value, bool doit ) {
    return doit ? BSWAP64(value) : value;
}

//------------------------------------------------------------
// Unaligned little-endian 64-bit access. Keys are read as LE words on
// every host, so digests do not depend on the platform.

static FORCE_INLINE uint64_t GET_U64_LE( const uint8_t * b, const size_t i ) {
    uint64_t n;

    memcpy(&n, &b[i], 8);
    return COND_BSWAP(n, isBE());
}

static FORCE_INLINE void PUT_U64_LE( uint64_t n, uint8_t * b, const size_t i ) {
    n = COND_BSWAP(n, isBE());
    memcpy(&b[i], &n, 8);
}

// 0 to 8 bytes, zero-extended. Nothing at or past b[i + len] is read.
static FORCE_INLINE uint64_t GET_PARTIAL_U64_LE( const uint8_t * b, const size_t i, const size_t len ) {
    uint8_t word[8] = { 0 };

    memcpy(word, &b[i], len);
    return GET_U64_LE(word, 0);
}
