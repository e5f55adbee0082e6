/*
 * Horner Hash: 64x64->128-bit multiplication
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

// The backend is picked by the HAVE_* macros the build system probes
// for. Under clang the x86 asm gets register-only operands, as clang
// tends to spill to the stack when offered a memory operand.

namespace HornerHash {
namespace MathMult {

// Schoolbook product from four 32x32->64 partial products. Compiled on
// every platform so the self-test can compare it with the fast path.
static FORCE_INLINE void mult64_128_portable( uint64_t & rlo, uint64_t & rhi, uint64_t a, uint64_t b ) {
    const uint64_t a_lo = (uint32_t)a, a_hi = a >> 32;
    const uint64_t b_lo = (uint32_t)b, b_hi = b >> 32;

    const uint64_t ll   = a_lo * b_lo;
    const uint64_t lh   = a_lo * b_hi;
    const uint64_t hl   = a_hi * b_lo;
    const uint64_t hh   = a_hi * b_hi;

    // Middle column: the high half of ll plus the low halves of the cross
    // terms. This can't overflow 64 bits.
    const uint64_t mid  = (ll >> 32) + (uint32_t)lh + (uint32_t)hl;

    rlo = (mid << 32) | (uint32_t)ll;
    rhi = hh + (lh >> 32) + (hl >> 32) + (mid >> 32);
}

static FORCE_INLINE void mult64_128( uint64_t & rlo, uint64_t & rhi, uint64_t a, uint64_t b ) {
#if defined(HAVE_UMUL128)
    rlo = _umul128(a, b, &rhi);
#elif defined(HAVE_UMULH)
    rlo = a * b;
    rhi = __umulh(a, b);
#elif defined(HAVE_ARM64_ASM)
    rlo = a * b;
    __asm__ ("umulh %0, %1, %2" : "=r" (rhi) : "r" (a), "r" (b));
#elif defined(HAVE_PPC_ASM)
    rlo = a * b;
    __asm__ ("mulhdu %0, %1, %2" : "=r" (rhi) : "r" (a), "r" (b));
#elif defined(HAVE_X86_64_ASM) && defined(HAVE_AVX2)
    // mulx: rdx is the implicit source, flags are untouched
  #if defined(__clang__)
    __asm__ ("mulxq %3, %1, %0" : "=r" (rhi), "=r" (rlo) : "d" (a), "r" (b));
  #else
    __asm__ ("mulxq %3, %1, %0" : "=r" (rhi), "=r" (rlo) : "d" (a), "rm" (b));
  #endif
#elif defined(HAVE_X86_64_ASM)
  #if defined(__clang__)
    __asm__ ("mulq %3" : "=d" (rhi), "=a" (rlo) : "%1" (a), "r" (b) : "cc");
  #else
    __asm__ ("mulq %3" : "=d" (rhi), "=a" (rlo) : "%1" (a), "rm" (b) : "cc");
  #endif
#elif defined(HAVE_INT128)
    const unsigned __int128 r = (unsigned __int128)a * b;
    rlo = (uint64_t)r;
    rhi = (uint64_t)(r >> 64);
#else
    mult64_128_portable(rlo, rhi, a, b);
#endif
}

// floor(a * b / 2**64)
static FORCE_INLINE uint64_t mult64_hi( uint64_t a, uint64_t b ) {
#if defined(HAVE_UMULH)
    return __umulh(a, b);
#elif defined(HAVE_ARM64_ASM) && !defined(HAVE_UMUL128)
    uint64_t rhi;
    __asm__ ("umulh %0, %1, %2" : "=r" (rhi) : "r" (a), "r" (b));
    return rhi;
#elif defined(HAVE_PPC_ASM) && !defined(HAVE_UMUL128)
    uint64_t rhi;
    __asm__ ("mulhdu %0, %1, %2" : "=r" (rhi) : "r" (a), "r" (b));
    return rhi;
#else
    uint64_t rlo, rhi;
    mult64_128(rlo, rhi, a, b);
    return rhi;
#endif
}

} // namespace MathMult
} // namespace HornerHash
