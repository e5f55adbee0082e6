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

#define NSEC_PER_SEC 1000000000ULL

//-----------------------------------------------------------------------------
// monotonic_clock() is wall time in nanoseconds, for --time-tests and
// the run total. cycle_timer_start()/cycle_timer_end() bracket a timed
// region for the speed measurements; their units are only comparable
// with each other.

#if defined(_MSC_VER)

  #define WIN32_LEAN_AND_MEAN
  #include <Windows.h>
  #include <intrin.h>

static FORCE_INLINE uint64_t monotonic_clock( void ) {
    LARGE_INTEGER now, freq;

    QueryPerformanceCounter(&now);
    QueryPerformanceFrequency(&freq);
    return (uint64_t)((double)now.QuadPart * ((double)NSEC_PER_SEC / (double)freq.QuadPart));
}

static FORCE_INLINE uint64_t cycle_timer_start( void ) { return __rdtsc(); }
static FORCE_INLINE uint64_t cycle_timer_end( void )   { return __rdtsc(); }

#else

  #include <time.h>

static FORCE_INLINE uint64_t monotonic_clock( void ) {
    struct timespec ts;

    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0;
    }
    return (uint64_t)ts.tv_sec * NSEC_PER_SEC + (uint64_t)ts.tv_nsec;
}

  #if defined(HAVE_X86_64) && defined(HAVE_X86_64_ASM)

// cpuid serializes before the first read; rdtscp waits for the timed
// code to retire before the second.
static FORCE_INLINE uint64_t cycle_timer_start( void ) {
    uint32_t hi, lo;

    __asm__ volatile ("cpuid\n\trdtsc" : "=d" (hi), "=a" (lo) : "a" (0) : "%rbx", "%rcx");
    return ((uint64_t)hi << 32) | lo;
}

static FORCE_INLINE uint64_t cycle_timer_end( void ) {
    uint32_t hi, lo, aux;

    __asm__ volatile ("rdtscp" : "=d" (hi), "=a" (lo), "=c" (aux));
    __asm__ volatile ("cpuid" ::: "%rax", "%rbx", "%rcx", "%rdx");
    return ((uint64_t)hi << 32) | lo;
}

  #elif defined(__aarch64__) && defined(HAVE_ARM64_ASM)

// The generic timer runs well below the core clock
static FORCE_INLINE uint64_t read_cntvct( void ) {
    uint64_t ticks;

    __asm__ volatile ("isb\n\tmrs %0, cntvct_el0" : "=r" (ticks));
    return ticks;
}

static FORCE_INLINE uint64_t cycle_timer_start( void ) { return read_cntvct(); }
static FORCE_INLINE uint64_t cycle_timer_end( void )   { return read_cntvct(); }

  #else

static FORCE_INLINE uint64_t cycle_timer_start( void ) { return monotonic_clock(); }
static FORCE_INLINE uint64_t cycle_timer_end( void )   { return monotonic_clock(); }

  #endif

#endif
