#include <cstdio>
#include <cstdint>
#include <immintrin.h>

#if !defined(__AVX2__) || !defined(__BMI2__)
  #error "AVX2 and BMI2 (for mulx) are not enabled"
#endif

uint32_t state[30];

int main(void) {
    __m256i FOO  = _mm256_set1_epi32(0x04050607);
    __m256i vals = _mm256_loadu_si256((const __m256i *)state);
    vals = _mm256_min_epu32(vals, FOO);
    vals = _mm256_add_epi32(vals, FOO);
    _mm256_storeu_si256((__m256i *)(state + 8), vals);

    uint64_t a = state[9], b = state[10], rlo, rhi;
    __asm__("mulxq %3, %1, %0\n"
            : "=r" (rhi), "=r" (rlo)
            : "%d" (a), "rm" (b)
            );
    printf("%llu %llu\n", (unsigned long long)rhi, (unsigned long long)rlo);
}
