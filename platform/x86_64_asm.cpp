#include <cstdio>
#include <cstdint>

uint64_t multasm64( uint64_t a, uint64_t b, uint64_t * hi ) {
    uint64_t rlo, rhi;
    __asm__("mulq %3\n"
            : "=d" (rhi), "=a" (rlo)
            : "%1" (a), "rm" (b)
            : "cc"
            );
    *hi = rhi;
    return rlo;
}

int main(void) {
    uint64_t hi;
    uint64_t lo = multasm64(UINT64_C(0xfedcba98fedcba98), UINT64_C(0xffeeddccbbaa9988), &hi);
    printf("0x%016llx 0x%016llx\n", (unsigned long long)hi, (unsigned long long)lo);
}
