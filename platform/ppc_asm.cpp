#include <cstdio>
#include <cstdint>

uint64_t a = UINT64_C(0xfedcba98fedcba98), b = UINT64_C(0xffeeddccbbaa9988);

int main(void) {
    uint64_t rhi;
    __asm__("mulhdu %0, %1, %2\n"
            : "=r" (rhi)
            : "r" (a), "r" (b)
            );
    printf("0x%016llx\n", (unsigned long long)rhi);
}
