#include <cstdio>
#include <cstdint>

int main(void) {
    typedef unsigned __int128 uint128_t;
    const uint64_t x = UINT64_C(0xfedcba98fedcba98);
    const uint64_t y = UINT64_C(0xffeeddccbbaa9988);
    uint128_t      r = (uint128_t)x * (uint128_t)y;
    static_assert(sizeof(uint128_t) == 16, "uint128_t acted like a 128-bit integer");
    printf("0x%016llx 0x%016llx\n", (unsigned long long)(r >> 64), (unsigned long long)r);
}
