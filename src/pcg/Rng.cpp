#include "tilegen/pcg/Rng.hpp"
#include "Hash.hpp"

namespace tilegen::pcg {

void Rng::reset(uint64_t seed) {
    _seed = seed;
    uint64_t x = seed ? seed : 0x106689d45497fdb5ULL;
    _s[0] = splitmix64(x);
    _s[1] = splitmix64(x);
    _s[2] = splitmix64(x);
    _s[3] = splitmix64(x);
}

uint64_t Rng::next_u64() {
    const uint64_t result = rotl(_s[1] * 5ull, 7) * 9ull;
    const uint64_t t = _s[1] << 17;
    _s[2] ^= _s[0]; _s[3] ^= _s[1];
    _s[1] ^= _s[2]; _s[0] ^= _s[3];
    _s[2] ^= t; _s[3] = rotl(_s[3], 45);
    return result;
}

uint32_t Rng::next_u32() { return static_cast<uint32_t>(next_u64() >> 32); }

// 24 bits so the result is exactly representable and never rounds up to 1.0f.
float Rng::next_float() { return static_cast<float>(next_u64() >> 40) * (1.0f / 16777216.0f); }

int Rng::next_int(int lo, int hiExclusive) {
    if (hiExclusive <= lo) return lo;
    const uint32_t span = static_cast<uint32_t>(static_cast<int64_t>(hiExclusive) - lo);
    return static_cast<int>(static_cast<int64_t>(lo) + (next_u32() % span));
}

} // namespace tilegen::pcg
