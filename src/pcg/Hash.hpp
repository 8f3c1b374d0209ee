#pragma once
#include <cstdint>

namespace tilegen::pcg {

// SplitMix64: good for seeding xoshiro family
inline uint64_t splitmix64(uint64_t& x) {
    uint64_t z = (x += 0x9e3779b97f4a7c15ull);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}

inline uint64_t rotl(const uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

} // namespace tilegen::pcg
