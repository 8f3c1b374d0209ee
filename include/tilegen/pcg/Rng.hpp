#pragma once
#include <cstdint>
#include "tilegen/pcg/RandomSource.hpp"

namespace tilegen::pcg {

// xoshiro256** seeded through SplitMix64.
// Bit-exact on every platform: no <random> distributions are involved.
class Rng final : public IRandomSource {
public:
    explicit Rng(uint64_t seed = 0) { reset(seed); }

    void     reset(uint64_t seed) override;
    uint64_t seed() const override { return _seed; }

    int   next_int(int lo, int hiExclusive) override;
    float next_float() override;
    using IRandomSource::next_float;

    uint64_t next_u64();   // [0, 2^64-1]
    uint32_t next_u32();   // [0, 2^32-1]

private:
    uint64_t _seed = 0;
    uint64_t _s[4] = {};
};

} // namespace tilegen::pcg
