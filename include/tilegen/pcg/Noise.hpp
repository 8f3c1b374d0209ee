#pragma once
#include <vector>
#include "tilegen/pcg/RandomSource.hpp"

namespace tilegen::pcg {

struct Perlin {
    std::vector<int> p; // 512

    // Permutation is shuffled from `rng`, advancing it by 255 draws.
    explicit Perlin(IRandomSource& rng);

    // 2D Perlin in [-1,1]
    float noise(float x, float y) const;

    // Sum of `octaves` layers divided by the total amplitude, so the result
    // stays in [-1,1] for any persistence.
    float octave_noise(float x, float y, int octaves, float persistence, float lacunarity) const;
};

} // namespace tilegen::pcg
