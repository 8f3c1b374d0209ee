#include "tilegen/pcg/Noise.hpp"
#include <algorithm>
#include <cmath>

namespace tilegen::pcg {

static inline float fade(float t) { return t*t*t*(t*(t*6 - 15) + 10); }
static inline float lerp(float a, float b, float t) { return a + t * (b - a); }
static inline float grad(int hash, float x, float y) {
    switch (hash & 7) {
        case 0: return  x + y;
        case 1: return -x + y;
        case 2: return  x - y;
        case 3: return -x - y;
        case 4: return  x;
        case 5: return -x;
        case 6: return  y;
        default: return -y;
    }
}

Perlin::Perlin(IRandomSource& rng) {
    p.resize(512);
    std::vector<int> perm(256);
    for (int i=0;i<256;++i) perm[i] = i;
    for (int i=255;i>0;--i) std::swap(perm[i], perm[rng.next_int(0, i + 1)]);
    for (int i=0;i<512;++i) p[i] = perm[i & 255];
}

float Perlin::noise(float x, float y) const {
    if (!std::isfinite(x) || !std::isfinite(y)) return 0.0f;
    const float fx = std::floor(x), fy = std::floor(y);
    // Wrap before the cast: far-away lattice cells do not fit in an int.
    int X = static_cast<int>(std::fmod(fx, 256.0f) + 256.0f) & 255;
    int Y = static_cast<int>(std::fmod(fy, 256.0f) + 256.0f) & 255;
    x -= fx; y -= fy;
    float u = fade(x), v = fade(y);

    int A = p[X  ] + Y;
    int B = p[X+1] + Y;

    float res = lerp( lerp( grad(p[A  ], x  , y  ),
                            grad(p[B  ], x-1, y  ), u),
                      lerp( grad(p[A+1], x  , y-1),
                            grad(p[B+1], x-1, y-1), u), v);
    return std::clamp(res, -1.0f, 1.0f);
}

float Perlin::octave_noise(float x, float y, int octaves, float persistence, float lacunarity) const {
    float f = 0.0f, amp = 1.0f, freq = 1.0f, total = 0.0f;
    for (int i=0;i<octaves;++i) {
        f += amp * noise(x*freq, y*freq);
        total += amp;
        freq *= lacunarity;
        amp *= persistence;
    }
    return total > 0.0f ? f / total : 0.0f;
}

} // namespace tilegen::pcg
