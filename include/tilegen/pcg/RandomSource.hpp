#pragma once
#include <cstdint>

namespace tilegen::pcg {

// Seeded pseudo-random stream. Every draw advances the state; reset() restarts
// the sequence, so the same seed always yields the same draws.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    virtual void     reset(uint64_t seed) = 0;
    virtual uint64_t seed() const = 0;

    virtual int   next_int(int lo, int hiExclusive) = 0; // lo if hiExclusive <= lo
    virtual float next_float() = 0;                      // [0,1)

    float next_float(float lo, float hi) { return lo + (hi - lo) * next_float(); }

    bool chance(float p) {
        if (p <= 0.0f) return false;
        if (p >= 1.0f) return true;
        return next_float() < p;
    }
};

} // namespace tilegen::pcg
