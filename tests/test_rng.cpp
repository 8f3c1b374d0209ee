#include <doctest/doctest.h>
#include "tilegen/pcg/Noise.hpp"
#include "tilegen/pcg/Rng.hpp"

#include <limits>
#include <vector>

using namespace tilegen::pcg;

TEST_CASE("Rng/SameSeedSameStream") {
    Rng a(42), b(42);
    for (int i = 0; i < 256; ++i)
        CHECK(a.next_u64() == b.next_u64());
}

TEST_CASE("Rng/DifferentSeedsDiverge") {
    Rng a(1), b(2);
    int same = 0;
    for (int i = 0; i < 64; ++i)
        same += (a.next_u64() == b.next_u64());
    CHECK(same < 4);
}

TEST_CASE("Rng/ResetReplays") {
    Rng r(7);
    std::vector<int> first;
    for (int i = 0; i < 32; ++i) first.push_back(r.next_int(0, 1000));
    r.reset(7);
    for (int i = 0; i < 32; ++i) CHECK(r.next_int(0, 1000) == first[static_cast<std::size_t>(i)]);
    CHECK(r.seed() == 7u);
}

TEST_CASE("Rng/ZeroSeedIsUsable") {
    Rng r(0);
    uint64_t acc = 0;
    for (int i = 0; i < 8; ++i) acc |= r.next_u64();
    CHECK(acc != 0u);
}

TEST_CASE("Rng/Ranges") {
    Rng r(123);
    for (int i = 0; i < 10000; ++i) {
        const int v = r.next_int(-3, 5);
        CHECK(v >= -3);
        CHECK(v < 5);
        const float f = r.next_float();
        CHECK(f >= 0.0f);
        CHECK(f < 1.0f);
        const float g = r.next_float(2.0f, 4.0f);
        CHECK(g >= 2.0f);
        CHECK(g <= 4.0f);
    }
    CHECK(r.next_int(5, 5) == 5);
    CHECK(r.next_int(9, 2) == 9);
}

TEST_CASE("Rng/ChanceExtremes") {
    Rng r(99);
    for (int i = 0; i < 100; ++i) {
        CHECK_FALSE(r.chance(0.0f));
        CHECK(r.chance(1.0f));
    }
}

TEST_CASE("Rng/IntsCoverRange") {
    Rng r(5);
    int hits[6] = {};
    for (int i = 0; i < 6000; ++i) ++hits[r.next_int(0, 6)];
    for (int h : hits) CHECK(h > 800);
}

TEST_CASE("Perlin/DeterministicAndBounded") {
    Rng ra(11), rb(11);
    Perlin a(ra), b(rb);
    REQUIRE(a.p.size() == 512u);
    for (int i = 0; i < 200; ++i) {
        const float x = i * 0.37f, y = i * 0.11f;
        CHECK(a.noise(x, y) == b.noise(x, y));
        const float o = a.octave_noise(x, y, 4, 0.5f, 2.0f);
        CHECK(o >= -1.0f);
        CHECK(o <= 1.0f);
    }
}

TEST_CASE("Perlin/ZeroAtLatticePoints") {
    Rng r(3);
    Perlin n(r);
    CHECK(n.noise(0.0f, 0.0f) == doctest::Approx(0.0f));
    CHECK(n.noise(4.0f, 7.0f) == doctest::Approx(0.0f));
}

TEST_CASE("Perlin/FarCoordinatesWrap") {
    Rng r(3);
    Perlin n(r);
    // Lattice cells beyond the int range wrap like nearby ones.
    CHECK(n.noise(2.1e11f, -5.0e10f) >= -1.0f);
    CHECK(n.noise(2.1e11f, -5.0e10f) <= 1.0f);
    CHECK(n.noise(256.5f, 3.25f) == doctest::Approx(n.noise(0.5f, 3.25f)));
    CHECK(n.noise(-255.5f, 3.25f) == doctest::Approx(n.noise(0.5f, 3.25f)));
    CHECK(n.noise(std::numeric_limits<float>::infinity(), 1.0f) == 0.0f);
    CHECK(n.octave_noise(0.3f, 0.7f, 8, 0.5f, 1.0e4f) >= -1.0f);
}
