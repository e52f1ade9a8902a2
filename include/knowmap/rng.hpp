#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace knowmap {

/**
 * Explicit seeded random source.
 *
 * Passed by reference into every randomized step (k-means seeding, Halton
 * scrambling, farthest-point start). There is no process-wide generator, so
 * two calls with different seeds never interfere. derive() yields an
 * independent stream for a sub-task, keyed only by (seed, stream id), which
 * keeps results identical whether sub-tasks run sequentially or in parallel.
 */
class Rng {
public:
    explicit Rng(uint64_t seed) : seed_(seed), engine_(mix(seed)) {}

    uint64_t seed() const noexcept { return seed_; }

    uint64_t next() { return engine_(); }

    // Uniform double in [0, 1) with 53 random bits
    double uniform() {
        return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform integer in [0, n); n must be > 0
    size_t index(size_t n) {
        return static_cast<size_t>(uniform() * static_cast<double>(n)) % n;
    }

    Rng derive(uint64_t stream) const {
        return Rng(mix(seed_ ^ mix(stream + 0x9E3779B97F4A7C15ULL)));
    }

private:
    // splitmix64 finalizer
    static uint64_t mix(uint64_t z) {
        z += 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace knowmap
