#pragma once
#include <cstdint>
#include <random>

namespace compost {

// Seeded RNG for weather rolls. mt19937_64 is deterministic for a given seed;
// the distributions are the standard library's, so replays match per toolchain.
class Rng {
public:
    explicit Rng(uint64_t seed) : seed_(seed), gen_(seed) {}

    uint64_t seed() const { return seed_; }

    // True with probability p (clamped to [0,1]).
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        std::uniform_real_distribution<double> d(0.0, 1.0);
        return d(gen_) < p;
    }

    // Inclusive range [lo, hi].
    int between(int lo, int hi) {
        std::uniform_int_distribution<int> d(lo, hi);
        return d(gen_);
    }

    double between(double lo, double hi) {
        std::uniform_real_distribution<double> d(lo, hi);
        return d(gen_);
    }

private:
    uint64_t        seed_;
    std::mt19937_64 gen_;
};

} // namespace compost
