#pragma once

#include <cstdint>
#include <random>
#include <utility>

namespace hs {

class DeterministicRng {
  public:
    explicit DeterministicRng(uint64_t seed = 0) : eng_(seed) {}

    void reseed(uint64_t seed) { eng_.seed(seed); }

    float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(eng_);
    }

    // Inclusive on both ends; swaps reversed ranges instead of failing.
    int uniform_int(int lo, int hi) {
        if (lo > hi) std::swap(lo, hi);
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(eng_);
    }

    bool chance(float p) { return uniform(0.0f, 1.0f) < p; }

  private:
    std::mt19937_64 eng_;
};

} // namespace hs
