#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace evosynth {

// The one random source of a run. Every stochastic choice of the trainer and
// the genetic operators draws from it, so the seed fixes the trajectory.
class Rng {
public:
    explicit Rng(uint64_t seed) : gen_(seed) {}

    // Uniform integer in [lo, hi].
    int64_t uniformInt(int64_t lo, int64_t hi) {
        std::uniform_int_distribution<int64_t> d(lo, hi);
        return d(gen_);
    }

    // Uniform index in [0, n). n must be positive.
    size_t index(size_t n) {
        if (n == 0) throw std::invalid_argument("Rng::index: empty range");
        return (size_t)uniformInt(0, (int64_t)n - 1);
    }

    // Uniform real in [0, 1).
    double unit() {
        std::uniform_real_distribution<double> d(0.0, 1.0);
        return d(gen_);
    }

    template <typename T>
    const T& choice(const std::vector<T>& v) {
        return v[index(v.size())];
    }

private:
    std::mt19937_64 gen_;
};

} // namespace evosynth
