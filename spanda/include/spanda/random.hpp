#pragma once
// Random: the engine's only source of chance
//
// Injected, never global. Tests substitute a scripted source to force
// specific branches (a spontaneous jump, a quiet tick).

#include <cstdint>
#include <random>

namespace spanda {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform real in [lo, hi)
    virtual double uniform(double lo, double hi) = 0;

    // True with probability p
    virtual bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return uniform(0.0, 1.0) < p;
    }
};

// SeededRandom: Mersenne twister, reproducible given a seed
class SeededRandom : public RandomSource {
public:
    SeededRandom() : gen_(std::random_device{}()) {}
    explicit SeededRandom(uint64_t seed) : gen_(seed) {}

    double uniform(double lo, double hi) override {
        std::uniform_real_distribution<double> dis(lo, hi);
        return dis(gen_);
    }

private:
    std::mt19937_64 gen_;
};

} // namespace spanda
