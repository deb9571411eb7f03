#pragma once

#include <random>
#include <cstdint>
#include <vector>

namespace jungle {

// Seedable random source handed to every stochastic call site.
// Two instances built from the same seed produce identical draw sequences.
class Random {
public:
    Random() : engine_(std::random_device{}()) {}
    explicit Random(uint32_t seed) : engine_(seed) {}

    // Negative seed means "seed from the OS"
    static Random fromSeed(int64_t seed) {
        if (seed < 0) return Random();
        return Random(static_cast<uint32_t>(seed));
    }

    void seed(uint32_t s) {
        engine_.seed(s);
    }

    std::mt19937& engine() { return engine_; }

    // Uniform distribution [min, max)
    double uniform(double min, double max) {
        if (max <= min) return min;
        std::uniform_real_distribution<double> dist(min, max);
        return dist(engine_);
    }

    // Uniform [0, 1)
    double chance() {
        return uniform(0.0, 1.0);
    }

    // Uniform integer [min, max]
    int uniformInt(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(engine_);
    }

    // Normal distribution
    double normal(double mean, double stddev) {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(engine_);
    }

    // Bernoulli (coin flip with probability p)
    bool bernoulli(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        std::bernoulli_distribution dist(p);
        return dist(engine_);
    }

    // Uniform pick from a non-empty vector
    template<typename T>
    const T& pick(const std::vector<T>& items) {
        return items[static_cast<size_t>(uniformInt(0, static_cast<int>(items.size()) - 1))];
    }

private:
    std::mt19937 engine_;
};

} // namespace jungle
