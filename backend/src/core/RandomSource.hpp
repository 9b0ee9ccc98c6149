#pragma once
#include <cstdint>
#include <random>

// Source of Beta draws for Thompson Sampling. Each optimizer owns or borrows
// its own instance; nothing here is shared between threads.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Throws std::invalid_argument unless alpha > 0 and beta > 0.
    virtual double sampleBeta(double alpha, double beta) = 0;
};

class StdRandomSource : public RandomSource {
public:
    StdRandomSource();                       // seeded from std::random_device
    explicit StdRandomSource(std::uint64_t seed);

    double sampleBeta(double alpha, double beta) override;

private:
    std::mt19937_64 engine;
};
