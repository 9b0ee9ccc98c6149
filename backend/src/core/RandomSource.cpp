#include "RandomSource.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

StdRandomSource::StdRandomSource()
    : engine(std::random_device{}())
{
}

StdRandomSource::StdRandomSource(std::uint64_t seed)
    : engine(seed)
{
}

/*
  Beta(a, b) = X / (X + Y) with X ~ Gamma(a, 1), Y ~ Gamma(b, 1).
*/
double StdRandomSource::sampleBeta(double alpha, double beta) {
    if (!(alpha > 0.0) || !(beta > 0.0) || !std::isfinite(alpha) || !std::isfinite(beta)) {
        throw std::invalid_argument("sampleBeta: parameters must be positive, got (" +
            std::to_string(alpha) + ", " + std::to_string(beta) + ")");
    }

    std::gamma_distribution<double> gx(alpha, 1.0);
    std::gamma_distribution<double> gy(beta, 1.0);

    double x = gx(engine);
    double y = gy(engine);
    double sum = x + y;
    if (sum <= 0.0) {
        // both draws underflowed; fall back to the distribution mean
        return alpha / (alpha + beta);
    }
    return x / sum;
}
