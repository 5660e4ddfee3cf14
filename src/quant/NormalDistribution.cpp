#include "quant/NormalDistribution.h"
#include <cmath>

namespace {
constexpr double P = 0.2316419;
constexpr double B1 = 0.319381530;
constexpr double B2 = -0.356563782;
constexpr double B3 = 1.781477937;
constexpr double B4 = -1.821255978;
constexpr double B5 = 1.330274429;
}

double NormalDistribution::cdf(double x)
{
    const double t = 1.0 / (1.0 + P * std::fabs(x));
    const double d = DENSITY_AT_ZERO * std::exp(-x * x / 2.0);

    // Lower tail probability for -|x|
    double prob = d * t * (B1 + t * (B2 + t * (B3 + t * (B4 + t * B5))));
    if (x > 0) {
        prob = 1.0 - prob;
    }
    return prob;
}

double NormalDistribution::pdf(double x)
{
    return (1.0 / std::sqrt(2.0 * M_PI)) * std::exp(-0.5 * x * x);
}
