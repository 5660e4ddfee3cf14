#ifndef NORMAL_DISTRIBUTION_H
#define NORMAL_DISTRIBUTION_H

/**
 * @brief Standard normal law helpers used by the Black-Scholes pricer
 *
 * The CDF is the Zelen-Severo rational approximation (Abramowitz & Stegun
 * 26.2.17), accurate to about 7.5 decimal digits. It is closed form so every
 * chain is evaluated deterministically without numerical integration.
 */
class NormalDistribution {
public:
    /// Density at zero, 1/sqrt(2*pi)
    static constexpr double DENSITY_AT_ZERO = 0.3989423;

    /**
     * @brief Cumulative probability N(x)
     * @return Value in [0, 1]; cdf(0) = 0.5 and cdf(-x) = 1 - cdf(x)
     */
    static double cdf(double x);

    /**
     * @brief Probability density N'(x)
     */
    static double pdf(double x);
};

#endif // NORMAL_DISTRIBUTION_H
