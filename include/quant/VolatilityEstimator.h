#ifndef VOLATILITY_ESTIMATOR_H
#define VOLATILITY_ESTIMATOR_H

#include "quant/BlackScholesPricer.h"
#include <QVector>
#include <optional>

/**
 * @brief Result of Implied Volatility calculation
 */
struct IVResult {
    double impliedVolatility;   // Last iterate (decimal, e.g., 0.20 = 20%)
    int iterations;             // Number of iterations performed
    bool converged;             // True if |market - model| fell below tolerance
    double finalError;          // Final price error (market - theoretical)

    IVResult()
        : impliedVolatility(0.0)
        , iterations(0)
        , converged(false)
        , finalError(0.0)
    {}

    IVResult(double iv, int iter, bool conv, double err)
        : impliedVolatility(iv)
        , iterations(iter)
        , converged(conv)
        , finalError(err)
    {}
};

/**
 * @brief Historical and implied volatility for the chain generator
 *
 * Historical volatility is the population standard deviation of daily log
 * returns over a trailing window, annualized with sqrt(365). Implied
 * volatility inverts BlackScholesPricer::price with Newton-Raphson:
 *   v_{n+1} = v_n + (Market_Price - BS_Price(v_n)) / Vega(v_n)
 */
class VolatilityEstimator {
public:
    /**
     * @brief Annualized historical volatility of the most recent window
     *
     * Non-positive closes are discarded (with a warning). When fewer than two
     * usable closes remain the estimate is InsufficientData: it is logged and
     * std::nullopt is returned so the caller can apply its default.
     *
     * @param closes Closing prices, oldest first
     * @param window Number of trailing returns to use
     */
    static std::optional<double> historicalVolatility(const QVector<double>& closes, int window = DEFAULT_WINDOW);

    /**
     * @brief historicalVolatility() with the InsufficientData default applied
     */
    static double historicalVolatilityOr(const QVector<double>& closes, int window = DEFAULT_WINDOW,
                                         double fallback = DEFAULT_VOLATILITY);

    /**
     * @brief Newton-Raphson implied volatility, best effort
     *
     * Starts at 0.3 and stops after MAX_IV_ITERATIONS or once the price error
     * is below IV_PRECISION. A non-positive iterate is floored to MIN_VOLATILITY.
     * The last iterate is returned even without convergence; check
     * IVResult::converged when that matters.
     *
     * Throws PricingError for invalid S, K, T.
     */
    static IVResult solveImpliedVolatility(OptionKind kind, double marketPrice,
                                           double S, double K, double T, double r);

    /// Convenience wrapper returning only the volatility
    static double impliedVolatility(OptionKind kind, double marketPrice,
                                    double S, double K, double T, double r);

    /**
     * @brief Clamp an estimate into the band used for pricing
     *
     * Non-finite or non-positive input is replaced by DEFAULT_VOLATILITY first.
     */
    static double clampForPricing(double volatility,
                                  double floor = PRICING_FLOOR,
                                  double cap = PRICING_CAP);

    // Constants
    static constexpr int DEFAULT_WINDOW = 30;
    static constexpr double DEFAULT_VOLATILITY = 0.30;
    static constexpr double PRICING_FLOOR = 0.10;
    static constexpr double PRICING_CAP = 0.80;
    static constexpr double IV_INITIAL_GUESS = 0.3;
    static constexpr double IV_PRECISION = 1e-5;
    static constexpr int MAX_IV_ITERATIONS = 100;
    static constexpr double MIN_VOLATILITY = 0.001;
};

#endif // VOLATILITY_ESTIMATOR_H
