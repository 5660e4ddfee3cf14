#ifndef BLACK_SCHOLES_PRICER_H
#define BLACK_SCHOLES_PRICER_H

#include <QString>

enum class OptionKind {
    Call,
    Put
};

inline QString optionKindToString(OptionKind kind) {
    return kind == OptionKind::Call ? "call" : "put";
}

/**
 * @brief Result structure containing the theoretical price and all Greeks
 *
 * - Delta: Change in option price for a 1 unit change in spot
 * - Gamma: Rate of change of Delta
 * - Theta: Daily time decay (calendar days, /365)
 * - Vega: Change in option price for a 1% change in volatility
 * - Rho: Change in option price for a 1% change in the rate
 */
struct OptionGreeks
{
    double price;   // Theoretical Black-Scholes price
    double delta;   // Range: [0,1] for Call, [-1,0] for Put
    double gamma;   // Always positive
    double theta;   // Per day
    double vega;    // Per 1% vol
    double rho;     // Per 1% rate

    OptionGreeks()
        : price(0.0)
        , delta(0.0)
        , gamma(0.0)
        , theta(0.0)
        , vega(0.0)
        , rho(0.0)
    {}
};

/**
 * @brief Black-Scholes pricer for European options without dividends
 *
 * All entry points validate their inputs and throw PricingError naming the
 * violated field:
 *   S <= 0 -> "spot", K <= 0 -> "strike", T <= 0 -> "timeToExpiry",
 *   v <= 0 -> "volatility", non-finite r -> "rate".
 *
 * Below NEAR_EXPIRY_YEARS the intrinsic value is returned instead of
 * evaluating the formula, which would divide by v*sqrt(T).
 */
class BlackScholesPricer
{
public:
    static constexpr double NEAR_EXPIRY_YEARS = 1e-5;
    static constexpr double DAYS_PER_YEAR = 365.0;

    /**
     * @brief Theoretical price only
     *
     * @param kind Call or Put
     * @param S Spot price
     * @param K Strike price
     * @param T Time to expiry in years (e.g., 30/365)
     * @param r Risk-free rate (decimal, e.g., 0.035)
     * @param v Volatility (decimal, e.g., 0.28)
     */
    static double price(OptionKind kind, double S, double K, double T, double r, double v);

    /**
     * @brief Price and Greeks computed from the same d1/d2
     */
    static OptionGreeks greeks(OptionKind kind, double S, double K, double T, double r, double v);

    /**
     * @brief dPrice/dVol per unit of volatility (not scaled by 100)
     */
    static double rawVega(double S, double K, double T, double r, double v);

    static double intrinsicValue(OptionKind kind, double S, double K);

    static double calculateD1(double S, double K, double T, double r, double v);
    static double calculateD2(double d1, double v, double T);

private:
    static void validateInputs(double S, double K, double T, double r, double v);
};

#endif // BLACK_SCHOLES_PRICER_H
