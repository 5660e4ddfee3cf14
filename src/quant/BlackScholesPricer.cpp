#include "quant/BlackScholesPricer.h"
#include "quant/NormalDistribution.h"
#include "quant/PricingError.h"
#include <algorithm>
#include <cmath>

namespace {

bool isPositive(double value)
{
    return std::isfinite(value) && value > 0.0;
}

void requireFinite(double value, const char* what)
{
    if (!std::isfinite(value)) {
        throw PricingError("result", std::string("Non-finite ") + what + " in Black-Scholes evaluation");
    }
}

} // namespace

void BlackScholesPricer::validateInputs(double S, double K, double T, double r, double v)
{
    if (!isPositive(S)) throw PricingError("spot", "Stock price must be positive");
    if (!isPositive(K)) throw PricingError("strike", "Strike price must be positive");
    if (!isPositive(T)) throw PricingError("timeToExpiry", "Time to expiration must be positive");
    if (!isPositive(v)) throw PricingError("volatility", "Volatility must be positive");
    if (!std::isfinite(r)) throw PricingError("rate", "Risk-free rate must be finite");
}

double BlackScholesPricer::intrinsicValue(OptionKind kind, double S, double K)
{
    return kind == OptionKind::Call ? std::max(0.0, S - K) : std::max(0.0, K - S);
}

double BlackScholesPricer::calculateD1(double S, double K, double T, double r, double v)
{
    return (std::log(S / K) + (r + v * v / 2.0) * T) / (v * std::sqrt(T));
}

double BlackScholesPricer::calculateD2(double d1, double v, double T)
{
    return d1 - v * std::sqrt(T);
}

double BlackScholesPricer::price(OptionKind kind, double S, double K, double T, double r, double v)
{
    validateInputs(S, K, T, r, v);

    if (T < NEAR_EXPIRY_YEARS) {
        return intrinsicValue(kind, S, K);
    }

    double d1 = calculateD1(S, K, T, r, v);
    double d2 = calculateD2(d1, v, T);
    double expRT = std::exp(-r * T);

    double value = (kind == OptionKind::Call)
        ? S * NormalDistribution::cdf(d1) - K * expRT * NormalDistribution::cdf(d2)
        : K * expRT * NormalDistribution::cdf(-d2) - S * NormalDistribution::cdf(-d1);

    requireFinite(value, "price");
    // The CDF approximation can leave a deep out-of-the-money price a hair below zero
    return std::max(0.0, value);
}

OptionGreeks BlackScholesPricer::greeks(OptionKind kind, double S, double K, double T, double r, double v)
{
    validateInputs(S, K, T, r, v);

    OptionGreeks greeks;
    const bool isCall = (kind == OptionKind::Call);

    if (T < NEAR_EXPIRY_YEARS) {
        // Expiring now: a step function in spot, no time value left
        greeks.price = intrinsicValue(kind, S, K);
        if (isCall) {
            greeks.delta = S > K ? 1.0 : 0.0;
        } else {
            greeks.delta = S < K ? -1.0 : 0.0;
        }
        return greeks;
    }

    double sqrtT = std::sqrt(T);
    double d1 = calculateD1(S, K, T, r, v);
    double d2 = calculateD2(d1, v, T);
    double nd1 = NormalDistribution::cdf(d1);
    double nPd1 = NormalDistribution::pdf(d1); // N'(d1)
    double expRT = std::exp(-r * T);

    if (isCall) {
        double nd2 = NormalDistribution::cdf(d2);
        greeks.price = S * nd1 - K * expRT * nd2;
        greeks.delta = std::clamp(nd1, 0.0, 1.0);
        greeks.theta = (-S * nPd1 * v / (2 * sqrtT)) - (r * K * expRT * nd2);
        greeks.rho = K * T * expRT * nd2;
    } else {
        double n_d1 = NormalDistribution::cdf(-d1);
        double n_d2 = NormalDistribution::cdf(-d2);
        greeks.price = K * expRT * n_d2 - S * n_d1;
        greeks.delta = std::clamp(nd1 - 1.0, -1.0, 0.0);
        greeks.theta = (-S * nPd1 * v / (2 * sqrtT)) + (r * K * expRT * n_d2);
        greeks.rho = -K * T * expRT * n_d2;
    }

    // Gamma and Vega are the same for Calls and Puts
    greeks.gamma = nPd1 / (S * v * sqrtT);
    greeks.vega = S * sqrtT * nPd1 / 100.0;

    greeks.theta /= DAYS_PER_YEAR;
    greeks.rho /= 100.0;

    requireFinite(greeks.price, "price");
    requireFinite(greeks.delta, "delta");
    requireFinite(greeks.gamma, "gamma");
    requireFinite(greeks.theta, "theta");
    requireFinite(greeks.vega, "vega");
    requireFinite(greeks.rho, "rho");

    greeks.price = std::max(0.0, greeks.price);

    return greeks;
}

double BlackScholesPricer::rawVega(double S, double K, double T, double r, double v)
{
    validateInputs(S, K, T, r, v);

    if (T < NEAR_EXPIRY_YEARS) {
        return 0.0;
    }

    double d1 = calculateD1(S, K, T, r, v);
    return S * std::sqrt(T) * NormalDistribution::pdf(d1);
}
