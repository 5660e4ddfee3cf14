#include "quant/VolatilityEstimator.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

// ============================================================================
// HISTORICAL VOLATILITY
// ============================================================================

std::optional<double> VolatilityEstimator::historicalVolatility(const QVector<double>& closes, int window)
{
    QVector<double> usable;
    usable.reserve(closes.size());
    for (double close : closes) {
        if (std::isfinite(close) && close > 0.0) {
            usable.append(close);
        }
    }

    if (usable.size() != closes.size()) {
        qWarning() << "[VolatilityEstimator] Discarded" << (closes.size() - usable.size())
                   << "non-positive closes";
    }

    if (usable.size() < 2) {
        qWarning() << "[VolatilityEstimator] Insufficient price data for volatility calculation:"
                   << usable.size() << "usable closes";
        return std::nullopt;
    }

    const int n = usable.size();
    const int count = (window > 0) ? std::min(window, n - 1) : n - 1;

    QVector<double> returns;
    returns.reserve(count);
    for (int i = n - count; i < n; ++i) {
        returns.append(std::log(usable[i] / usable[i - 1]));
    }

    double mean = 0.0;
    for (double value : returns) {
        mean += value;
    }
    mean /= returns.size();

    double variance = 0.0;
    for (double value : returns) {
        variance += (value - mean) * (value - mean);
    }
    variance /= returns.size();

    return std::sqrt(variance) * std::sqrt(BlackScholesPricer::DAYS_PER_YEAR);
}

double VolatilityEstimator::historicalVolatilityOr(const QVector<double>& closes, int window, double fallback)
{
    auto estimate = historicalVolatility(closes, window);
    if (!estimate) {
        qInfo() << "[VolatilityEstimator] Using default volatility" << fallback;
        return fallback;
    }
    return *estimate;
}

double VolatilityEstimator::clampForPricing(double volatility, double floor, double cap)
{
    if (!std::isfinite(volatility) || volatility <= 0.0) {
        qWarning() << "[VolatilityEstimator] Invalid volatility" << volatility << "- using default";
        volatility = DEFAULT_VOLATILITY;
    }
    return std::clamp(volatility, floor, cap);
}

// ============================================================================
// NEWTON-RAPHSON IV SOLVER
// ============================================================================

IVResult VolatilityEstimator::solveImpliedVolatility(OptionKind kind, double marketPrice,
                                                     double S, double K, double T, double r)
{
    double sigma = IV_INITIAL_GUESS;
    double diff = 0.0;

    for (int i = 0; i < MAX_IV_ITERATIONS; ++i) {
        diff = marketPrice - BlackScholesPricer::price(kind, S, K, T, r, sigma);

        if (std::abs(diff) < IV_PRECISION) {
            return IVResult(sigma, i + 1, true, diff);
        }

        double vega = BlackScholesPricer::rawVega(S, K, T, r, sigma);
        if (!(vega > 0.0)) {
            // Flat price surface: no further progress possible
            return IVResult(sigma, i + 1, false, diff);
        }

        double next = sigma + diff / vega;
        if (!std::isfinite(next)) {
            return IVResult(sigma, i + 1, false, diff);
        }
        if (next <= 0.0) {
            next = MIN_VOLATILITY;
        }
        sigma = next;
    }

    diff = marketPrice - BlackScholesPricer::price(kind, S, K, T, r, sigma);
    qDebug() << "[VolatilityEstimator] IV did not converge after" << MAX_IV_ITERATIONS
             << "iterations, last sigma" << sigma << "error" << diff;
    return IVResult(sigma, MAX_IV_ITERATIONS, std::abs(diff) < IV_PRECISION, diff);
}

double VolatilityEstimator::impliedVolatility(OptionKind kind, double marketPrice,
                                              double S, double K, double T, double r)
{
    return solveImpliedVolatility(kind, marketPrice, S, K, T, r).impliedVolatility;
}
