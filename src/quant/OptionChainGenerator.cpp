#include "quant/OptionChainGenerator.h"
#include "quant/BlackScholesPricer.h"
#include "quant/PricingError.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

using MarketData::ExpirySlice;
using MarketData::OptionChainSnapshot;
using MarketData::OptionContract;

namespace {

OptionContract toContract(const OptionGreeks& greeks, double strike, bool inTheMoney, double minPremium)
{
    OptionContract contract;
    contract.strike = strike;
    contract.price = std::max(minPremium, greeks.price);
    contract.delta = greeks.delta;
    contract.gamma = greeks.gamma;
    contract.theta = greeks.theta;
    contract.vega = greeks.vega;
    contract.rho = greeks.rho;
    contract.inTheMoney = inTheMoney;
    return contract;
}

} // namespace

OptionChainGenerator::OptionChainGenerator(double minPremium)
    : m_minPremium(minPremium)
{
}

OptionContract OptionChainGenerator::placeholder(double strike) const
{
    OptionContract contract;
    contract.strike = strike;
    contract.price = m_minPremium;
    contract.inTheMoney = false;
    contract.placeholder = true;
    return contract;
}

OptionChainSnapshot OptionChainGenerator::generate(const QString& ticker,
                                                   double spot,
                                                   double volatility,
                                                   double riskFreeRate,
                                                   const StrikeLadder& strikes,
                                                   const ExpiryLadder& expiries) const
{
    if (!std::isfinite(spot) || spot <= 0.0) {
        throw PricingError("spot", "Current price must be positive");
    }

    OptionChainSnapshot snapshot;
    snapshot.ticker = ticker;
    snapshot.spot = spot;
    snapshot.volatility = volatility;
    snapshot.riskFreeRate = riskFreeRate;

    for (int days : expiries) {
        const double T = ExpiryLadderBuilder::yearsToExpiry(days);
        ExpirySlice slice;
        slice.calls.reserve(strikes.size());
        slice.puts.reserve(strikes.size());

        for (double strike : strikes) {
            try {
                OptionGreeks call = BlackScholesPricer::greeks(OptionKind::Call, spot, strike, T,
                                                               riskFreeRate, volatility);
                OptionGreeks put = BlackScholesPricer::greeks(OptionKind::Put, spot, strike, T,
                                                              riskFreeRate, volatility);
                slice.calls.append(toContract(call, strike, spot > strike, m_minPremium));
                slice.puts.append(toContract(put, strike, spot < strike, m_minPremium));
            } catch (const std::exception& e) {
                qWarning() << "[OptionChainGenerator] PerStrikeComputeFailure for" << ticker
                           << "strike" << strike << "dte" << days << ":" << e.what();
                slice.calls.append(placeholder(strike));
                slice.puts.append(placeholder(strike));
                ++snapshot.placeholderCount;
            }
        }

        snapshot.expiries.insert(days, slice);
    }

    qDebug() << "[OptionChainGenerator] Generated" << ticker << "chain:" << expiries.size()
             << "expiries x" << strikes.size() << "strikes, vol" << volatility
             << "placeholders" << snapshot.placeholderCount;

    return snapshot;
}
