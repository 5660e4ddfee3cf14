#ifndef OPTION_CHAIN_GENERATOR_H
#define OPTION_CHAIN_GENERATOR_H

#include "data/OptionChain.h"
#include "quant/LadderBuilder.h"
#include <QString>

/**
 * @brief Prices every (strike, expiry) pair of a ladder into a chain snapshot
 *
 * Each expiry d is priced with T = max(d, 1) / 365. A strike whose pricing
 * fails for any reason is replaced, for that expiry only, by a placeholder
 * pair (minimal premium, zero Greeks, not in the money); the rest of the
 * chain is unaffected. Premiums are floored at the minimal tick.
 *
 * Usage:
 * @code
 *   OptionChainGenerator generator;
 *   auto snapshot = generator.generate("ABC", 101.0, 0.28, 0.035,
 *                                      StrikeLadderBuilder::build(101.0),
 *                                      ExpiryLadderBuilder::defaultLadder());
 * @endcode
 */
class OptionChainGenerator {
public:
    static constexpr double MIN_PREMIUM = 0.01;

    explicit OptionChainGenerator(double minPremium = MIN_PREMIUM);

    /**
     * @brief Build the chain
     *
     * Throws PricingError("spot") if spot is not a positive finite number.
     */
    MarketData::OptionChainSnapshot generate(const QString& ticker,
                                             double spot,
                                             double volatility,
                                             double riskFreeRate,
                                             const StrikeLadder& strikes,
                                             const ExpiryLadder& expiries) const;

    MarketData::OptionContract placeholder(double strike) const;

    double minPremium() const { return m_minPremium; }

private:
    double m_minPremium;
};

#endif // OPTION_CHAIN_GENERATOR_H
