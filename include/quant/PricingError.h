#ifndef PRICING_ERROR_H
#define PRICING_ERROR_H

#include "data/MarketDataError.h"
#include <stdexcept>
#include <string>

/**
 * @brief Raised by the synchronous pricing code on invalid inputs
 *
 * Carries the violated field ("spot", "strike", "timeToExpiry", "volatility",
 * "rate", or "result" for a non-finite outcome).
 */
class PricingError : public std::invalid_argument {
public:
    PricingError(const std::string& field, const std::string& message,
                 MarketData::ErrorCode code = MarketData::ErrorCode::InvalidInput)
        : std::invalid_argument(message)
        , m_field(field)
        , m_code(code)
    {}

    const std::string& field() const { return m_field; }
    MarketData::ErrorCode code() const { return m_code; }

private:
    std::string m_field;
    MarketData::ErrorCode m_code;
};

#endif // PRICING_ERROR_H
