#ifndef ALPHA_VANTAGE_PARSER_H
#define ALPHA_VANTAGE_PARSER_H

#include "data/MarketDataError.h"
#include "data/PricePoint.h"
#include <QByteArray>
#include <QDate>
#include <QString>

/**
 * @brief Decoder for the TIME_SERIES_DAILY payload
 *
 * Expected shape:
 * @code
 * { "Meta Data": {...},
 *   "Time Series (Daily)": {
 *       "2024-01-02": { "1. open": "187.15", "2. high": "188.44",
 *                       "3. low": "183.89", "4. close": "185.64",
 *                       "5. volume": "82488674" }, ... } }
 * @endcode
 *
 * In-band provider messages are mapped onto error codes:
 *   "Error Message"                    -> NoData
 *   "Note" / "Information" with limit  -> RateLimited
 *   "Information" otherwise            -> ProviderUnavailable
 */
class AlphaVantageParser {
public:
    static constexpr const char* TIME_SERIES_KEY = "Time Series (Daily)";

    struct Result {
        MarketData::PriceSeries points;   // ascending by date
        MarketData::MarketDataError error;
    };

    /**
     * @brief Parse a full payload
     * @param ticker Used in messages only
     * @param since When valid, only points strictly after this date are kept
     */
    static Result parseDailySeries(const QByteArray& body, const QString& ticker,
                                   const QDate& since = QDate());

    static QString buildDailySeriesUrl(const QString& baseUrl, const QString& ticker,
                                       const QString& outputSize, const QString& apiKey);

    /// True for in-band or HTTP bodies that announce throttling
    static bool mentionsRateLimit(const QString& text);
};

#endif // ALPHA_VANTAGE_PARSER_H
