#ifndef PRICE_SERIES_STORE_H
#define PRICE_SERIES_STORE_H

#include "data/MarketDataError.h"
#include "data/PricePoint.h"
#include <QDate>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

/**
 * @brief Outcome of a batched write
 */
struct UpsertResult {
    int written = 0;
    MarketData::MarketDataError error;    // StorageFailure when the batch was rolled back

    bool ok() const { return !error.isError(); }
};

/**
 * @brief Durable daily OHLCV history keyed by (ticker, date)
 *
 * Reads return ascending dates. Writes are all-or-nothing: a batch that fails
 * part way leaves the stored series exactly as it was.
 */
class PriceSeriesStore {
public:
    static constexpr int DEFAULT_STALE_AFTER_DAYS = 7;

    virtual ~PriceSeriesStore() = default;

    virtual bool exists(const QString& ticker) = 0;

    /// Most recent stored date, or nullopt when the ticker has no rows
    virtual std::optional<QDate> latestDate(const QString& ticker) = 0;

    virtual MarketData::PriceSeries readAll(const QString& ticker) = 0;

    /**
     * @brief Closing prices of the last `limit` rows, oldest first
     */
    virtual QVector<double> readRecentCloses(const QString& ticker, int limit) = 0;

    /**
     * @brief Insert or overwrite points by date in one transaction
     */
    virtual UpsertResult upsert(const QString& ticker, const MarketData::PriceSeries& points) = 0;

    /**
     * @brief Delete every row of ticker and insert points, atomically
     */
    virtual UpsertResult replaceSeries(const QString& ticker, const MarketData::PriceSeries& points) = 0;

    /// @return Number of rows removed, -1 on failure
    virtual int removeTicker(const QString& ticker) = 0;

    virtual QStringList listTickers() = 0;

    /// Case-insensitive substring match on ticker symbols
    virtual QStringList searchTickers(const QString& fragment) = 0;

    virtual QString lastError() const = 0;

    /**
     * @brief Freshness rule shared by every store
     *
     * Stale when there is no latest date or when today - latest exceeds
     * maxAgeDays.
     */
    static bool isStale(const std::optional<QDate>& latest, const QDate& today,
                        int maxAgeDays = DEFAULT_STALE_AFTER_DAYS);
};

#endif // PRICE_SERIES_STORE_H
