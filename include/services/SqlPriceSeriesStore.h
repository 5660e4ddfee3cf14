#ifndef SQL_PRICE_SERIES_STORE_H
#define SQL_PRICE_SERIES_STORE_H

#include "services/PriceSeriesStore.h"
#include <QSqlDatabase>
#include <QString>

/**
 * @brief SQLite-backed PriceSeriesStore (Qt Sql, QSQLITE driver)
 *
 * Database Schema:
 * - stock_prices: one row per (ticker, date), date stored as yyyy-MM-dd text
 * - idx_stock_date: (ticker, date) lookup index
 *
 * Each instance owns its own named connection, so several stores (or a test
 * using ":memory:") can coexist in one process. All access happens on the
 * thread that called initialize().
 *
 * Usage:
 * ```cpp
 * SqlPriceSeriesStore store;
 * store.initialize("data/stock_data.db");
 * store.upsert("AAPL", points);
 * auto closes = store.readRecentCloses("AAPL", 31);
 * ```
 */
class SqlPriceSeriesStore : public PriceSeriesStore {
public:
    SqlPriceSeriesStore();
    ~SqlPriceSeriesStore() override;

    SqlPriceSeriesStore(const SqlPriceSeriesStore&) = delete;
    SqlPriceSeriesStore& operator=(const SqlPriceSeriesStore&) = delete;

    /**
     * @brief Open (creating if needed) the database and its schema
     * @param dbPath File path, or ":memory:" for a private in-memory database
     * @return true if initialized successfully
     */
    bool initialize(const QString& dbPath);

    bool isInitialized() const { return m_initialized; }
    QString databasePath() const { return m_dbPath; }

    bool exists(const QString& ticker) override;
    std::optional<QDate> latestDate(const QString& ticker) override;
    MarketData::PriceSeries readAll(const QString& ticker) override;
    QVector<double> readRecentCloses(const QString& ticker, int limit) override;
    UpsertResult upsert(const QString& ticker, const MarketData::PriceSeries& points) override;
    UpsertResult replaceSeries(const QString& ticker, const MarketData::PriceSeries& points) override;
    int removeTicker(const QString& ticker) override;
    QStringList listTickers() override;
    QStringList searchTickers(const QString& fragment) override;
    QString lastError() const override { return m_lastError; }

    /// Total rows across all tickers
    int rowCount();

private:
    bool createTables();
    UpsertResult writeBatch(const QString& ticker, const MarketData::PriceSeries& points,
                            bool replaceExisting);
    UpsertResult fail(const QString& message);

    QSqlDatabase m_db;
    QString m_connectionName;
    QString m_dbPath;
    QString m_lastError;
    bool m_initialized = false;
};

#endif // SQL_PRICE_SERIES_STORE_H
