#ifndef PRICE_CSV_IMPORTER_H
#define PRICE_CSV_IMPORTER_H

#include "data/MarketDataError.h"
#include "data/PricePoint.h"
#include <QString>
#include <QStringList>

class PriceSeriesStore;

/**
 * @brief Summary of one CSV import
 */
struct ImportReport {
    QString ticker;
    int rowsRead = 0;
    int written = 0;
    int skipped = 0;
    MarketData::MarketDataError error;

    bool success() const { return !error.isError(); }
};

/**
 * @brief Seeds a PriceSeriesStore from a daily-price CSV export
 *
 * Columns are located by header name (case-insensitive):
 *   Date, Close/Last or Close, Open, High, Low, Volume
 * Dates may be MM/DD/YYYY or YYYY-MM-DD; prices may carry a leading '$'.
 * Rows that cannot be parsed are skipped and counted. All parsed rows are
 * written in one transaction.
 */
class PriceCsvImporter {
public:
    explicit PriceCsvImporter(PriceSeriesStore* store);

    /**
     * @brief Import a file
     * @param ticker Symbol to store under; derived from the file name when empty
     * @param replace Drop the ticker's existing rows first
     */
    ImportReport importFile(const QString& filePath, const QString& ticker = QString(),
                            bool replace = false);

    /**
     * @brief Parse CSV text without touching the store
     * @param skipped Incremented for every unusable data row
     */
    static MarketData::PriceSeries parse(const QString& content, int* rowsRead, int* skipped,
                                         MarketData::MarketDataError* error);

    /// "SPY-daily.csv" -> "SPY"
    static QString tickerFromFileName(const QString& filePath);

    static QDate parseDate(const QString& text);
    static bool parsePrice(const QString& text, double& out);

private:
    PriceSeriesStore* m_store;
};

#endif // PRICE_CSV_IMPORTER_H
