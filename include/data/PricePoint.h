#ifndef PRICEPOINT_H
#define PRICEPOINT_H

#include <QDate>
#include <QJsonArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

namespace MarketData {

/**
 * @brief One daily OHLCV bar for a ticker
 *
 * The date is the natural key together with the ticker. Prices and volume are
 * non-negative; close must be strictly positive to take part in volatility math.
 */
struct PricePoint {
    QDate date;
    double open;
    double high;
    double low;
    double close;
    qint64 volume;

    PricePoint()
        : open(0), high(0), low(0), close(0), volume(0) {}

    PricePoint(const QDate& d, double o, double h, double l, double c, qint64 v = 0)
        : date(d), open(o), high(h), low(l), close(c), volume(v) {}

    bool isValid() const {
        return date.isValid() && open >= 0 && high >= 0 && low >= 0
               && close > 0 && volume >= 0;
    }

    bool operator==(const PricePoint& other) const {
        return date == other.date && open == other.open && high == other.high
               && low == other.low && close == other.close && volume == other.volume;
    }

    /**
     * @brief Chart payload: time is the unix timestamp of the date at 00:00 UTC
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["time"] = static_cast<double>(QDate(1970, 1, 1).daysTo(date) * 86400);
        obj["open"] = open;
        obj["high"] = high;
        obj["low"] = low;
        obj["close"] = close;
        obj["volume"] = static_cast<double>(volume);
        return obj;
    }
};

/// Ascending by date, one point per date
using PriceSeries = QVector<PricePoint>;

inline QJsonArray seriesToJson(const PriceSeries& series) {
    QJsonArray arr;
    for (const auto& point : series) {
        arr.append(point.toJson());
    }
    return arr;
}

/// Storage and wire format for dates
inline QString dateToIso(const QDate& date) {
    return date.toString("yyyy-MM-dd");
}

inline QDate dateFromIso(const QString& text) {
    return QDate::fromString(text.left(10), "yyyy-MM-dd");
}

} // namespace MarketData

Q_DECLARE_METATYPE(MarketData::PricePoint)

#endif // PRICEPOINT_H
