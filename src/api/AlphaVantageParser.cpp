#include "api/AlphaVantageParser.h"
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUrl>
#include <QUrlQuery>
#include <algorithm>
#include <cmath>
#include <limits>

using MarketData::ErrorCode;
using MarketData::MarketDataError;
using MarketData::PricePoint;

namespace {

bool readNumber(const QJsonObject& bar, const char* key, double& out)
{
    const QJsonValue value = bar.value(QLatin1String(key));
    bool ok = false;
    if (value.isString()) {
        out = value.toString().trimmed().toDouble(&ok);
    } else if (value.isDouble()) {
        out = value.toDouble();
        ok = true;
    }
    // toDouble() accepts "nan" and "inf"
    return ok && std::isfinite(out);
}

} // namespace

bool AlphaVantageParser::mentionsRateLimit(const QString& text)
{
    return text.contains("limit", Qt::CaseInsensitive)
           || text.contains("call frequency", Qt::CaseInsensitive);
}

QString AlphaVantageParser::buildDailySeriesUrl(const QString& baseUrl, const QString& ticker,
                                                const QString& outputSize, const QString& apiKey)
{
    QUrl url(baseUrl);
    QUrlQuery query;
    query.addQueryItem("function", "TIME_SERIES_DAILY");
    query.addQueryItem("symbol", ticker);
    query.addQueryItem("outputsize", outputSize);
    query.addQueryItem("apikey", apiKey);
    url.setQuery(query);
    return url.toString(QUrl::FullyEncoded);
}

AlphaVantageParser::Result AlphaVantageParser::parseDailySeries(const QByteArray& body,
                                                                const QString& ticker,
                                                                const QDate& since)
{
    Result result;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = MarketDataError(ErrorCode::MalformedProviderResponse,
                                       QString("Invalid JSON for %1: %2")
                                           .arg(ticker, parseError.errorString()));
        return result;
    }

    const QJsonObject root = doc.object();

    if (root.contains("Error Message")) {
        result.error = MarketDataError(ErrorCode::NoData,
                                       QString("No data found for ticker \"%1\": %2")
                                           .arg(ticker, root.value("Error Message").toString()));
        return result;
    }

    for (const char* key : {"Note", "Information"}) {
        if (!root.contains(QLatin1String(key))) continue;
        const QString text = root.value(QLatin1String(key)).toString();
        if (mentionsRateLimit(text)) {
            result.error = MarketDataError(ErrorCode::RateLimited,
                                           QString("Provider rate limit reached: %1").arg(text));
        } else {
            result.error = MarketDataError(ErrorCode::ProviderUnavailable,
                                           QString("Provider message: %1").arg(text));
        }
        return result;
    }

    const QJsonValue seriesValue = root.value(QLatin1String(TIME_SERIES_KEY));
    if (!seriesValue.isObject()) {
        result.error = MarketDataError(ErrorCode::MalformedProviderResponse,
                                       QString("Missing \"%1\" for %2").arg(QLatin1String(TIME_SERIES_KEY), ticker));
        return result;
    }

    const QJsonObject series = seriesValue.toObject();
    if (series.isEmpty()) {
        result.error = MarketDataError(ErrorCode::NoData,
                                       QString("No data found for ticker \"%1\"").arg(ticker));
        return result;
    }

    result.points.reserve(series.size());
    for (auto it = series.constBegin(); it != series.constEnd(); ++it) {
        const QDate date = MarketData::dateFromIso(it.key());
        if (!date.isValid() || !it.value().isObject()) {
            result.points.clear();
            result.error = MarketDataError(ErrorCode::MalformedProviderResponse,
                                           QString("Bad entry \"%1\" for %2").arg(it.key(), ticker));
            return result;
        }

        const QJsonObject bar = it.value().toObject();
        double open = 0, high = 0, low = 0, close = 0, volume = 0;
        if (!readNumber(bar, "1. open", open) || !readNumber(bar, "2. high", high)
            || !readNumber(bar, "3. low", low) || !readNumber(bar, "4. close", close)
            || !readNumber(bar, "5. volume", volume)
            || std::fabs(volume) >= static_cast<double>(std::numeric_limits<qint64>::max())) {
            result.points.clear();
            result.error = MarketDataError(ErrorCode::MalformedProviderResponse,
                                           QString("Missing OHLCV field on %1 for %2")
                                               .arg(it.key(), ticker));
            return result;
        }

        if (since.isValid() && date <= since) {
            continue;
        }

        PricePoint point(date, open, high, low, close, static_cast<qint64>(volume));
        if (!point.isValid()) {
            qWarning() << "[AlphaVantageParser] Skipping invalid bar" << it.key() << "for" << ticker;
            continue;
        }
        result.points.append(point);
    }

    std::sort(result.points.begin(), result.points.end(),
              [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });

    qDebug() << "[AlphaVantageParser] Parsed" << result.points.size() << "bars for" << ticker
             << (since.isValid() ? "after " + MarketData::dateToIso(since) : QString());
    return result;
}
