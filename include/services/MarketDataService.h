#ifndef MARKET_DATA_SERVICE_H
#define MARKET_DATA_SERVICE_H

#include "data/MarketDataError.h"
#include "data/OptionChain.h"
#include "data/PricePoint.h"
#include "quant/LadderBuilder.h"
#include <QHash>
#include <QDate>
#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include <optional>

class Clock;
class PriceSeriesStore;
class RemoteBackfillClient;
struct BackfillResult;

/**
 * @brief Pricing and freshness parameters of MarketDataService
 */
struct ServiceConfig {
    int staleAfterDays = 7;
    double riskFreeRate = 0.035;
    double strikeStep = 5.0;
    int strikeCount = 10;
    ExpiryLadder expiries = ExpiryLadderBuilder::defaultLadder();
    int volatilityWindow = 30;
    double defaultVolatility = 0.30;
    double volatilityFloor = 0.10;
    double volatilityCap = 0.80;
    double minPremium = 0.01;
    bool serveStaleOnRefreshFailure = true;
};

struct PriceSeriesResult {
    QString ticker;
    MarketData::PriceSeries series;
    MarketData::MarketDataError error;
    bool servedStale = false;   // refresh failed, stored rows returned anyway
    bool refreshed = false;     // a remote fetch completed for this request

    bool success() const { return !error.isError(); }

    /// Chart array on success, error object otherwise
    QJsonValue toJson() const;
};

struct OptionChainResult {
    MarketData::OptionChainSnapshot snapshot;
    MarketData::MarketDataError error;
    bool servedStale = false;

    bool success() const { return !error.isError(); }
    QJsonValue toJson() const;
};

/**
 * @brief Request pipeline behind the price-series and option-chain lookups
 *
 * Each request first checks freshness in the store. A ticker with no rows, or
 * whose latest row is older than staleAfterDays, is (re)populated from the
 * provider: a full fetch when nothing is stored or the latest row is older
 * than the compact window (RemoteBackfillClient::COMPACT_WINDOW_DAYS), an
 * incremental one otherwise.
 * Concurrent requests for the same ticker share a single fetch.
 *
 * When a refresh fails but rows exist and serveStaleOnRefreshFailure is set,
 * the stored rows are served and the result is flagged servedStale. With no
 * rows the refresh error is reported.
 *
 * Results are delivered from the event loop. A cancelled request never gets
 * its callback; when the last request waiting on a fetch is cancelled the
 * fetch itself is cancelled.
 */
class MarketDataService : public QObject {
    Q_OBJECT

public:
    using PriceSeriesCallback = std::function<void(const PriceSeriesResult&)>;
    using OptionChainCallback = std::function<void(const OptionChainResult&)>;

    MarketDataService(PriceSeriesStore* store, RemoteBackfillClient* backfill, Clock* clock,
                      const ServiceConfig& config = ServiceConfig(), QObject* parent = nullptr);
    ~MarketDataService() override;

    /**
     * @brief Ordered OHLCV series for ticker
     * @return Request id for cancel()
     */
    quint64 requestPriceSeries(const QString& ticker, PriceSeriesCallback callback);

    /**
     * @brief Option chain for ticker
     * @param targetDate Optional expiry override (yyyy-MM-dd, ddMMMyyyy or dd-MMM-yyyy);
     *                   echoed back as given
     */
    quint64 requestOptionChain(const QString& ticker, const QString& targetDate,
                               OptionChainCallback callback);

    void cancel(quint64 requestId);

    QStringList listTickers();
    QStringList searchTickers(const QString& fragment);

    /**
     * @brief Price a chain from the rows currently stored, without refreshing
     */
    OptionChainResult buildChain(const QString& ticker, const QString& targetDate);

    int pendingRequestCount() const { return m_requests.size(); }
    int inFlightRefreshCount() const { return m_inFlight.size(); }
    const ServiceConfig& config() const { return m_config; }

    /// Trimmed, upper-cased symbol; empty when it contains unsupported characters
    static QString normalizeTicker(const QString& ticker);

signals:
    void refreshStarted(const QString& ticker, bool incremental);
    void refreshFinished(const QString& ticker, bool success);

private:
    /// What the freshness step decided for one request
    struct Freshness {
        MarketData::MarketDataError error;
        bool servedStale = false;
        bool refreshed = false;
    };
    using Continuation = std::function<void(const Freshness&)>;

    struct PendingRequest {
        QString ticker;
        Continuation continuation;
    };

    struct InFlightRefresh {
        QString ticker;
        quint64 fetchHandle = 0;
        bool incremental = false;
        QVector<quint64> waiters;
    };

    quint64 enqueue(const QString& ticker, Continuation continuation);
    void ensureFresh(quint64 requestId);
    void startRefresh(const QString& ticker, const std::optional<QDate>& latest);
    void onRefreshFinished(const std::shared_ptr<InFlightRefresh>& refresh, const BackfillResult& result);
    void resolve(quint64 requestId, const Freshness& freshness);

    PriceSeriesStore* m_store;
    RemoteBackfillClient* m_backfill;
    Clock* m_clock;
    ServiceConfig m_config;

    QHash<quint64, PendingRequest> m_requests;
    QHash<QString, std::shared_ptr<InFlightRefresh>> m_inFlight;
    quint64 m_nextRequestId = 1;
};

#endif // MARKET_DATA_SERVICE_H
