#ifndef REMOTE_BACKFILL_CLIENT_H
#define REMOTE_BACKFILL_CLIENT_H

#include "api/HttpTransport.h"
#include "data/MarketDataError.h"
#include "data/PricePoint.h"
#include "services/RetryPolicy.h"
#include <QDate>
#include <QHash>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>

class Clock;

/**
 * @brief Provider settings for RemoteBackfillClient
 */
struct BackfillConfig {
    QString apiKey;
    QString baseUrl = "https://www.alphavantage.co/query";
    int timeoutMs = 10000;
    RetryPolicy retry;
};

/**
 * @brief Outcome of one fetch, including every retry it took
 */
struct BackfillResult {
    QString ticker;
    MarketData::PriceSeries points;   // ascending; only dates after `since` for incremental
    MarketData::MarketDataError error;
    int attempts = 0;
    bool incremental = false;

    bool success() const { return !error.isError(); }
};

/**
 * @brief Fetches daily history from the remote provider with retry/backoff
 *
 * A fetch makes at most 1 + maxRetries requests. Retryable failures
 * (ProviderUnavailable, RateLimited) wait delayForRetry() on the Clock before
 * the next attempt; terminal failures (NoData, MalformedProviderResponse, a
 * missing credential) are reported at once. When retries run out the last
 * error is reported.
 *
 * Callbacks always run from the event loop, never inside fetchFull() or
 * fetchIncremental().
 */
class RemoteBackfillClient : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const BackfillResult&)>;

    static constexpr const char* PLACEHOLDER_API_KEY = "your_api_key_here";

    /// outputsize=compact returns the latest 100 trading days, which always
    /// spans at least this many calendar days
    static constexpr int COMPACT_WINDOW_DAYS = 100;

    RemoteBackfillClient(HttpTransport* transport, Clock* clock,
                         const BackfillConfig& config, QObject* parent = nullptr);
    ~RemoteBackfillClient() override;

    /**
     * @brief Fetch the complete available history (outputsize=full)
     * @return Handle for cancel()
     */
    quint64 fetchFull(const QString& ticker, Callback callback);

    /**
     * @brief Fetch recent history (outputsize=compact), keeping dates after since
     *
     * Only gap-free when since is within COMPACT_WINDOW_DAYS of today; older
     * stores need fetchFull().
     */
    quint64 fetchIncremental(const QString& ticker, const QDate& since, Callback callback);

    /**
     * @brief Abort the in-flight request or pending backoff
     *
     * The callback is invoked once with a Cancelled error.
     */
    void cancel(quint64 handle);

    bool hasCredential() const;
    int pendingCount() const { return m_jobs.size(); }
    const BackfillConfig& config() const { return m_config; }

    static bool isUsableApiKey(const QString& apiKey);

    /**
     * @brief Map a transport outcome onto an error (None for a 2xx response)
     */
    static MarketData::MarketDataError classifyResponse(const HttpResponse& response,
                                                        const QString& ticker);

signals:
    void retryScheduled(const QString& ticker, int retryNumber, int delayMs, const QString& reason);
    void fetchFinished(const QString& ticker, bool success, int attempts);

private:
    struct Job {
        quint64 id = 0;
        QString ticker;
        QDate since;
        bool incremental = false;
        Callback callback;
        int attempts = 0;
        int retries = 0;
        quint64 requestId = 0;
        quint64 timerId = 0;
        bool cancelled = false;
    };

    quint64 startJob(const QString& ticker, const QDate& since, bool incremental, Callback callback);
    void startAttempt(quint64 jobId);
    void handleResponse(quint64 jobId, const HttpResponse& response);
    void finish(quint64 jobId, BackfillResult result);

    HttpTransport* m_transport;
    Clock* m_clock;
    BackfillConfig m_config;
    QHash<quint64, std::shared_ptr<Job>> m_jobs;
    quint64 m_nextJobId = 1;
};

#endif // REMOTE_BACKFILL_CLIENT_H
