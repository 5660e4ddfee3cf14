#include "services/RemoteBackfillClient.h"
#include "api/AlphaVantageParser.h"
#include "services/Clock.h"
#include <QDebug>
#include <QMetaObject>

using MarketData::ErrorCode;
using MarketData::MarketDataError;

RemoteBackfillClient::RemoteBackfillClient(HttpTransport* transport, Clock* clock,
                                           const BackfillConfig& config, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_clock(clock)
    , m_config(config)
{
}

RemoteBackfillClient::~RemoteBackfillClient()
{
    for (const auto& job : m_jobs) {
        if (job->requestId != 0) {
            m_transport->cancel(job->requestId);
        }
        if (job->timerId != 0) {
            m_clock->cancel(job->timerId);
        }
    }
    m_jobs.clear();
}

bool RemoteBackfillClient::isUsableApiKey(const QString& apiKey)
{
    const QString key = apiKey.trimmed();
    return !key.isEmpty() && key != QLatin1String(PLACEHOLDER_API_KEY);
}

bool RemoteBackfillClient::hasCredential() const
{
    return isUsableApiKey(m_config.apiKey);
}

quint64 RemoteBackfillClient::fetchFull(const QString& ticker, Callback callback)
{
    return startJob(ticker, QDate(), false, std::move(callback));
}

quint64 RemoteBackfillClient::fetchIncremental(const QString& ticker, const QDate& since, Callback callback)
{
    return startJob(ticker, since, true, std::move(callback));
}

quint64 RemoteBackfillClient::startJob(const QString& ticker, const QDate& since, bool incremental,
                                       Callback callback)
{
    auto job = std::make_shared<Job>();
    job->id = m_nextJobId++;
    job->ticker = ticker;
    job->since = since;
    job->incremental = incremental;
    job->callback = std::move(callback);
    m_jobs.insert(job->id, job);

    const quint64 jobId = job->id;

    if (!hasCredential()) {
        qWarning() << "[RemoteBackfillClient] API key not set; cannot fetch" << ticker;
        BackfillResult result;
        result.ticker = ticker;
        result.incremental = incremental;
        result.error = MarketDataError(ErrorCode::ProviderUnavailable,
                                       "Alpha Vantage API key not set. Configure api_key in [PROVIDER] "
                                       "or ALPHA_VANTAGE_API_KEY.");
        QMetaObject::invokeMethod(
            this, [this, jobId, result]() { finish(jobId, result); }, Qt::QueuedConnection);
        return jobId;
    }

    qInfo() << "[RemoteBackfillClient] Fetching" << (incremental ? "incremental" : "full")
            << "history for" << ticker
            << (incremental ? "since " + MarketData::dateToIso(since) : QString());

    QMetaObject::invokeMethod(this, [this, jobId]() { startAttempt(jobId); }, Qt::QueuedConnection);
    return jobId;
}

void RemoteBackfillClient::startAttempt(quint64 jobId)
{
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return;
    }
    std::shared_ptr<Job> job = it.value();
    if (job->cancelled) {
        return;
    }
    job->timerId = 0;
    job->attempts++;

    const QString url = AlphaVantageParser::buildDailySeriesUrl(
        m_config.baseUrl, job->ticker, job->incremental ? "compact" : "full", m_config.apiKey);

    qDebug() << "[RemoteBackfillClient] Attempt" << job->attempts << "for" << job->ticker;

    job->requestId = m_transport->get(url, m_config.timeoutMs, [this, jobId](const HttpResponse& response) {
        handleResponse(jobId, response);
    });
}

MarketDataError RemoteBackfillClient::classifyResponse(const HttpResponse& response, const QString& ticker)
{
    if (response.cancelled) {
        return MarketDataError(ErrorCode::Cancelled, QString("Fetch for %1 cancelled").arg(ticker));
    }
    if (response.timedOut) {
        return MarketDataError(ErrorCode::ProviderUnavailable,
                               QString("Request for %1 timed out").arg(ticker));
    }
    if (!response.error.isEmpty() && response.statusCode == 0) {
        return MarketDataError(ErrorCode::ProviderUnavailable,
                               QString("Network error for %1: %2").arg(ticker, response.error));
    }
    if (response.statusCode == 429) {
        return MarketDataError(ErrorCode::RateLimited,
                               QString("Provider returned HTTP 429 for %1").arg(ticker));
    }
    if (response.statusCode < 200 || response.statusCode >= 300) {
        const QString body = QString::fromUtf8(response.body.left(512));
        if (AlphaVantageParser::mentionsRateLimit(body)) {
            return MarketDataError(ErrorCode::RateLimited,
                                   QString("Provider rate limit (HTTP %1) for %2")
                                       .arg(response.statusCode).arg(ticker));
        }
        return MarketDataError(ErrorCode::ProviderUnavailable,
                               QString("Provider returned HTTP %1 for %2")
                                   .arg(response.statusCode).arg(ticker));
    }
    return MarketDataError();
}

void RemoteBackfillClient::handleResponse(quint64 jobId, const HttpResponse& response)
{
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return;
    }
    std::shared_ptr<Job> job = it.value();
    if (job->cancelled) {
        return;
    }
    job->requestId = 0;

    BackfillResult result;
    result.ticker = job->ticker;
    result.incremental = job->incremental;
    result.attempts = job->attempts;

    result.error = classifyResponse(response, job->ticker);
    if (!result.error.isError()) {
        AlphaVantageParser::Result parsed =
            AlphaVantageParser::parseDailySeries(response.body, job->ticker, job->since);
        result.error = parsed.error;
        result.points = parsed.points;
    }

    if (result.error.isError() && m_config.retry.shouldRetry(result.error, job->retries)) {
        const int delayMs = m_config.retry.delayForRetry(job->retries, result.error);
        job->retries++;
        qWarning().noquote() << QString("[RemoteBackfillClient] %1: %2. Retry %3/%4 in %5 ms")
                                    .arg(job->ticker, result.error.message)
                                    .arg(job->retries)
                                    .arg(m_config.retry.maxRetries)
                                    .arg(delayMs);
        emit retryScheduled(job->ticker, job->retries, delayMs,
                            MarketData::errorCodeToString(result.error.code));
        job->timerId = m_clock->schedule(delayMs, [this, jobId]() { startAttempt(jobId); });
        return;
    }

    finish(jobId, result);
}

void RemoteBackfillClient::finish(quint64 jobId, BackfillResult result)
{
    std::shared_ptr<Job> job = m_jobs.take(jobId);
    if (!job) {
        return;
    }
    result.attempts = job->attempts;
    if (job->cancelled) {
        result.points.clear();
        result.error = MarketDataError(ErrorCode::Cancelled,
                                       QString("Fetch for %1 cancelled").arg(job->ticker));
    }

    if (result.success()) {
        qInfo() << "[RemoteBackfillClient] Retrieved" << result.points.size() << "days of price data for"
                << job->ticker << "in" << result.attempts << "attempt(s)";
    } else if (result.error.code != ErrorCode::Cancelled) {
        qWarning() << "[RemoteBackfillClient] Fetch failed for" << job->ticker << ":"
                   << result.error.message;
    }

    emit fetchFinished(job->ticker, result.success(), result.attempts);
    if (job->callback) {
        job->callback(result);
    }
}

void RemoteBackfillClient::cancel(quint64 handle)
{
    auto it = m_jobs.find(handle);
    if (it == m_jobs.end()) {
        return;
    }
    std::shared_ptr<Job> job = it.value();
    if (job->cancelled) {
        return;
    }
    job->cancelled = true;

    if (job->requestId != 0) {
        m_transport->cancel(job->requestId);
        job->requestId = 0;
    }
    if (job->timerId != 0) {
        m_clock->cancel(job->timerId);
        job->timerId = 0;
    }

    qDebug() << "[RemoteBackfillClient] Cancelled fetch for" << job->ticker;

    BackfillResult result;
    result.ticker = job->ticker;
    result.incremental = job->incremental;
    result.error = MarketDataError(ErrorCode::Cancelled,
                                   QString("Fetch for %1 cancelled").arg(job->ticker));
    QMetaObject::invokeMethod(
        this, [this, handle, result]() { finish(handle, result); }, Qt::QueuedConnection);
}
