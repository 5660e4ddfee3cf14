#include "services/MarketDataService.h"
#include "quant/OptionChainGenerator.h"
#include "quant/PricingError.h"
#include "quant/VolatilityEstimator.h"
#include "services/Clock.h"
#include "services/PriceSeriesStore.h"
#include "services/RemoteBackfillClient.h"
#include <QDebug>
#include <QJsonObject>
#include <QMetaObject>
#include <QRegularExpression>

using MarketData::ErrorCode;
using MarketData::MarketDataError;

QJsonValue PriceSeriesResult::toJson() const
{
    if (error.isError()) {
        return error.toJson();
    }
    return MarketData::seriesToJson(series);
}

QJsonValue OptionChainResult::toJson() const
{
    if (error.isError()) {
        return error.toJson();
    }
    return snapshot.toJson();
}

MarketDataService::MarketDataService(PriceSeriesStore* store, RemoteBackfillClient* backfill,
                                     Clock* clock, const ServiceConfig& config, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_backfill(backfill)
    , m_clock(clock)
    , m_config(config)
{
}

MarketDataService::~MarketDataService()
{
    for (const auto& refresh : m_inFlight) {
        m_backfill->cancel(refresh->fetchHandle);
    }
    m_inFlight.clear();
    m_requests.clear();
}

QString MarketDataService::normalizeTicker(const QString& ticker)
{
    static const QRegularExpression pattern("^[A-Z0-9][A-Z0-9.\\-^]{0,14}$");
    const QString symbol = ticker.trimmed().toUpper();
    if (!pattern.match(symbol).hasMatch()) {
        return QString();
    }
    return symbol;
}

QStringList MarketDataService::listTickers()
{
    return m_store->listTickers();
}

QStringList MarketDataService::searchTickers(const QString& fragment)
{
    return m_store->searchTickers(fragment);
}

quint64 MarketDataService::requestPriceSeries(const QString& ticker, PriceSeriesCallback callback)
{
    const QString symbol = normalizeTicker(ticker);

    return enqueue(symbol.isEmpty() ? ticker : symbol, [this, symbol, callback](const Freshness& freshness) {
        PriceSeriesResult result;
        result.ticker = symbol;
        result.servedStale = freshness.servedStale;
        result.refreshed = freshness.refreshed;

        if (freshness.error.isError()) {
            result.error = freshness.error;
        } else {
            result.series = m_store->readAll(symbol);
            if (result.series.isEmpty()) {
                result.error = MarketDataError(ErrorCode::NoData,
                                               QString("No price data found for ticker %1").arg(symbol));
            }
        }

        if (callback) {
            callback(result);
        }
    });
}

quint64 MarketDataService::requestOptionChain(const QString& ticker, const QString& targetDate,
                                              OptionChainCallback callback)
{
    const QString symbol = normalizeTicker(ticker);

    return enqueue(symbol.isEmpty() ? ticker : symbol,
                   [this, symbol, targetDate, callback](const Freshness& freshness) {
        OptionChainResult result;
        if (freshness.error.isError()) {
            result.error = freshness.error;
            result.snapshot.ticker = symbol;
            result.snapshot.customDate = targetDate;
        } else {
            result = buildChain(symbol, targetDate);
            result.servedStale = freshness.servedStale;
        }

        if (callback) {
            callback(result);
        }
    });
}

quint64 MarketDataService::enqueue(const QString& ticker, Continuation continuation)
{
    const quint64 requestId = m_nextRequestId++;

    PendingRequest request;
    request.ticker = ticker;
    request.continuation = std::move(continuation);
    m_requests.insert(requestId, request);

    ensureFresh(requestId);
    return requestId;
}

void MarketDataService::ensureFresh(quint64 requestId)
{
    const QString ticker = m_requests.value(requestId).ticker;

    if (normalizeTicker(ticker) != ticker || ticker.isEmpty()) {
        Freshness freshness;
        freshness.error = MarketDataError(ErrorCode::InvalidInput,
                                          QString("Invalid ticker symbol \"%1\"").arg(ticker));
        resolve(requestId, freshness);
        return;
    }

    // Join a refresh already running for this ticker
    auto running = m_inFlight.find(ticker);
    if (running != m_inFlight.end()) {
        running.value()->waiters.append(requestId);
        qDebug() << "[MarketDataService] Joining in-flight refresh for" << ticker
                 << "waiters:" << running.value()->waiters.size();
        return;
    }

    const std::optional<QDate> latest = m_store->latestDate(ticker);
    if (!PriceSeriesStore::isStale(latest, m_clock->today(), m_config.staleAfterDays)) {
        qDebug() << "[MarketDataService] Serving" << ticker << "from store, latest"
                 << MarketData::dateToIso(*latest);
        resolve(requestId, Freshness());
        return;
    }

    startRefresh(ticker, latest);
    m_inFlight.value(ticker)->waiters.append(requestId);
}

void MarketDataService::startRefresh(const QString& ticker, const std::optional<QDate>& latest)
{
    auto refresh = std::make_shared<InFlightRefresh>();
    refresh->ticker = ticker;
    m_inFlight.insert(ticker, refresh);

    if (!latest) {
        qInfo() << "[MarketDataService] Ticker" << ticker << "not in store, fetching full history";
    } else if (latest->daysTo(m_clock->today()) > RemoteBackfillClient::COMPACT_WINDOW_DAYS) {
        // A compact fetch would not reach back to the stored rows
        qInfo() << "[MarketDataService] Data for" << ticker << "is" << latest->daysTo(m_clock->today())
                << "days old, refetching full history";
    } else {
        refresh->incremental = true;
        qInfo() << "[MarketDataService] Data for" << ticker << "is stale (latest"
                << MarketData::dateToIso(*latest) << "), updating";
    }

    emit refreshStarted(ticker, refresh->incremental);

    auto onResult = [this, refresh](const BackfillResult& result) { onRefreshFinished(refresh, result); };
    refresh->fetchHandle = refresh->incremental ? m_backfill->fetchIncremental(ticker, *latest, onResult)
                                                : m_backfill->fetchFull(ticker, onResult);
}

void MarketDataService::onRefreshFinished(const std::shared_ptr<InFlightRefresh>& refresh,
                                          const BackfillResult& result)
{
    // Dropped by cancel(), or superseded by a newer refresh
    if (m_inFlight.value(refresh->ticker) != refresh) {
        return;
    }
    m_inFlight.remove(refresh->ticker);

    Freshness freshness;
    freshness.error = result.error;

    if (result.success()) {
        freshness.refreshed = true;
        if (!result.points.isEmpty()) {
            const UpsertResult written = m_store->upsert(refresh->ticker, result.points);
            if (!written.ok()) {
                freshness.error = written.error;
            } else {
                qInfo() << "[MarketDataService] Stored" << written.written << "records for"
                        << refresh->ticker;
            }
        } else {
            qDebug() << "[MarketDataService] No new data for" << refresh->ticker;
        }
    }

    const bool success = !freshness.error.isError();
    if (!success && freshness.error.code != ErrorCode::Cancelled
        && m_config.serveStaleOnRefreshFailure && m_store->exists(refresh->ticker)) {
        qWarning() << "[MarketDataService] Refresh failed for" << refresh->ticker << "("
                   << freshness.error.message << "), serving stored data";
        freshness.error = MarketDataError();
        freshness.servedStale = true;
    }

    emit refreshFinished(refresh->ticker, success);

    for (quint64 requestId : refresh->waiters) {
        resolve(requestId, freshness);
    }
}

void MarketDataService::resolve(quint64 requestId, const Freshness& freshness)
{
    QMetaObject::invokeMethod(this, [this, requestId, freshness]() {
        auto it = m_requests.find(requestId);
        if (it == m_requests.end()) {
            return;   // cancelled
        }
        PendingRequest request = it.value();
        m_requests.erase(it);
        if (request.continuation) {
            request.continuation(freshness);
        }
    }, Qt::QueuedConnection);
}

void MarketDataService::cancel(quint64 requestId)
{
    auto it = m_requests.find(requestId);
    if (it == m_requests.end()) {
        return;
    }
    const QString ticker = it.value().ticker;
    m_requests.erase(it);

    qDebug() << "[MarketDataService] Request" << requestId << "for" << ticker << "cancelled";

    auto running = m_inFlight.find(ticker);
    if (running == m_inFlight.end()) {
        return;
    }
    std::shared_ptr<InFlightRefresh> refresh = running.value();
    refresh->waiters.removeAll(requestId);

    if (refresh->waiters.isEmpty()) {
        qDebug() << "[MarketDataService] No waiters left, cancelling fetch for" << ticker;
        m_inFlight.erase(running);
        m_backfill->cancel(refresh->fetchHandle);
    }
}

OptionChainResult MarketDataService::buildChain(const QString& ticker, const QString& targetDate)
{
    OptionChainResult result;
    result.snapshot.ticker = ticker;
    result.snapshot.customDate = targetDate;

    const QVector<double> closes = m_store->readRecentCloses(ticker, m_config.volatilityWindow + 1);
    if (closes.isEmpty()) {
        result.error = MarketDataError(ErrorCode::NoData,
                                       QString("No price data found for ticker %1").arg(ticker));
        return result;
    }

    const double spot = closes.last();
    const double volatility = VolatilityEstimator::clampForPricing(
        VolatilityEstimator::historicalVolatilityOr(closes, m_config.volatilityWindow,
                                                    m_config.defaultVolatility),
        m_config.volatilityFloor, m_config.volatilityCap);

    std::optional<QDate> target;
    if (!targetDate.trimmed().isEmpty()) {
        const QDate parsed = ExpiryLadderBuilder::parseTargetDate(targetDate);
        if (parsed.isValid()) {
            target = parsed;
        } else {
            qWarning() << "[MarketDataService] Ignoring unparseable target date" << targetDate;
        }
    }

    const StrikeLadder strikes = StrikeLadderBuilder::build(spot, m_config.strikeStep, m_config.strikeCount);
    const ExpiryLadder expiries = ExpiryLadderBuilder::build(m_clock->today(), target, m_config.expiries);

    try {
        OptionChainGenerator generator(m_config.minPremium);
        result.snapshot = generator.generate(ticker, spot, volatility, m_config.riskFreeRate,
                                             strikes, expiries);
        result.snapshot.customDate = targetDate;
    } catch (const PricingError& e) {
        qWarning() << "[MarketDataService] Chain generation failed for" << ticker << ":" << e.what();
        result.error = MarketDataError(e.code(), QString::fromStdString(e.what()));
    }

    return result;
}
