#include "services/SqlPriceSeriesStore.h"
#include <QAtomicInt>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>

using MarketData::ErrorCode;
using MarketData::MarketDataError;
using MarketData::PricePoint;
using MarketData::PriceSeries;

namespace {
QAtomicInt s_connectionCounter(0);
}

SqlPriceSeriesStore::SqlPriceSeriesStore()
    : m_connectionName(QString("price_store_%1").arg(s_connectionCounter.fetchAndAddRelaxed(1)))
{
}

SqlPriceSeriesStore::~SqlPriceSeriesStore()
{
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db = QSqlDatabase();
    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool SqlPriceSeriesStore::initialize(const QString& dbPath)
{
    if (m_initialized) {
        qWarning() << "[SqlPriceSeriesStore] Already initialized";
        return true;
    }

    m_dbPath = dbPath;
    if (m_dbPath != ":memory:") {
        const QString dir = QFileInfo(m_dbPath).absolutePath();
        if (!QDir().mkpath(dir)) {
            m_lastError = QString("Cannot create directory %1").arg(dir);
            qCritical() << "[SqlPriceSeriesStore]" << m_lastError;
            return false;
        }
    }

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(m_dbPath);

    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        qCritical() << "[SqlPriceSeriesStore] Failed to open database:" << m_lastError;
        return false;
    }

    qDebug() << "[SqlPriceSeriesStore] Database opened:" << m_dbPath;

    if (!createTables()) {
        qCritical() << "[SqlPriceSeriesStore] Failed to create tables";
        return false;
    }

    m_initialized = true;
    qDebug() << "[SqlPriceSeriesStore] Initialized successfully";
    return true;
}

bool SqlPriceSeriesStore::createTables()
{
    QSqlQuery query(m_db);

    QString createPrices = R"(
        CREATE TABLE IF NOT EXISTS stock_prices (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ticker TEXT NOT NULL,
            date TEXT NOT NULL,
            open REAL NOT NULL CHECK (open >= 0),
            high REAL NOT NULL CHECK (high >= 0),
            low REAL NOT NULL CHECK (low >= 0),
            close REAL NOT NULL CHECK (close >= 0),
            volume INTEGER NOT NULL DEFAULT 0 CHECK (volume >= 0),
            UNIQUE(ticker, date)
        )
    )";

    if (!query.exec(createPrices)) {
        m_lastError = query.lastError().text();
        qCritical() << "[SqlPriceSeriesStore] Failed to create stock_prices table:" << m_lastError;
        return false;
    }

    QString createIndex = R"(
        CREATE INDEX IF NOT EXISTS idx_stock_date
        ON stock_prices(ticker, date)
    )";

    if (!query.exec(createIndex)) {
        qWarning() << "[SqlPriceSeriesStore] Failed to create index:" << query.lastError().text();
    }

    return true;
}

bool SqlPriceSeriesStore::exists(const QString& ticker)
{
    return latestDate(ticker).has_value();
}

std::optional<QDate> SqlPriceSeriesStore::latestDate(const QString& ticker)
{
    if (!m_initialized) {
        return std::nullopt;
    }

    QSqlQuery query(m_db);
    query.prepare("SELECT MAX(date) FROM stock_prices WHERE ticker = ?");
    query.addBindValue(ticker);

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] latestDate failed:" << m_lastError;
        return std::nullopt;
    }

    if (query.next() && !query.value(0).isNull()) {
        const QDate date = MarketData::dateFromIso(query.value(0).toString());
        if (date.isValid()) {
            return date;
        }
    }
    return std::nullopt;
}

PriceSeries SqlPriceSeriesStore::readAll(const QString& ticker)
{
    PriceSeries result;
    if (!m_initialized) {
        return result;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        SELECT date, open, high, low, close, volume
        FROM stock_prices
        WHERE ticker = ?
        ORDER BY date ASC
    )");
    query.addBindValue(ticker);

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] readAll failed:" << m_lastError;
        return result;
    }

    while (query.next()) {
        result.append(PricePoint(MarketData::dateFromIso(query.value(0).toString()),
                                 query.value(1).toDouble(),
                                 query.value(2).toDouble(),
                                 query.value(3).toDouble(),
                                 query.value(4).toDouble(),
                                 query.value(5).toLongLong()));
    }

    return result;
}

QVector<double> SqlPriceSeriesStore::readRecentCloses(const QString& ticker, int limit)
{
    QVector<double> closes;
    if (!m_initialized || limit <= 0) {
        return closes;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        SELECT close FROM stock_prices
        WHERE ticker = ?
        ORDER BY date DESC
        LIMIT ?
    )");
    query.addBindValue(ticker);
    query.addBindValue(limit);

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] readRecentCloses failed:" << m_lastError;
        return closes;
    }

    while (query.next()) {
        closes.prepend(query.value(0).toDouble());
    }
    return closes;
}

UpsertResult SqlPriceSeriesStore::upsert(const QString& ticker, const PriceSeries& points)
{
    return writeBatch(ticker, points, false);
}

UpsertResult SqlPriceSeriesStore::replaceSeries(const QString& ticker, const PriceSeries& points)
{
    return writeBatch(ticker, points, true);
}

UpsertResult SqlPriceSeriesStore::fail(const QString& message)
{
    m_lastError = message;
    qWarning() << "[SqlPriceSeriesStore]" << message;
    UpsertResult result;
    result.error = MarketDataError(ErrorCode::StorageFailure, message);
    return result;
}

UpsertResult SqlPriceSeriesStore::writeBatch(const QString& ticker, const PriceSeries& points,
                                             bool replaceExisting)
{
    if (!m_initialized) {
        return fail("Store not initialized");
    }

    UpsertResult result;
    if (points.isEmpty() && !replaceExisting) {
        return result;
    }

    if (!m_db.transaction()) {
        return fail(QString("Cannot begin transaction: %1").arg(m_db.lastError().text()));
    }

    QSqlQuery query(m_db);

    if (replaceExisting) {
        query.prepare("DELETE FROM stock_prices WHERE ticker = ?");
        query.addBindValue(ticker);
        if (!query.exec()) {
            const QString message = QString("Delete failed for %1: %2")
                                        .arg(ticker, query.lastError().text());
            m_db.rollback();
            return fail(message);
        }
    }

    query.prepare(R"(
        INSERT OR REPLACE INTO stock_prices
        (ticker, date, open, high, low, close, volume)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )");

    for (const auto& point : points) {
        if (!point.date.isValid()) {
            m_db.rollback();
            return fail(QString("Invalid date in batch for %1").arg(ticker));
        }

        query.addBindValue(ticker);
        query.addBindValue(MarketData::dateToIso(point.date));
        query.addBindValue(point.open);
        query.addBindValue(point.high);
        query.addBindValue(point.low);
        query.addBindValue(point.close);
        query.addBindValue(point.volume);

        if (!query.exec()) {
            const QString message = QString("Insert failed for %1 on %2: %3")
                                        .arg(ticker, MarketData::dateToIso(point.date),
                                             query.lastError().text());
            m_db.rollback();
            return fail(message);
        }
        ++result.written;
    }

    if (!m_db.commit()) {
        const QString message = QString("Commit failed for %1: %2").arg(ticker, m_db.lastError().text());
        m_db.rollback();
        return fail(message);
    }

    qDebug() << "[SqlPriceSeriesStore] Saved batch:" << result.written << "rows for" << ticker
             << (replaceExisting ? "(replaced)" : "");
    return result;
}

int SqlPriceSeriesStore::removeTicker(const QString& ticker)
{
    if (!m_initialized) {
        return -1;
    }

    QSqlQuery query(m_db);
    query.prepare("DELETE FROM stock_prices WHERE ticker = ?");
    query.addBindValue(ticker);

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] removeTicker failed:" << m_lastError;
        return -1;
    }

    const int removed = query.numRowsAffected();
    qDebug() << "[SqlPriceSeriesStore] Removed" << removed << "rows for" << ticker;
    return removed;
}

QStringList SqlPriceSeriesStore::listTickers()
{
    QStringList tickers;
    if (!m_initialized) {
        return tickers;
    }

    QSqlQuery query(m_db);
    if (!query.exec("SELECT DISTINCT ticker FROM stock_prices ORDER BY ticker")) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] listTickers failed:" << m_lastError;
        return tickers;
    }

    while (query.next()) {
        tickers.append(query.value(0).toString());
    }
    return tickers;
}

QStringList SqlPriceSeriesStore::searchTickers(const QString& fragment)
{
    QStringList tickers;
    if (!m_initialized) {
        return tickers;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        SELECT DISTINCT ticker FROM stock_prices
        WHERE UPPER(ticker) LIKE ?
        ORDER BY ticker
    )");
    query.addBindValue(QString("%%1%").arg(fragment.trimmed().toUpper()));

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "[SqlPriceSeriesStore] searchTickers failed:" << m_lastError;
        return tickers;
    }

    while (query.next()) {
        tickers.append(query.value(0).toString());
    }
    return tickers;
}

int SqlPriceSeriesStore::rowCount()
{
    if (!m_initialized) {
        return 0;
    }

    QSqlQuery query(m_db);
    if (!query.exec("SELECT COUNT(*) FROM stock_prices")) {
        m_lastError = query.lastError().text();
        return 0;
    }
    return query.next() ? query.value(0).toInt() : 0;
}
