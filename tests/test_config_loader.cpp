#include <QtTest>
#include "utils/ConfigLoader.h"
#include <QFile>
#include <QTemporaryDir>

class TestConfigLoader : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testMissingFileKeepsDefaults();
    void testLoadAllSections();
    void testEnvironmentOverridesFile();
    void testUnknownTransportFallsBack();
    void testParseExpiries();

private:
    QString writeIni(const QByteArray& content);

    QTemporaryDir* m_dir = nullptr;
};

void TestConfigLoader::init() {
    qunsetenv("ALPHA_VANTAGE_API_KEY");
    qunsetenv("ALPHA_VANTAGE_URL");
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
}

void TestConfigLoader::cleanup() {
    qunsetenv("ALPHA_VANTAGE_API_KEY");
    qunsetenv("ALPHA_VANTAGE_URL");
    delete m_dir;
}

QString TestConfigLoader::writeIni(const QByteArray& content) {
    const QString path = m_dir->filePath("config.ini");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(content);
    }
    return path;
}

void TestConfigLoader::testMissingFileKeepsDefaults() {
    ConfigLoader loader;
    QVERIFY(!loader.load(m_dir->filePath("missing.ini")));
    QVERIFY(!loader.isLoaded());

    const AppConfig& c = loader.config();
    QCOMPARE(c.transport, QString("qt"));
    QCOMPARE(c.dbPath, QString("data/stock_data.db"));
    QCOMPARE(c.provider.timeoutMs, 10000);
    QCOMPARE(c.provider.retry.maxRetries, 3);
    QCOMPARE(c.service.staleAfterDays, 7);
    QCOMPARE(c.service.riskFreeRate, 0.035);
    QCOMPARE(c.service.expiries, ExpiryLadder({0, 30, 60, 90, 180}));
}

void TestConfigLoader::testLoadAllSections() {
    const QString path = writeIni(
        "[PROVIDER]\n"
        "api_key = FILEKEY\n"
        "base_url = https://example.test/query\n"
        "timeout_ms = 2500\n"
        "transport = native\n"
        "[RETRY]\n"
        "max_retries = 5\n"
        "base_delay_ms = 250\n"
        "multiplier = 3.0\n"
        "rate_limit_factor = 4.0\n"
        "[STORAGE]\n"
        "db_path = /tmp/prices.db\n"
        "stale_after_days = 3\n"
        "[CHAIN]\n"
        "risk_free_rate = 0.05\n"
        "strike_step = 2.5\n"
        "strike_count = 6\n"
        "expiries = 7, 0, 14, 7\n"
        "volatility_window = 20\n"
        "default_volatility = 0.25\n"
        "volatility_floor = 0.05\n"
        "volatility_cap = 1.5\n"
        "min_premium = 0.05\n"
        "serve_stale = false\n"
        "[LOGGING]\n"
        "file = logs/engine.log\n"
        "debug = true\n");

    ConfigLoader loader;
    QVERIFY(loader.load(path));
    QVERIFY(loader.isLoaded());

    const AppConfig& c = loader.config();
    QCOMPARE(c.provider.apiKey, QString("FILEKEY"));
    QCOMPARE(c.provider.baseUrl, QString("https://example.test/query"));
    QCOMPARE(c.provider.timeoutMs, 2500);
    QCOMPARE(c.transport, QString("native"));
    QCOMPARE(c.provider.retry.maxRetries, 5);
    QCOMPARE(c.provider.retry.delaySchedule(false).first(), 250);
    QCOMPARE(c.provider.retry.delayForRetry(1, MarketData::MarketDataError(
                 MarketData::ErrorCode::RateLimited, QString())), 3000);
    QCOMPARE(c.dbPath, QString("/tmp/prices.db"));
    QCOMPARE(c.service.staleAfterDays, 3);
    QCOMPARE(c.service.riskFreeRate, 0.05);
    QCOMPARE(c.service.strikeStep, 2.5);
    QCOMPARE(c.service.strikeCount, 6);
    QCOMPARE(c.service.expiries, ExpiryLadder({0, 7, 14}));
    QCOMPARE(c.service.volatilityWindow, 20);
    QCOMPARE(c.service.defaultVolatility, 0.25);
    QCOMPARE(c.service.volatilityFloor, 0.05);
    QCOMPARE(c.service.volatilityCap, 1.5);
    QCOMPARE(c.service.minPremium, 0.05);
    QVERIFY(!c.service.serveStaleOnRefreshFailure);
    QCOMPARE(c.logFile, QString("logs/engine.log"));
    QVERIFY(c.debugLogging);
}

void TestConfigLoader::testEnvironmentOverridesFile() {
    const QString path = writeIni("[PROVIDER]\napi_key = FILEKEY\nbase_url = https://file.test/\n");
    qputenv("ALPHA_VANTAGE_API_KEY", "ENVKEY");
    qputenv("ALPHA_VANTAGE_URL", "https://env.test/query");

    ConfigLoader loader;
    QVERIFY(loader.load(path));
    QCOMPARE(loader.config().provider.apiKey, QString("ENVKEY"));
    QCOMPARE(loader.config().provider.baseUrl, QString("https://env.test/query"));

    ConfigLoader missing;
    QVERIFY(!missing.load(m_dir->filePath("missing.ini")));
    QCOMPARE(missing.config().provider.apiKey, QString("ENVKEY"));
}

void TestConfigLoader::testUnknownTransportFallsBack() {
    ConfigLoader loader;
    QVERIFY(loader.load(writeIni("[PROVIDER]\ntransport = curl\n")));
    QCOMPARE(loader.config().transport, QString("qt"));
}

void TestConfigLoader::testParseExpiries() {
    const ExpiryLadder fallback = {0, 30};
    QCOMPARE(ConfigLoader::parseExpiries("90,30", fallback), ExpiryLadder({30, 90}));
    QCOMPARE(ConfigLoader::parseExpiries("", fallback), fallback);
    QCOMPARE(ConfigLoader::parseExpiries("30,-1", fallback), fallback);
    QCOMPARE(ConfigLoader::parseExpiries("30,abc", fallback), fallback);
}

QTEST_GUILESS_MAIN(TestConfigLoader)
#include "test_config_loader.moc"
