#include "api/NativeHttpTransport.h"
#include "api/QtHttpTransport.h"
#include "services/Clock.h"
#include "services/MarketDataService.h"
#include "services/PriceCsvImporter.h"
#include "services/RemoteBackfillClient.h"
#include "services/SqlPriceSeriesStore.h"
#include "utils/ConfigLoader.h"
#include "utils/FileLogger.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>
#include <memory>
#include <cstdio>

using MarketData::ErrorCategory;
using MarketData::MarketDataError;

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitInternal = 1,
    ExitNotFound = 2,
    ExitUnavailable = 3,
    ExitUsage = 64
};

void printJson(const QJsonValue &value)
{
    QJsonDocument doc = value.isArray() ? QJsonDocument(value.toArray())
                                        : QJsonDocument(value.toObject());
    fprintf(stdout, "%s\n", doc.toJson(QJsonDocument::Indented).constData());
    fflush(stdout);
}

int exitCodeFor(const MarketDataError &error)
{
    if (!error.isError()) return ExitOk;
    switch (error.category()) {
        case ErrorCategory::NotFound:    return ExitNotFound;
        case ErrorCategory::Unavailable: return ExitUnavailable;
        case ErrorCategory::Internal:    return ExitInternal;
    }
    return ExitInternal;
}

QString locateConfig(const QString &explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }

    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList candidates = {
        QDir::current().filePath(ConfigLoader::DEFAULT_PATH),
        QDir(appDir).filePath("configs/config.ini"),
        QDir(appDir).filePath("../configs/config.ini"),
    };
    for (const QString &candidate : candidates) {
        if (QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
    return candidates.first();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("optionchain");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Daily price series and Black-Scholes option chains for equity tickers.\n\n"
        "Commands:\n"
        "  prices <ticker>                  Print the stored/backfilled OHLCV series\n"
        "  chain <ticker> [--date D]        Print the option chain, optionally with a target expiry\n"
        "  import <csv> [ticker]            Seed the store from a daily-price CSV file\n"
        "  tickers [--search FRAGMENT]      List stored tickers");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "prices | chain | import | tickers");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    QCommandLineOption configOption("config", "INI configuration file.", "path");
    QCommandLineOption dbOption("db", "SQLite database path (overrides [STORAGE] db_path).", "path");
    QCommandLineOption logOption("log-file", "Append diagnostics to this file.", "path");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug diagnostics.");
    QCommandLineOption timeoutOption("timeout-ms", "Give up on the request after this many ms.", "ms");
    QCommandLineOption dateOption("date", "Target expiry date for chain (yyyy-MM-dd).", "date");
    QCommandLineOption replaceOption("replace", "Replace existing rows on import.");
    QCommandLineOption searchOption("search", "Substring filter for tickers.", "fragment");
    QCommandLineOption transportOption("transport", "HTTP transport: qt or native.", "name");
    parser.addOptions({configOption, dbOption, logOption, verboseOption, timeoutOption,
                       dateOption, replaceOption, searchOption, transportOption});
    parser.process(app);

    ConfigLoader configLoader;
    configLoader.load(locateConfig(parser.value(configOption)));
    AppConfig &config = configLoader.config();

    if (parser.isSet(dbOption)) config.dbPath = parser.value(dbOption);
    if (parser.isSet(logOption)) config.logFile = parser.value(logOption);
    if (parser.isSet(verboseOption)) config.debugLogging = true;
    if (parser.isSet(transportOption)) config.transport = parser.value(transportOption).toLower();

    setupFileLogging(config.logFile, config.debugLogging);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = args.first().toLower();

    SqlPriceSeriesStore store;
    if (!store.initialize(config.dbPath)) {
        printJson(MarketDataError(MarketData::ErrorCode::StorageFailure, store.lastError()).toJson());
        cleanupFileLogging();
        return ExitInternal;
    }

    if (command == "import") {
        if (args.size() < 2) {
            qCritical() << "[main] import requires a CSV file path";
            cleanupFileLogging();
            return ExitUsage;
        }
        PriceCsvImporter importer(&store);
        const ImportReport report = importer.importFile(args.at(1), args.value(2),
                                                        parser.isSet(replaceOption));
        QJsonObject obj;
        obj["ticker"] = report.ticker;
        obj["rowsRead"] = report.rowsRead;
        obj["written"] = report.written;
        obj["skipped"] = report.skipped;
        if (report.error.isError()) {
            obj["error"] = report.error.message;
        }
        printJson(obj);
        cleanupFileLogging();
        return exitCodeFor(report.error);
    }

    if (command == "tickers") {
        const QStringList tickers = parser.isSet(searchOption)
                                        ? store.searchTickers(parser.value(searchOption))
                                        : store.listTickers();
        printJson(QJsonArray::fromStringList(tickers));
        cleanupFileLogging();
        return ExitOk;
    }

    if ((command != "prices" && command != "chain") || args.size() < 2) {
        qCritical() << "[main] Unknown command or missing ticker:" << args.join(' ');
        cleanupFileLogging();
        return ExitUsage;
    }

    SystemClock clock;
    std::unique_ptr<QObject> transportOwner;
    HttpTransport *transport = nullptr;
    if (config.transport == "native") {
        auto *native = new NativeHttpTransport();
        transportOwner.reset(native);
        transport = native;
    } else {
        auto *qt = new QtHttpTransport();
        transportOwner.reset(qt);
        transport = qt;
    }

    RemoteBackfillClient backfill(transport, &clock, config.provider);
    MarketDataService service(&store, &backfill, &clock, config.service);

    const QString ticker = args.at(1);
    int exitCode = ExitOk;
    bool answered = false;
    quint64 requestId = 0;

    if (command == "prices") {
        requestId = service.requestPriceSeries(ticker, [&](const PriceSeriesResult &result) {
            answered = true;
            if (result.servedStale) {
                qWarning() << "[main] Served stale data for" << result.ticker;
            }
            printJson(result.toJson());
            exitCode = exitCodeFor(result.error);
            app.quit();
        });
    } else {
        requestId = service.requestOptionChain(ticker, parser.value(dateOption),
                                               [&](const OptionChainResult &result) {
            answered = true;
            if (result.servedStale) {
                qWarning() << "[main] Chain priced from stale data for" << result.snapshot.ticker;
            }
            printJson(result.toJson());
            exitCode = exitCodeFor(result.error);
            app.quit();
        });
    }

    if (parser.isSet(timeoutOption)) {
        const int timeoutMs = parser.value(timeoutOption).toInt();
        QTimer::singleShot(timeoutMs, &app, [&, timeoutMs]() {
            if (answered) return;
            answered = true;
            service.cancel(requestId);
            MarketDataError error(MarketData::ErrorCode::ProviderUnavailable,
                                  QString("Request for %1 gave up after %2 ms").arg(ticker).arg(timeoutMs));
            printJson(error.toJson());
            exitCode = exitCodeFor(error);
            app.quit();
        });
    }

    app.exec();

    cleanupFileLogging();
    return exitCode;
}
