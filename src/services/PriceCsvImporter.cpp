#include "services/PriceCsvImporter.h"
#include "services/PriceSeriesStore.h"
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <algorithm>

using MarketData::ErrorCode;
using MarketData::MarketDataError;
using MarketData::PricePoint;
using MarketData::PriceSeries;

namespace {

QString unquote(const QString& field)
{
    QString value = field.trimmed();
    if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"')) {
        value = value.mid(1, value.size() - 2).trimmed();
    }
    return value;
}

int columnOf(const QStringList& header, std::initializer_list<const char*> names)
{
    for (const char* name : names) {
        for (int i = 0; i < header.size(); ++i) {
            if (header[i].compare(QLatin1String(name), Qt::CaseInsensitive) == 0) {
                return i;
            }
        }
    }
    return -1;
}

} // namespace

PriceCsvImporter::PriceCsvImporter(PriceSeriesStore* store)
    : m_store(store)
{
}

QString PriceCsvImporter::tickerFromFileName(const QString& filePath)
{
    const QString base = QFileInfo(filePath).completeBaseName();
    return base.section('-', 0, 0).trimmed().toUpper();
}

QDate PriceCsvImporter::parseDate(const QString& text)
{
    const QString value = unquote(text);

    QDate date = QDate::fromString(value, "MM/dd/yyyy");
    if (!date.isValid()) {
        date = QDate::fromString(value, "M/d/yyyy");
    }
    if (!date.isValid()) {
        date = MarketData::dateFromIso(value);
    }
    return date;
}

bool PriceCsvImporter::parsePrice(const QString& text, double& out)
{
    QString value = unquote(text);
    value.remove('$');
    value.remove(',');
    bool ok = false;
    out = value.trimmed().toDouble(&ok);
    return ok && out >= 0;
}

PriceSeries PriceCsvImporter::parse(const QString& content, int* rowsRead, int* skipped,
                                    MarketDataError* error)
{
    PriceSeries points;
    int read = 0;
    int bad = 0;

    QStringList lines = content.split('\n');
    while (!lines.isEmpty() && lines.first().trimmed().isEmpty()) {
        lines.removeFirst();
    }

    if (lines.isEmpty()) {
        if (error) *error = MarketDataError(ErrorCode::InvalidInput, "CSV file is empty");
        return points;
    }

    QStringList header;
    for (const QString& field : lines.takeFirst().split(',')) {
        header.append(unquote(field));
    }

    const int dateCol = columnOf(header, {"Date"});
    const int closeCol = columnOf(header, {"Close/Last", "Close", "Adj Close"});
    const int openCol = columnOf(header, {"Open"});
    const int highCol = columnOf(header, {"High"});
    const int lowCol = columnOf(header, {"Low"});
    const int volumeCol = columnOf(header, {"Volume"});

    if (dateCol < 0 || closeCol < 0) {
        if (error) {
            *error = MarketDataError(ErrorCode::InvalidInput,
                                     "CSV header must contain Date and Close (or Close/Last) columns");
        }
        return points;
    }

    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const QStringList fields = line.split(',');
        if (unquote(fields.value(dateCol)).compare("Date", Qt::CaseInsensitive) == 0) {
            continue;   // repeated header
        }
        ++read;

        PricePoint point;
        point.date = parseDate(fields.value(dateCol));

        double close = 0;
        bool ok = point.date.isValid() && parsePrice(fields.value(closeCol), close);
        point.close = close;

        // Missing optional columns fall back to the close
        point.open = close;
        point.high = close;
        point.low = close;
        if (ok && openCol >= 0) ok = parsePrice(fields.value(openCol), point.open);
        if (ok && highCol >= 0) ok = parsePrice(fields.value(highCol), point.high);
        if (ok && lowCol >= 0) ok = parsePrice(fields.value(lowCol), point.low);
        if (ok && volumeCol >= 0) {
            double volume = 0;
            ok = parsePrice(fields.value(volumeCol), volume);
            point.volume = static_cast<qint64>(volume);
        }

        if (!ok || !point.isValid()) {
            ++bad;
            continue;
        }
        points.append(point);
    }

    std::stable_sort(points.begin(), points.end(),
              [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });

    // Later rows win for duplicate dates
    PriceSeries unique;
    for (const auto& point : points) {
        if (!unique.isEmpty() && unique.last().date == point.date) {
            unique.last() = point;
            ++bad;
        } else {
            unique.append(point);
        }
    }

    if (rowsRead) *rowsRead = read;
    if (skipped) *skipped = bad;
    return unique;
}

ImportReport PriceCsvImporter::importFile(const QString& filePath, const QString& ticker, bool replace)
{
    ImportReport report;
    report.ticker = ticker.trimmed().isEmpty() ? tickerFromFileName(filePath) : ticker.trimmed().toUpper();

    if (report.ticker.isEmpty()) {
        report.error = MarketDataError(ErrorCode::InvalidInput,
                                       QString("Cannot derive a ticker from %1").arg(filePath));
        return report;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        report.error = MarketDataError(ErrorCode::InvalidInput,
                                       QString("Cannot open %1: %2").arg(filePath, file.errorString()));
        qWarning() << "[PriceCsvImporter]" << report.error.message;
        return report;
    }

    QTextStream in(&file);
    const QString content = in.readAll();
    file.close();

    qInfo() << "[PriceCsvImporter] Importing" << filePath << "as" << report.ticker
            << (replace ? "(replacing existing data)" : "");

    const PriceSeries points = parse(content, &report.rowsRead, &report.skipped, &report.error);
    if (report.error.isError()) {
        qWarning() << "[PriceCsvImporter]" << report.error.message;
        return report;
    }

    const UpsertResult written = replace ? m_store->replaceSeries(report.ticker, points)
                                         : m_store->upsert(report.ticker, points);
    if (!written.ok()) {
        report.error = written.error;
        return report;
    }
    report.written = written.written;

    qInfo() << "[PriceCsvImporter] Import complete. Read:" << report.rowsRead
            << "Written:" << report.written << "Skipped:" << report.skipped;
    return report;
}
