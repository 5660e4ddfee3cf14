#include "utils/ConfigLoader.h"
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QVariant>
#include <algorithm>

namespace {

// QSettings splits unquoted comma lists into a QStringList
QString listValue(const QVariant &value)
{
    if (value.userType() == QMetaType::QStringList) {
        return value.toStringList().join(',');
    }
    return value.toString();
}

} // namespace

ConfigLoader::ConfigLoader()
    : m_loaded(false)
{
}

ExpiryLadder ConfigLoader::parseExpiries(const QString &text, const ExpiryLadder &fallback)
{
    ExpiryLadder ladder;
    for (const QString &part : text.split(',', Qt::SkipEmptyParts)) {
        bool ok = false;
        const int days = part.trimmed().toInt(&ok);
        if (!ok || days < 0) {
            qWarning() << "[ConfigLoader] Ignoring invalid expiries entry" << part;
            return fallback;
        }
        if (!ladder.contains(days)) {
            ladder.append(days);
        }
    }
    if (ladder.isEmpty()) {
        return fallback;
    }
    std::sort(ladder.begin(), ladder.end());
    return ladder;
}

bool ConfigLoader::load(const QString &filePath)
{
    m_filePath = filePath;

    if (!QFileInfo::exists(filePath)) {
        qWarning() << "[ConfigLoader] Config file not found:" << filePath << "- using defaults";
        applyEnvironment();
        return false;
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "[ConfigLoader] Failed to read config file:" << filePath;
        applyEnvironment();
        return false;
    }

    AppConfig &c = m_config;

    settings.beginGroup("PROVIDER");
    c.provider.apiKey = settings.value("api_key", c.provider.apiKey).toString();
    c.provider.baseUrl = settings.value("base_url", c.provider.baseUrl).toString();
    c.provider.timeoutMs = settings.value("timeout_ms", c.provider.timeoutMs).toInt();
    c.transport = settings.value("transport", c.transport).toString().trimmed().toLower();
    settings.endGroup();

    settings.beginGroup("RETRY");
    c.provider.retry.maxRetries = settings.value("max_retries", c.provider.retry.maxRetries).toInt();
    c.provider.retry.baseDelayMs = settings.value("base_delay_ms", c.provider.retry.baseDelayMs).toInt();
    c.provider.retry.multiplier = settings.value("multiplier", c.provider.retry.multiplier).toDouble();
    c.provider.retry.rateLimitFactor =
        settings.value("rate_limit_factor", c.provider.retry.rateLimitFactor).toDouble();
    settings.endGroup();

    settings.beginGroup("STORAGE");
    c.dbPath = settings.value("db_path", c.dbPath).toString();
    c.service.staleAfterDays = settings.value("stale_after_days", c.service.staleAfterDays).toInt();
    settings.endGroup();

    settings.beginGroup("CHAIN");
    c.service.riskFreeRate = settings.value("risk_free_rate", c.service.riskFreeRate).toDouble();
    c.service.strikeStep = settings.value("strike_step", c.service.strikeStep).toDouble();
    c.service.strikeCount = settings.value("strike_count", c.service.strikeCount).toInt();
    if (settings.contains("expiries")) {
        c.service.expiries = parseExpiries(listValue(settings.value("expiries")), c.service.expiries);
    }
    c.service.volatilityWindow = settings.value("volatility_window", c.service.volatilityWindow).toInt();
    c.service.defaultVolatility = settings.value("default_volatility", c.service.defaultVolatility).toDouble();
    c.service.volatilityFloor = settings.value("volatility_floor", c.service.volatilityFloor).toDouble();
    c.service.volatilityCap = settings.value("volatility_cap", c.service.volatilityCap).toDouble();
    c.service.minPremium = settings.value("min_premium", c.service.minPremium).toDouble();
    c.service.serveStaleOnRefreshFailure =
        settings.value("serve_stale", c.service.serveStaleOnRefreshFailure).toBool();
    settings.endGroup();

    settings.beginGroup("LOGGING");
    c.logFile = settings.value("file", c.logFile).toString();
    c.debugLogging = settings.value("debug", c.debugLogging).toBool();
    settings.endGroup();

    if (c.transport != "qt" && c.transport != "native") {
        qWarning() << "[ConfigLoader] Unknown transport" << c.transport << "- falling back to qt";
        c.transport = "qt";
    }

    applyEnvironment();
    m_loaded = true;

    qDebug() << "[ConfigLoader] Configuration loaded from:" << filePath;
    return true;
}

void ConfigLoader::applyEnvironment()
{
    const QString apiKey = qEnvironmentVariable("ALPHA_VANTAGE_API_KEY");
    if (!apiKey.isEmpty()) {
        m_config.provider.apiKey = apiKey;
    }
    const QString url = qEnvironmentVariable("ALPHA_VANTAGE_URL");
    if (!url.isEmpty()) {
        m_config.provider.baseUrl = url;
    }
}
