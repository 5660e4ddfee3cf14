#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include "services/MarketDataService.h"
#include "services/RemoteBackfillClient.h"
#include <QString>

/**
 * @brief Everything the optionchain binary needs to wire its collaborators
 */
struct AppConfig {
    BackfillConfig provider;
    QString transport = "qt";               // "qt" or "native"
    QString dbPath = "data/stock_data.db";
    ServiceConfig service;
    QString logFile;                        // empty: console only
    bool debugLogging = false;
};

/**
 * @brief INI configuration reader
 *
 * Sections: [PROVIDER], [RETRY], [STORAGE], [CHAIN], [LOGGING].
 * ALPHA_VANTAGE_API_KEY and ALPHA_VANTAGE_URL in the environment override
 * the file.
 */
class ConfigLoader
{
public:
    static constexpr const char* DEFAULT_PATH = "configs/config.ini";

    ConfigLoader();

    // Load configuration from file; a missing file leaves the defaults
    bool load(const QString &filePath = DEFAULT_PATH);

    bool isLoaded() const { return m_loaded; }
    QString filePath() const { return m_filePath; }

    const AppConfig &config() const { return m_config; }
    AppConfig &config() { return m_config; }

    // Apply ALPHA_VANTAGE_API_KEY / ALPHA_VANTAGE_URL
    void applyEnvironment();

    static ExpiryLadder parseExpiries(const QString &text, const ExpiryLadder &fallback);

private:
    AppConfig m_config;
    QString m_filePath;
    bool m_loaded;
};

#endif // CONFIGLOADER_H
