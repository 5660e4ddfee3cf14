#ifndef FILELOGGER_H
#define FILELOGGER_H

#include <QString>

/**
 * @brief Install the process-wide Qt message handler
 *
 * Every message is written as "[timestamp] [LEVEL] message" to stderr and,
 * when logFilePath is not empty, appended to that file. Debug messages are
 * dropped unless debugEnabled is set.
 */
void setupFileLogging(const QString &logFilePath, bool debugEnabled);

/// Restore the default handler and close the log file
void cleanupFileLogging();

#endif // FILELOGGER_H
