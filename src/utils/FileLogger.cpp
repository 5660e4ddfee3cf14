#include "utils/FileLogger.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

namespace {

QFile *logFile = nullptr;
QMutex logMutex;
bool debugLogging = false;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QMutexLocker locker(&logMutex);

    QString level;
    switch (type) {
        case QtDebugMsg:
            if (!debugLogging) return;
            level = "DEBUG";
            break;
        case QtInfoMsg:     level = "INFO "; break;
        case QtWarningMsg:  level = "WARN "; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString logMessage = QString("[%1] [%2] %3\n").arg(timestamp, level, msg);

    // stdout carries the JSON payloads, so diagnostics go to stderr
    fprintf(stderr, "%s", logMessage.toLocal8Bit().constData());

    if (logFile && logFile->isOpen()) {
        QTextStream stream(logFile);
        stream << logMessage;
        stream.flush();
    }
}

} // namespace

void setupFileLogging(const QString &logFilePath, bool debugEnabled)
{
    debugLogging = debugEnabled;

    if (!logFilePath.isEmpty()) {
        QDir().mkpath(QFileInfo(logFilePath).absolutePath());

        logFile = new QFile(logFilePath);
        if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            fprintf(stderr, "Failed to open log file: %s\n", logFilePath.toLocal8Bit().constData());
            delete logFile;
            logFile = nullptr;
        }
    }

    qInstallMessageHandler(messageHandler);

    if (logFile) {
        qDebug() << "Log file opened:" << logFilePath;
    }
}

void cleanupFileLogging()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker locker(&logMutex);
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}
