#ifndef QT_HTTP_TRANSPORT_H
#define QT_HTTP_TRANSPORT_H

#include "api/HttpTransport.h"
#include <QHash>
#include <QObject>

class QNetworkAccessManager;
class QNetworkReply;
class QTimer;

/**
 * @brief HttpTransport on top of QNetworkAccessManager
 *
 * Each request gets a single-shot QTimer; when it fires the reply is aborted
 * and reported as timed out.
 */
class QtHttpTransport : public QObject, public HttpTransport {
    Q_OBJECT

public:
    explicit QtHttpTransport(QObject* parent = nullptr);
    ~QtHttpTransport() override;

    quint64 get(const QString& url, int timeoutMs, Callback callback) override;
    void cancel(quint64 requestId) override;

private:
    struct Pending {
        QNetworkReply* reply = nullptr;
        QTimer* timer = nullptr;
        Callback callback;
        bool timedOut = false;
    };

    void finish(quint64 requestId);

    QNetworkAccessManager* m_manager;
    QHash<quint64, Pending> m_pending;
    quint64 m_nextId = 1;
};

#endif // QT_HTTP_TRANSPORT_H
