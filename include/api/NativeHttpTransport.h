#ifndef NATIVE_HTTP_TRANSPORT_H
#define NATIVE_HTTP_TRANSPORT_H

#include "api/HttpTransport.h"
#include <QHash>
#include <QObject>
#include <QThreadPool>

class QTimer;

/**
 * @brief HttpTransport running NativeHTTPClient on a private thread pool
 *
 * The blocking Beast request runs on a worker; its result is posted back to
 * this object's thread. The worker's client gives up at the same timeout, so
 * no pool thread outlives its request. A QTimer on the owning thread answers
 * the caller at the timeout even if the worker result is still in flight;
 * the late result is then dropped.
 */
class NativeHttpTransport : public QObject, public HttpTransport {
    Q_OBJECT

public:
    explicit NativeHttpTransport(QObject* parent = nullptr);
    ~NativeHttpTransport() override;

    quint64 get(const QString& url, int timeoutMs, Callback callback) override;
    void cancel(quint64 requestId) override;

private:
    struct Pending {
        QTimer* timer = nullptr;
        Callback callback;
    };

    void complete(quint64 requestId, const HttpResponse& response);

    QThreadPool m_pool;
    QHash<quint64, Pending> m_pending;
    quint64 m_nextId = 1;
};

#endif // NATIVE_HTTP_TRANSPORT_H
