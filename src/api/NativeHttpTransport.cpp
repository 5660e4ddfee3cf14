#include "api/NativeHttpTransport.h"
#include "api/NativeHTTPClient.h"
#include <QDebug>
#include <QTimer>
#include <QtConcurrent/QtConcurrent>

NativeHttpTransport::NativeHttpTransport(QObject* parent)
    : QObject(parent)
{
    m_pool.setMaxThreadCount(4);
}

NativeHttpTransport::~NativeHttpTransport()
{
    m_pending.clear();
    m_pool.waitForDone();
}

quint64 NativeHttpTransport::get(const QString& url, int timeoutMs, Callback callback)
{
    const quint64 id = m_nextId++;

    Pending pending;
    pending.callback = std::move(callback);
    pending.timer = new QTimer(this);
    pending.timer->setSingleShot(true);
    connect(pending.timer, &QTimer::timeout, this, [this, id, timeoutMs]() {
        qWarning() << "[NativeHttpTransport] Request" << id << "timed out after" << timeoutMs << "ms";
        HttpResponse response;
        response.timedOut = true;
        response.error = QString("Request timed out after %1 ms").arg(timeoutMs);
        complete(id, response);
    });
    pending.timer->start(timeoutMs);
    m_pending.insert(id, pending);

    const std::string target = url.toStdString();
    QtConcurrent::run(&m_pool, [this, id, target, timeoutMs]() {
        NativeHTTPClient client;
        client.setTimeout(std::chrono::milliseconds(qMax(1, timeoutMs)));
        NativeHTTPClient::Response native = client.get(target);

        HttpResponse response;
        response.timedOut = native.timedOut;
        response.statusCode = native.statusCode;
        response.body = QByteArray::fromStdString(native.body);
        if (!native.error.empty()) {
            response.error = QString::fromStdString(native.error);
        }

        QMetaObject::invokeMethod(
            this, [this, id, response]() { complete(id, response); },
            Qt::QueuedConnection);
    });

    return id;
}

void NativeHttpTransport::complete(quint64 requestId, const HttpResponse& response)
{
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        return;   // cancelled or already timed out
    }
    Pending pending = it.value();
    m_pending.erase(it);

    pending.timer->stop();
    pending.timer->deleteLater();

    if (pending.callback) {
        pending.callback(response);
    }
}

void NativeHttpTransport::cancel(quint64 requestId)
{
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        return;
    }
    it->timer->stop();
    it->timer->deleteLater();
    m_pending.erase(it);
}
