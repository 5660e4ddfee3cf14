#include "api/QtHttpTransport.h"
#include <QDebug>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

QtHttpTransport::QtHttpTransport(QObject* parent)
    : QObject(parent)
    , m_manager(new QNetworkAccessManager(this))
{
}

QtHttpTransport::~QtHttpTransport()
{
    const auto ids = m_pending.keys();
    for (quint64 id : ids) {
        cancel(id);
    }
}

quint64 QtHttpTransport::get(const QString& url, int timeoutMs, Callback callback)
{
    const quint64 id = m_nextId++;

    QNetworkRequest request{QUrl(url)};
    request.setHeader(QNetworkRequest::UserAgentHeader, "OptionChainEngine/1.0");

    Pending pending;
    pending.callback = std::move(callback);
    pending.reply = m_manager->get(request);
    pending.timer = new QTimer(this);
    pending.timer->setSingleShot(true);

    connect(pending.timer, &QTimer::timeout, this, [this, id]() {
        auto it = m_pending.find(id);
        if (it == m_pending.end()) return;
        qWarning() << "[QtHttpTransport] Request" << id << "timed out";
        it->timedOut = true;
        it->reply->abort();
    });
    connect(pending.reply, &QNetworkReply::finished, this, [this, id]() {
        finish(id);
    });

    pending.timer->start(timeoutMs);
    m_pending.insert(id, pending);
    return id;
}

void QtHttpTransport::finish(quint64 requestId)
{
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        return;
    }
    Pending pending = it.value();
    m_pending.erase(it);

    pending.timer->stop();
    pending.timer->deleteLater();

    HttpResponse response;
    response.timedOut = pending.timedOut;
    response.statusCode = pending.reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = pending.reply->readAll();

    // HTTP error statuses are reported through statusCode, not as transport errors
    const QNetworkReply::NetworkError netError = pending.reply->error();
    if (netError != QNetworkReply::NoError && response.statusCode == 0 && !pending.timedOut) {
        response.error = pending.reply->errorString();
    }
    pending.reply->deleteLater();

    if (pending.callback) {
        pending.callback(response);
    }
}

void QtHttpTransport::cancel(quint64 requestId)
{
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) {
        return;
    }
    Pending pending = it.value();
    m_pending.erase(it);

    pending.timer->stop();
    pending.timer->deleteLater();
    pending.reply->disconnect(this);
    pending.reply->abort();
    pending.reply->deleteLater();
}
