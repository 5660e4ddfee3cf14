#include "services/Clock.h"
#include <QTimer>

SystemClock::SystemClock(QObject* parent)
    : QObject(parent)
{
}

SystemClock::~SystemClock()
{
    for (QTimer* timer : m_timers) {
        timer->stop();
    }
    m_timers.clear();
}

QDate SystemClock::today() const
{
    return QDate::currentDate();
}

quint64 SystemClock::schedule(int delayMs, std::function<void()> callback)
{
    const quint64 id = m_nextId++;

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id, timer, callback]() {
        m_timers.remove(id);
        timer->deleteLater();
        callback();
    });

    m_timers.insert(id, timer);
    timer->start(qMax(0, delayMs));
    return id;
}

void SystemClock::cancel(quint64 id)
{
    QTimer* timer = m_timers.take(id);
    if (timer) {
        timer->stop();
        timer->deleteLater();
    }
}
