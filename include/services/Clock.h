#ifndef CLOCK_H
#define CLOCK_H

#include <QDate>
#include <QHash>
#include <QObject>
#include <functional>

class QTimer;

/**
 * @brief Source of "today" and of timed, non-blocking suspensions
 *
 * Backoff delays and staleness checks go through this interface so tests can
 * drive them with a virtual clock instead of sleeping.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual QDate today() const = 0;

    /**
     * @brief Run callback on the event loop after delayMs
     * @return Id usable with cancel()
     */
    virtual quint64 schedule(int delayMs, std::function<void()> callback) = 0;

    /// Drop a scheduled callback that has not fired yet
    virtual void cancel(quint64 id) = 0;
};

/**
 * @brief Wall clock backed by single-shot QTimers
 */
class SystemClock : public QObject, public Clock {
    Q_OBJECT

public:
    explicit SystemClock(QObject* parent = nullptr);
    ~SystemClock() override;

    QDate today() const override;
    quint64 schedule(int delayMs, std::function<void()> callback) override;
    void cancel(quint64 id) override;

private:
    QHash<quint64, QTimer*> m_timers;
    quint64 m_nextId = 1;
};

#endif // CLOCK_H
