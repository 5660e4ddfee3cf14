#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include <QByteArray>
#include <QString>
#include <functional>

/**
 * @brief Outcome of one HTTP GET
 */
struct HttpResponse {
    int statusCode = 0;
    QByteArray body;
    QString error;          // transport-level failure text, empty on success
    bool timedOut = false;
    bool cancelled = false;

    bool success() const {
        return error.isEmpty() && !timedOut && !cancelled
               && statusCode >= 200 && statusCode < 300;
    }
};

/**
 * @brief Asynchronous GET transport used by the backfill client
 *
 * Completion callbacks run on the thread that owns the transport (the event
 * loop thread), never inside get() itself.
 */
class HttpTransport {
public:
    using Callback = std::function<void(const HttpResponse&)>;

    virtual ~HttpTransport() = default;

    /**
     * @brief Start a GET request
     * @param url Absolute http:// or https:// URL
     * @param timeoutMs Abort after this many milliseconds (reported as timedOut)
     * @param callback Invoked exactly once unless the request is cancelled
     * @return Request id for cancel()
     */
    virtual quint64 get(const QString& url, int timeoutMs, Callback callback) = 0;

    /// Abort a pending request; its callback will not be invoked
    virtual void cancel(quint64 requestId) = 0;
};

#endif // HTTP_TRANSPORT_H
