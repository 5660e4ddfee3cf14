#ifndef MARKETDATAERROR_H
#define MARKETDATAERROR_H

#include <QJsonObject>
#include <QString>

namespace MarketData {

enum class ErrorCode {
    None,
    InvalidInput,               // malformed pricing parameters
    InsufficientData,           // too few closes for a volatility estimate
    ProviderUnavailable,        // missing credential, transport failure, timeout
    RateLimited,                // provider throttled the request
    NoData,                     // ticker unknown to the provider
    MalformedProviderResponse,  // payload did not match the expected shape
    StorageFailure,             // database open/query/transaction error
    PerStrikeComputeFailure,    // masked inside chain generation
    Cancelled                   // caller cancelled the request
};

/**
 * @brief User-facing categories the boundary maps every error onto
 */
enum class ErrorCategory {
    NotFound,
    Unavailable,
    Internal
};

/**
 * @brief Typed error carried through the asynchronous pipeline
 */
struct MarketDataError {
    ErrorCode code = ErrorCode::None;
    QString message;

    MarketDataError() = default;
    MarketDataError(ErrorCode c, const QString& msg)
        : code(c), message(msg) {}

    bool isError() const { return code != ErrorCode::None; }
    explicit operator bool() const { return isError(); }

    /// Transient provider conditions worth another attempt
    bool isRetryable() const {
        return code == ErrorCode::ProviderUnavailable || code == ErrorCode::RateLimited;
    }

    ErrorCategory category() const {
        switch (code) {
            case ErrorCode::NoData:
                return ErrorCategory::NotFound;
            case ErrorCode::RateLimited:
            case ErrorCode::ProviderUnavailable:
                return ErrorCategory::Unavailable;
            default:
                return ErrorCategory::Internal;
        }
    }

    QJsonObject toJson() const;
};

QString errorCodeToString(ErrorCode code);
QString errorCategoryToString(ErrorCategory category);

} // namespace MarketData

#endif // MARKETDATAERROR_H
