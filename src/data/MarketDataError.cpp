#include "data/MarketDataError.h"

namespace MarketData {

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::InsufficientData: return "InsufficientData";
        case ErrorCode::ProviderUnavailable: return "ProviderUnavailable";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::NoData: return "NoData";
        case ErrorCode::MalformedProviderResponse: return "MalformedProviderResponse";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::PerStrikeComputeFailure: return "PerStrikeComputeFailure";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString errorCategoryToString(ErrorCategory category)
{
    switch (category) {
        case ErrorCategory::NotFound: return "not-found";
        case ErrorCategory::Unavailable: return "unavailable";
        case ErrorCategory::Internal: return "internal";
    }
    return "internal";
}

QJsonObject MarketDataError::toJson() const
{
    QJsonObject obj;
    obj["error"] = message;
    obj["code"] = errorCodeToString(code);
    obj["category"] = errorCategoryToString(category());
    return obj;
}

} // namespace MarketData
