#include "services/RetryPolicy.h"
#include <cmath>

using MarketData::ErrorCode;
using MarketData::MarketDataError;

RetryPolicy::RetryPolicy()
    : isRetryable(&RetryPolicy::defaultRetryable)
{
}

bool RetryPolicy::defaultRetryable(const MarketDataError& error)
{
    return error.isRetryable();
}

bool RetryPolicy::shouldRetry(const MarketDataError& error, int retriesSoFar) const
{
    if (!error.isError() || retriesSoFar >= maxRetries) {
        return false;
    }
    return isRetryable ? isRetryable(error) : defaultRetryable(error);
}

int RetryPolicy::delayForRetry(int retryIndex, const MarketDataError& error) const
{
    double delay = baseDelayMs * std::pow(multiplier, retryIndex);
    if (error.code == ErrorCode::RateLimited) {
        delay *= rateLimitFactor;
    }
    return static_cast<int>(std::lround(delay));
}

QVector<int> RetryPolicy::delaySchedule(bool rateLimited) const
{
    const MarketDataError sample(rateLimited ? ErrorCode::RateLimited : ErrorCode::ProviderUnavailable,
                                 QString());
    QVector<int> delays;
    for (int i = 0; i < maxRetries; ++i) {
        delays.append(delayForRetry(i, sample));
    }
    return delays;
}
