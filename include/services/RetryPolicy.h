#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include "data/MarketDataError.h"
#include <QVector>
#include <functional>

/**
 * @brief Exponential backoff parameters for provider fetches
 *
 * Retry i (0-based) waits baseDelayMs * multiplier^i. When the failure that
 * triggered the retry is rate limiting the delay is further multiplied by
 * rateLimitFactor. With the defaults:
 *   transient failures: 1000, 2000, 4000 ms
 *   rate limited:       2000, 4000, 8000 ms
 *
 * The policy is pure; waiting is done by the caller through a Clock.
 */
struct RetryPolicy {
    int maxRetries = 3;             // retries after the first attempt
    int baseDelayMs = 1000;
    double multiplier = 2.0;
    double rateLimitFactor = 2.0;

    /// Decides whether an error is worth another attempt
    std::function<bool(const MarketData::MarketDataError&)> isRetryable;

    RetryPolicy();

    /**
     * @brief True if another attempt should be made
     * @param error Failure of the latest attempt
     * @param retriesSoFar Retries already performed
     */
    bool shouldRetry(const MarketData::MarketDataError& error, int retriesSoFar) const;

    /**
     * @brief Delay before retry number retryIndex (0-based)
     */
    int delayForRetry(int retryIndex, const MarketData::MarketDataError& error) const;

    /**
     * @brief Full delay sequence for maxRetries retries of the same kind of failure
     */
    QVector<int> delaySchedule(bool rateLimited) const;

    static bool defaultRetryable(const MarketData::MarketDataError& error);
};

#endif // RETRY_POLICY_H
