#ifndef LADDER_BUILDER_H
#define LADDER_BUILDER_H

#include <QDate>
#include <QString>
#include <QVector>
#include <optional>

/// Strikes quoted for a chain, highest first
using StrikeLadder = QVector<double>;

/// Days to expiry quoted for a chain, ascending; 0 means "as of today"
using ExpiryLadder = QVector<int>;

/**
 * @brief Strikes at a fixed step around the rounded spot
 */
class StrikeLadderBuilder {
public:
    static constexpr double DEFAULT_STEP = 5.0;
    static constexpr int DEFAULT_COUNT = 10;

    /**
     * @brief Build the ladder
     *
     * base = round(spot / step) * step. The count strikes run from
     * base - floor((count-1)/2)*step upward, then are sorted descending, so
     * spot 101 with step 5 and count 10 gives 125, 120, ..., 80.
     *
     * @return Empty ladder if spot, step or count is not positive
     */
    static StrikeLadder build(double spot, double step = DEFAULT_STEP, int count = DEFAULT_COUNT);

    /// Nearest strike on the step grid
    static double atmStrike(double spot, double step = DEFAULT_STEP);
};

/**
 * @brief Expirations quoted for a chain
 */
class ExpiryLadderBuilder {
public:
    static const ExpiryLadder &defaultLadder();

    /**
     * @brief Build the ladder, optionally replacing the 0-day entry
     *
     * A target strictly after today replaces the 0 entry with today.daysTo(target)
     * and the ladder is re-sorted ascending. A target that is today or earlier is
     * ignored with a diagnostic and the base ladder is returned unchanged.
     */
    static ExpiryLadder build(const QDate &today,
                              const std::optional<QDate> &target = std::nullopt,
                              const ExpiryLadder &base = defaultLadder());

    /**
     * @brief Parse a caller-supplied target date
     *
     * Tries formats: YYYY-MM-DD, DDMMMYYYY, DD-MMM-YYYY
     * @return Parsed QDate (check isValid())
     */
    static QDate parseTargetDate(const QString &text);

    /**
     * @brief Time to expiry in years for a ladder entry, floored to one day
     */
    static double yearsToExpiry(int daysToExpiry);
};

#endif // LADDER_BUILDER_H
