#include "quant/LadderBuilder.h"
#include "quant/BlackScholesPricer.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <functional>

// ===== STRIKES =====

double StrikeLadderBuilder::atmStrike(double spot, double step)
{
    return std::round(spot / step) * step;
}

StrikeLadder StrikeLadderBuilder::build(double spot, double step, int count)
{
    StrikeLadder strikes;
    if (!(spot > 0) || !(step > 0) || count <= 0) {
        qWarning() << "[StrikeLadderBuilder] Invalid ladder request: spot" << spot
                   << "step" << step << "count" << count;
        return strikes;
    }

    const double base = atmStrike(spot, step);
    const int lowest = -((count - 1) / 2);

    strikes.reserve(count);
    for (int i = lowest; i < lowest + count; ++i) {
        strikes.append(base + i * step);
    }

    std::sort(strikes.begin(), strikes.end(), std::greater<double>());
    return strikes;
}

// ===== EXPIRIES =====

const ExpiryLadder &ExpiryLadderBuilder::defaultLadder()
{
    static const ExpiryLadder ladder = {0, 30, 60, 90, 180};
    return ladder;
}

ExpiryLadder ExpiryLadderBuilder::build(const QDate &today,
                                        const std::optional<QDate> &target,
                                        const ExpiryLadder &base)
{
    ExpiryLadder ladder = base;
    std::sort(ladder.begin(), ladder.end());

    if (!target) {
        return ladder;
    }

    if (!target->isValid() || today.daysTo(*target) <= 0) {
        qWarning() << "[ExpiryLadderBuilder] Requested date is not in the future, ignoring:"
                   << *target;
        return ladder;
    }

    const int days = static_cast<int>(today.daysTo(*target));
    ladder.removeAll(0);
    if (!ladder.contains(days)) {
        ladder.append(days);
    }
    std::sort(ladder.begin(), ladder.end());
    return ladder;
}

QDate ExpiryLadderBuilder::parseTargetDate(const QString &text)
{
    const QString trimmed = text.trimmed();
    QDate date;

    // Try format: 2026-03-27
    date = QDate::fromString(trimmed, "yyyy-MM-dd");
    if (date.isValid()) return date;

    // Try format: 27MAR2026
    date = QDate::fromString(trimmed, "ddMMMyyyy");
    if (date.isValid()) return date;

    // Try format: 27-MAR-2026
    date = QDate::fromString(trimmed, "dd-MMM-yyyy");
    return date;
}

double ExpiryLadderBuilder::yearsToExpiry(int daysToExpiry)
{
    return std::max(daysToExpiry, 1) / BlackScholesPricer::DAYS_PER_YEAR;
}
