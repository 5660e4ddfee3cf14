#include "services/PriceSeriesStore.h"

bool PriceSeriesStore::isStale(const std::optional<QDate>& latest, const QDate& today, int maxAgeDays)
{
    if (!latest || !latest->isValid()) {
        return true;
    }
    return latest->daysTo(today) > maxAgeDays;
}
