#include "depletion_forecaster.h"
#include <cmath>
#include <limits>

Forecast DepletionForecaster::forecast(const Item& item) {
    Forecast result;
    result.item_id = item.id;

    if (!(item.daily_usage > 0.0)) {
        return result;
    }

    double ratio = static_cast<double>(item.current_stock) / item.daily_usage;

    double floored = std::floor(ratio);
    if (floored >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        result.remaining_days = std::numeric_limits<int64_t>::max();
    } else {
        result.remaining_days = static_cast<int64_t>(floored);
    }

    result.exact_days = std::round(ratio * 10.0) / 10.0;
    result.has_estimate = true;
    result.tier = tierForDays(result.remaining_days);
    return result;
}

UrgencyTier DepletionForecaster::tierForDays(int64_t remaining_days) {
    if (remaining_days <= CRITICAL_DAYS) {
        return UrgencyTier::CRITICAL;
    }
    if (remaining_days <= HIGH_DAYS) {
        return UrgencyTier::HIGH;
    }
    return UrgencyTier::NORMAL;
}
