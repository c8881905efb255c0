#ifndef DEPLETION_FORECASTER_H
#define DEPLETION_FORECASTER_H

#include "restock_types.h"
#include <cstdint>

// 消耗预测：根据当前库存与日均消耗估算剩余天数并分级
// 纯函数，无副作用
class DepletionForecaster {
public:
    // 分级阈值（含边界）：<= 5 天 Critical，<= 10 天 High，其余 Normal
    static constexpr int64_t CRITICAL_DAYS = 5;
    static constexpr int64_t HIGH_DAYS = 10;

    // daily_usage <= 0 (或非数) 时 has_estimate = false，tier = UNKNOWN
    static Forecast forecast(const Item& item);

    static UrgencyTier tierForDays(int64_t remaining_days);
};

#endif // DEPLETION_FORECASTER_H
