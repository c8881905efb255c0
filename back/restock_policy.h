#ifndef RESTOCK_POLICY_H
#define RESTOCK_POLICY_H

#include "restock_types.h"
#include "error_handling.h"
#include <string>
#include <optional>
#include <cstdint>

// 补货数量计算方式
enum class QuantityMode {
    TOP_UP,   // 补足到 target_days 天的用量
    FIXED     // 固定补货量
};

std::string quantityModeToString(QuantityMode mode);
bool parseQuantityMode(const std::string& text, QuantityMode& mode);

// 补货策略配置
struct PolicyConfig {
    UrgencyTier trigger_tier;          // 触发补货的最低紧急程度（不能为 UNKNOWN）
    QuantityMode quantity_mode;
    int64_t target_days;               // TOP_UP 模式下补足的天数
    int64_t fixed_reorder_quantity;    // FIXED 模式补货量，也用于无消耗数据时
    int64_t minimum_quantity;          // 单次补货的最小数量

    PolicyConfig()
        : trigger_tier(UrgencyTier::HIGH)
        , quantity_mode(QuantityMode::TOP_UP)
        , target_days(14)
        , fixed_reorder_quantity(100)
        , minimum_quantity(1) {}
};

// 补货策略：决定是否为物品生成补货请求以及数量和优先级
// 纯函数，不修改任何状态
class RestockPolicy {
public:
    explicit RestockPolicy(const PolicyConfig& config = PolicyConfig());

    static Result<void> validateConfig(const PolicyConfig& config);

    // 已有未完成请求、等级为 UNKNOWN 或低于触发等级时返回 std::nullopt
    std::optional<RestockSpec> evaluate(const Item& item, const Forecast& forecast,
                                        bool has_open_request) const;

    // 按配置的数量规则计算建议补货量（>= minimum_quantity）
    int64_t suggestedQuantity(const Item& item) const;

    bool triggers(UrgencyTier tier) const;

    const PolicyConfig& config() const { return config_; }

private:
    PolicyConfig config_;
};

#endif // RESTOCK_POLICY_H
