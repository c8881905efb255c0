#ifndef RESTOCK_TYPES_H
#define RESTOCK_TYPES_H

#include <string>
#include <optional>
#include <cstdint>

// 紧急程度分级：与分诊助手的 Critical/High/Normal 用语保持一致
// 数值越大越紧急，UNKNOWN 表示没有可靠的消耗数据
enum class UrgencyTier {
    UNKNOWN = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

// 补货请求优先级（创建时确定，之后不可修改）
enum class RequestPriority {
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

// 补货请求状态机: PENDING -> APPROVED -> FULFILLED, PENDING -> DECLINED
enum class RequestStatus {
    PENDING,
    APPROVED,
    DECLINED,
    FULFILLED
};

// 请求来源
enum class RequestSource {
    AUTO,    // 由补货策略自动生成
    MANUAL   // 由操作员手工提交
};

// 库存物品 - 库存目录中的一条记录
struct Item {
    std::string id;              // 物品ID (唯一, 不可变)
    std::string name;            // 物品名称
    std::string category;        // 分类，如 "Drug" / "Supply"
    std::string unit;            // 计量单位
    std::string facility_id;     // 所属卫生站ID
    std::string facility_name;   // 所属卫生站名称
    int64_t current_stock;       // 当前库存 (>= 0)
    double daily_usage;          // 日均消耗量 (>= 0)
    std::string updated_at;      // 最后修改时间 (ISO 8601, UTC)

    Item() : current_stock(0), daily_usage(0.0) {}
};

// 物品局部更新，未设置的字段保持不变
struct ItemPatch {
    std::optional<std::string> name;
    std::optional<std::string> category;
    std::optional<std::string> unit;
    std::optional<std::string> facility_id;
    std::optional<std::string> facility_name;
    std::optional<int64_t> current_stock;
    std::optional<double> daily_usage;

    bool empty() const {
        return !name && !category && !unit && !facility_id && !facility_name &&
               !current_stock && !daily_usage;
    }
};

// 消耗预测结果
struct Forecast {
    std::string item_id;
    bool has_estimate;           // daily_usage <= 0 时为 false
    int64_t remaining_days;      // floor(current_stock / daily_usage)，仅 has_estimate 时有效
    double exact_days;           // 保留一位小数的剩余天数，用于展示
    UrgencyTier tier;

    Forecast() : has_estimate(false), remaining_days(0), exact_days(0.0), tier(UrgencyTier::UNKNOWN) {}
};

// 新建补货请求的参数（由补货策略或手工请求生成）
struct RestockSpec {
    std::string item_id;
    int64_t quantity;
    RequestPriority priority;
    RequestSource source;
    std::optional<int64_t> days_remaining;   // 创建时的预测快照
    std::string comments;

    RestockSpec() : quantity(0), priority(RequestPriority::NORMAL), source(RequestSource::AUTO) {}
};

// 补货请求 - 补货台账中的一条记录
struct RestockRequest {
    uint64_t request_id;
    std::string item_id;
    std::string item_name;
    std::string facility_id;
    std::string facility_name;
    int64_t quantity;
    RequestPriority priority;
    RequestStatus status;
    RequestSource source;
    std::string requested_at;    // 创建时间 (ISO 8601, UTC, 毫秒)
    std::string updated_at;      // 最后一次状态变更时间
    std::string comments;
    std::optional<int64_t> days_remaining;

    RestockRequest()
        : request_id(0), quantity(0), priority(RequestPriority::NORMAL),
          status(RequestStatus::PENDING), source(RequestSource::AUTO) {}

    // 未完成的请求：待审批或已批准但尚未入库
    bool isOpen() const {
        return status == RequestStatus::PENDING || status == RequestStatus::APPROVED;
    }
};

// ========== 枚举与字符串互转 ==========

std::string urgencyTierToString(UrgencyTier tier);
bool parseUrgencyTier(const std::string& text, UrgencyTier& tier);

std::string priorityToString(RequestPriority priority);
bool parsePriority(const std::string& text, RequestPriority& priority);

// 预测等级映射为请求优先级，UNKNOWN 视为 NORMAL
RequestPriority priorityFromTier(UrgencyTier tier);

std::string statusToString(RequestStatus status);
bool parseStatus(const std::string& text, RequestStatus& status);

std::string sourceToString(RequestSource source);
bool parseSource(const std::string& text, RequestSource& source);

// 当前UTC时间，格式 YYYY-MM-DDTHH:MM:SS.mmmZ
std::string currentUtcTimestamp();

#endif // RESTOCK_TYPES_H
