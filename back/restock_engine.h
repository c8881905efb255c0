#ifndef RESTOCK_ENGINE_H
#define RESTOCK_ENGINE_H

#include "restock_types.h"
#include "stock_catalog.h"
#include "depletion_forecaster.h"
#include "restock_policy.h"
#include "restock_ledger.h"
#include "scheduled_sweep.h"
#include "persistence.h"
#include "error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

// 低库存查询结果
struct LowStockEntry {
    Item item;
    Forecast forecast;
};

// 手工补货请求（绕过补货策略，仍受"每个物品最多一个未完成请求"约束）
struct ManualRestockRequest {
    std::string item_id;
    std::optional<int64_t> quantity;            // 缺省时按策略的数量规则
    std::optional<RequestPriority> priority;    // 缺省时取预测等级（UNKNOWN 视为 NORMAL）
    std::string comments;
};

// 补货引擎：库存目录、消耗预测、补货策略、请求台账与巡检的组合入口
class RestockEngine {
public:
    // data_dir 为空时不持久化；策略配置无效时抛出 StockwatchException
    explicit RestockEngine(const std::string& data_dir = "./data",
                           const PolicyConfig& policy = PolicyConfig());
    ~RestockEngine();

    RestockEngine(const RestockEngine&) = delete;
    RestockEngine& operator=(const RestockEngine&) = delete;

    // ========== 持久化管理 ==========

    bool isPersistenceEnabled() const { return persistence_enabled_; }

    // 在台账锁与目录锁内写一致性快照
    bool createSnapshot();

    std::optional<PersistenceManager::StorageInfo> getStorageInfo() const;

    // ========== 库存目录 ==========

    Result<Item> addItem(const Item& item);
    Result<Item> updateItem(const std::string& item_id, const ItemPatch& patch);
    Result<Item> setStock(const std::string& item_id, int64_t quantity);
    Result<Item> setDailyUsage(const std::string& item_id, double daily_usage);
    Result<Item> recordUsage(const std::string& item_id, int64_t quantity_used);
    Result<void> removeItem(const std::string& item_id);

    std::optional<Item> getItem(const std::string& item_id) const;
    std::vector<Item> listItems(const std::string& facility_id = "") const;

    Result<Forecast> forecastItem(const std::string& item_id) const;

    // 已知预测且 remaining_days <= threshold_days 的物品，最紧急的在前
    Result<std::vector<LowStockEntry>> lowStock(int64_t threshold_days,
                                                const std::string& facility_id = "") const;

    // ========== 补货请求 ==========

    Result<RestockRequest> requestRestock(const ManualRestockRequest& request);

    Result<RestockRequest> approveRequest(uint64_t request_id,
                                          const std::optional<std::string>& comments = std::nullopt);
    Result<RestockRequest> declineRequest(uint64_t request_id,
                                          const std::optional<std::string>& comments = std::nullopt);
    Result<RestockRequest> fulfillRequest(uint64_t request_id,
                                          const std::optional<std::string>& comments = std::nullopt);

    std::optional<RestockRequest> getRequest(uint64_t request_id) const;
    std::vector<RestockRequest> listRequests(std::optional<RequestStatus> status = std::nullopt,
                                             const std::string& facility_id = "") const;

    // ========== 巡检 ==========

    SweepReport autoRestockCheck();
    SweepReport previewRestock();

    bool startRecurringSweep(int interval_seconds);
    void stopRecurringSweep();

    const RestockPolicy& policy() const { return policy_; }

    // ========== 系统状态 ==========

    struct SystemStatus {
        size_t total_items;
        size_t total_requests;
        size_t pending_requests;
        size_t approved_requests;
        size_t open_requests;
        bool persistence_enabled;
        bool recurring_sweep_running;
        uint64_t sweeps_completed;

        SystemStatus() : total_items(0), total_requests(0), pending_requests(0), approved_requests(0),
                         open_requests(0), persistence_enabled(false), recurring_sweep_running(false),
                         sweeps_completed(0) {}
    };

    SystemStatus getSystemStatus() const;

private:
    void initializePersistence(const std::string& data_dir);
    bool restoreState();

    // 统计操作次数，内部错误计入错误指标
    template<typename T>
    Result<T> track(Result<T> result) const;

    // 声明顺序即析构逆序：持久化管理器最后析构
    std::unique_ptr<PersistenceManager> persistence_;
    bool persistence_enabled_;

    StockCatalog catalog_;
    RestockPolicy policy_;
    RestockLedger ledger_;
    ScheduledSweep sweep_;
};

#endif // RESTOCK_ENGINE_H
