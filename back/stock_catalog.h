#ifndef STOCK_CATALOG_H
#define STOCK_CATALOG_H

#include "restock_types.h"
#include "error_handling.h"
#include "persistence.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <functional>

// 库存目录：物品的当前库存与日均消耗
//
// 所有修改在目录锁内完成：先在副本上修改并校验，写入日志成功后再提交到内存。
// 目录不会回调补货台账（锁顺序：台账 -> 目录 -> 日志）。
class StockCatalog {
public:
    // 提交前回调：在目录锁内、内存提交前执行，返回错误则放弃本次修改
    using CommitGuard = std::function<Result<void>(const Item&)>;

    StockCatalog();

    StockCatalog(const StockCatalog&) = delete;
    StockCatalog& operator=(const StockCatalog&) = delete;

    // 绑定持久化日志（可为空，表示不持久化）
    void attachJournal(PersistenceManager* journal);

    // ========== 物品录入与修改 ==========

    Result<Item> addItem(const Item& item);
    Result<Item> updateItem(const std::string& id, const ItemPatch& patch);

    Result<Item> setStock(const std::string& id, int64_t quantity);
    Result<Item> setDailyUsage(const std::string& id, double daily_usage);

    // 登记消耗：库存不足时拒绝，库存保持不变
    Result<Item> recordUsage(const std::string& id, int64_t quantity_used);

    // 入库加量（仅供补货台账的 fulfill 使用）
    Result<Item> creditStock(const std::string& id, int64_t quantity, const CommitGuard& guard);

    // 归档物品，已有的补货请求不受影响
    Result<void> removeItem(const std::string& id);

    // ========== 查询 ==========

    std::optional<Item> getItem(const std::string& id) const;
    bool hasItem(const std::string& id) const;

    // 按ID排序；facility_id 为空时返回全部
    std::vector<Item> listItems(const std::string& facility_id = "") const;

    size_t size() const;

    // ========== 恢复与快照 ==========

    // 从持久化数据恢复，不写日志
    void restoreItem(const Item& item);

    // 在目录锁内访问全部物品（用于一致性快照）
    void withLockedItems(const std::function<void(const std::map<std::string, Item>&)>& visitor) const;

    static Result<void> validateItem(const Item& item);

private:
    // 修改流程：复制 -> mutate -> 校验 -> 写日志(或 guard) -> 提交
    Result<Item> applyChange(const std::string& id, const std::string& operation,
                             const std::function<Result<void>(Item&)>& mutate,
                             const CommitGuard& guard = CommitGuard());

    mutable std::mutex mutex_;
    std::map<std::string, Item> items_;
    PersistenceManager* journal_;
};

#endif // STOCK_CATALOG_H
