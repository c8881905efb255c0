#ifndef RESTOCK_LEDGER_H
#define RESTOCK_LEDGER_H

#include "restock_types.h"
#include "error_handling.h"
#include "stock_catalog.h"
#include "persistence.h"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <functional>

// 补货请求台账：持有全部补货请求及其状态机
//
//   PENDING --approve--> APPROVED --fulfill--> FULFILLED
//   PENDING --decline--> DECLINED
//
// 所有修改由同一把台账锁串行化，"检查是否已有未完成请求 + 插入" 是原子的。
// fulfill 持有台账锁时为物品加库存，成功后才标记 FULFILLED。
class RestockLedger {
public:
    explicit RestockLedger(StockCatalog& catalog);

    RestockLedger(const RestockLedger&) = delete;
    RestockLedger& operator=(const RestockLedger&) = delete;

    void attachJournal(PersistenceManager* journal);

    // ========== 状态变更 ==========

    // 新建 PENDING 请求，返回请求ID
    // 错误: NEGATIVE_QUANTITY / INVALID_PARAMETER (数量 <= 0), ITEM_NOT_FOUND, DUPLICATE_OPEN_REQUEST
    Result<uint64_t> create(const RestockSpec& spec);

    // 仅允许 PENDING -> APPROVED / DECLINED
    Result<RestockRequest> approve(uint64_t request_id,
                                   const std::optional<std::string>& comments = std::nullopt);
    Result<RestockRequest> decline(uint64_t request_id,
                                   const std::optional<std::string>& comments = std::nullopt);

    // 仅允许 APPROVED -> FULFILLED，同时把 quantity 加到物品库存
    // 物品已不存在时返回 ITEM_NOT_FOUND，请求保持 APPROVED
    Result<RestockRequest> fulfill(uint64_t request_id,
                                   const std::optional<std::string>& comments = std::nullopt);

    // ========== 查询 ==========

    std::optional<RestockRequest> get(uint64_t request_id) const;
    std::optional<RestockRequest> openRequestFor(const std::string& item_id) const;

    // 按 requested_at 升序（相同时按ID），可按状态和卫生站过滤
    std::vector<RestockRequest> list(std::optional<RequestStatus> status = std::nullopt,
                                     const std::string& facility_id = "") const;

    size_t size() const;
    size_t openCount() const;

    // ========== 恢复与快照 ==========

    // 从持久化数据恢复，不写日志；后续分配的ID从最大已恢复ID之后继续
    void restoreRequest(const RestockRequest& request);

    // 同时持有台账锁与目录锁访问全部状态（一致性快照）
    void withConsistentState(
        const std::function<void(const std::map<std::string, Item>&,
                                 const std::map<uint64_t, RestockRequest>&)>& visitor) const;

private:
    Result<RestockRequest> transition(uint64_t request_id, RequestStatus to,
                                      const std::string& operation,
                                      const std::optional<std::string>& comments);

    void updateOpenGauge() const;

    StockCatalog& catalog_;
    PersistenceManager* journal_;

    mutable std::mutex mutex_;
    std::map<uint64_t, RestockRequest> requests_;
    std::unordered_map<std::string, uint64_t> open_by_item_;   // 物品ID -> 未完成请求ID
    uint64_t next_id_;
};

#endif // RESTOCK_LEDGER_H
