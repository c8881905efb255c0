#ifndef SCHEDULED_SWEEP_H
#define SCHEDULED_SWEEP_H

#include "restock_types.h"
#include "stock_catalog.h"
#include "restock_policy.h"
#include "restock_ledger.h"
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

enum class SweepMode {
    PREVIEW,   // 只预测和评估，不写台账
    COMMIT     // 为触发的物品创建补货请求
};

std::string sweepModeToString(SweepMode mode);

// 一次巡检的结果
struct SweepReport {
    SweepMode mode;
    std::string started_at;
    size_t evaluated;                          // 本次评估的物品数
    std::vector<RestockRequest> created;       // COMMIT: 实际创建的请求
    std::vector<RestockSpec> proposed;         // PREVIEW: 将会创建的请求
    std::vector<std::string> skipped;          // 已有未完成请求而跳过的物品ID
    std::vector<std::string> errors;           // 其他错误 "item_id: message"
    double duration_ms;

    SweepReport() : mode(SweepMode::PREVIEW), evaluated(0), duration_ms(0.0) {}
};

// 目录巡检：对每个物品执行 预测 -> 策略 -> (COMMIT 时) 台账创建
// 幂等性由台账的重复请求检查保证，可与手工请求及其他巡检并发执行
class ScheduledSweep {
public:
    ScheduledSweep(StockCatalog& catalog, const RestockPolicy& policy, RestockLedger& ledger);
    ~ScheduledSweep();

    ScheduledSweep(const ScheduledSweep&) = delete;
    ScheduledSweep& operator=(const ScheduledSweep&) = delete;

    SweepReport run(SweepMode mode);

    // ========== 周期巡检 ==========

    // 每 interval_seconds 秒执行一次 COMMIT 巡检；已在运行或间隔 <= 0 时返回 false
    bool start(int interval_seconds);
    void stop();
    bool isRunning() const { return running_.load(); }

    SweepReport lastReport() const;
    uint64_t completedRuns() const { return completed_runs_.load(); }

private:
    void worker(int interval_seconds);

    StockCatalog& catalog_;
    const RestockPolicy& policy_;
    RestockLedger& ledger_;

    std::thread worker_thread_;
    std::atomic<bool> running_;
    bool stop_requested_;
    std::mutex worker_mutex_;
    std::condition_variable worker_condition_;

    mutable std::mutex report_mutex_;
    SweepReport last_report_;
    std::atomic<uint64_t> completed_runs_;
};

#endif // SCHEDULED_SWEEP_H
