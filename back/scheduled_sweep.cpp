#include "scheduled_sweep.h"
#include "depletion_forecaster.h"
#include "logger.h"
#include "monitoring.h"
#include <chrono>

std::string sweepModeToString(SweepMode mode) {
    return mode == SweepMode::COMMIT ? "commit" : "preview";
}

ScheduledSweep::ScheduledSweep(StockCatalog& catalog, const RestockPolicy& policy, RestockLedger& ledger)
    : catalog_(catalog)
    , policy_(policy)
    , ledger_(ledger)
    , running_(false)
    , stop_requested_(false)
    , completed_runs_(0) {
}

ScheduledSweep::~ScheduledSweep() {
    stop();
}

SweepReport ScheduledSweep::run(SweepMode mode) {
    auto start_time = std::chrono::steady_clock::now();

    SweepReport report;
    report.mode = mode;
    report.started_at = currentUtcTimestamp();

    // 目录的一致性副本，每个物品恰好评估一次
    std::vector<Item> items = catalog_.listItems();
    report.evaluated = items.size();

    for (const auto& item : items) {
        Forecast forecast = DepletionForecaster::forecast(item);
        bool has_open = ledger_.openRequestFor(item.id).has_value();

        if (has_open && policy_.triggers(forecast.tier)) {
            report.skipped.push_back(item.id);
            continue;
        }

        auto spec = policy_.evaluate(item, forecast, has_open);
        if (!spec) {
            continue;
        }

        if (mode == SweepMode::PREVIEW) {
            report.proposed.push_back(*spec);
            continue;
        }

        auto created = ledger_.create(*spec);
        if (created.isSuccess()) {
            auto request = ledger_.get(created.getValue());
            if (request) {
                report.created.push_back(*request);
            }
        } else if (created.getErrorCode() == ErrorCode::DUPLICATE_OPEN_REQUEST) {
            // 并发写入者先创建了请求
            report.skipped.push_back(item.id);
        } else {
            report.errors.push_back(item.id + ": " + created.getErrorMessage());
            ErrorHandler::logWarning(created.getErrorCode(), created.getErrorMessage(),
                                     created.getErrorContext());
        }
    }

    report.duration_ms = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time).count() / 1000.0;

    MONITOR().recordSweep(sweepModeToString(mode), report.created.size(), report.skipped.size(),
                          report.duration_ms);
    LOG_PERFORMANCE("sweep_" + sweepModeToString(mode), report.duration_ms,
                    "items=" + std::to_string(report.evaluated));

    LOG_INFO("ScheduledSweep", "run",
             "Sweep (" + sweepModeToString(mode) + ") evaluated " + std::to_string(report.evaluated) +
             " items: created=" + std::to_string(report.created.size()) +
             ", proposed=" + std::to_string(report.proposed.size()) +
             ", skipped=" + std::to_string(report.skipped.size()) +
             ", errors=" + std::to_string(report.errors.size()));

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }
    completed_runs_++;

    return report;
}

// ========== 周期巡检 ==========

bool ScheduledSweep::start(int interval_seconds) {
    if (interval_seconds <= 0) {
        LOG_WARNING("ScheduledSweep", "start", "Invalid sweep interval: " + std::to_string(interval_seconds));
        return false;
    }

    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (running_.load()) {
        return false;
    }

    stop_requested_ = false;
    running_.store(true);
    worker_thread_ = std::thread(&ScheduledSweep::worker, this, interval_seconds);

    LOG_INFO("ScheduledSweep", "start", "Recurring sweep every " + std::to_string(interval_seconds) + "s");
    return true;
}

void ScheduledSweep::stop() {
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (!running_.load()) {
            return;
        }
        stop_requested_ = true;
    }
    worker_condition_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    running_.store(false);

    LOG_INFO("ScheduledSweep", "stop", "Recurring sweep stopped");
}

void ScheduledSweep::worker(int interval_seconds) {
    std::unique_lock<std::mutex> lock(worker_mutex_);

    while (!stop_requested_) {
        bool stopping = worker_condition_.wait_for(lock, std::chrono::seconds(interval_seconds),
                                                   [this] { return stop_requested_; });
        if (stopping) {
            break;
        }

        lock.unlock();
        run(SweepMode::COMMIT);
        lock.lock();
    }
}

SweepReport ScheduledSweep::lastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}
