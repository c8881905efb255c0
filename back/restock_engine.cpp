#include "restock_engine.h"
#include "logger.h"
#include "monitoring.h"
#include <algorithm>

RestockEngine::RestockEngine(const std::string& data_dir, const PolicyConfig& policy)
    : persistence_enabled_(false)
    , policy_(policy)
    , ledger_(catalog_)
    , sweep_(catalog_, policy_, ledger_) {

    auto policy_check = RestockPolicy::validateConfig(policy);
    if (policy_check.isError()) {
        THROW_ERROR(policy_check.getErrorCode(), policy_check.getErrorMessage(),
                    policy_check.getErrorContext());
    }

    MONITOR().registerEngineMetrics();

    LOG_INFO("RestockEngine", "constructor",
             "Initializing restock engine (trigger tier " + urgencyTierToString(policy.trigger_tier) +
             ", quantity mode " + quantityModeToString(policy.quantity_mode) + ")");

    if (data_dir.empty()) {
        LOG_INFO("RestockEngine", "constructor", "No data directory configured, persistence disabled");
    } else {
        initializePersistence(data_dir);
    }

    SET_GAUGE("catalog_items_count", static_cast<double>(catalog_.size()));
    SET_GAUGE("open_requests_count", static_cast<double>(ledger_.openCount()));
}

RestockEngine::~RestockEngine() {
    sweep_.stop();

    if (persistence_enabled_ && persistence_) {
        // 关闭前创建最终快照
        if (createSnapshot()) {
            LOG_INFO("RestockEngine", "destructor", "Final snapshot created");
        } else {
            LOG_WARNING("RestockEngine", "destructor", "Failed to create final snapshot");
        }
    }
}

// ========== 持久化管理 ==========

void RestockEngine::initializePersistence(const std::string& data_dir) {
    try {
        persistence_.reset(new PersistenceManager(data_dir));
    } catch (const StockwatchException& e) {
        ErrorHandler::logError(e.getErrorCode(), e.getErrorMessage(), e.getErrorContext());
        LOG_ERROR("RestockEngine", "constructor", "Persistence disabled: " + std::string(e.what()));
        persistence_.reset();
        return;
    }

    if (!restoreState()) {
        // 不回写可疑数据，保留磁盘上的原始文件供人工检查
        persistence_.reset();
        return;
    }

    catalog_.attachJournal(persistence_.get());
    ledger_.attachJournal(persistence_.get());
    persistence_enabled_ = true;
}

bool RestockEngine::restoreState() {
    TIMER("engine_recovery_time");

    auto state = persistence_->recover();

    auto integrity = persistence_->validateDataIntegrity(state);
    if (integrity.isError()) {
        ErrorHandler::logError(integrity.getErrorCode(), integrity.getErrorMessage(),
                               integrity.getErrorContext());
        LOG_ERROR("RestockEngine", "recovery",
                  "Data integrity validation failed, starting with empty state and persistence disabled");
        return false;
    }

    if (state.records_rejected > 0) {
        LOG_WARNING("RestockEngine", "recovery",
                    std::to_string(state.records_rejected) + " unreadable journal records were skipped");
    }

    for (const auto& pair : state.items) {
        catalog_.restoreItem(pair.second);
    }
    for (const auto& pair : state.requests) {
        ledger_.restoreRequest(pair.second);
    }

    if (state.items.empty() && state.requests.empty()) {
        LOG_INFO("RestockEngine", "recovery", "No existing data found, starting with empty catalog");
    } else {
        LOG_INFO("RestockEngine", "recovery",
                 "Data recovery completed. Restored " + std::to_string(state.items.size()) +
                 " items and " + std::to_string(state.requests.size()) + " restock requests");
    }
    return true;
}

bool RestockEngine::createSnapshot() {
    if (!persistence_enabled_ || !persistence_) {
        return false;
    }

    PERF_TIMER("create_snapshot");
    bool created = false;
    ledger_.withConsistentState([this, &created](const std::map<std::string, Item>& items,
                                                 const std::map<uint64_t, RestockRequest>& requests) {
        std::vector<Item> item_list;
        item_list.reserve(items.size());
        for (const auto& pair : items) {
            item_list.push_back(pair.second);
        }

        std::vector<RestockRequest> request_list;
        request_list.reserve(requests.size());
        for (const auto& pair : requests) {
            request_list.push_back(pair.second);
        }

        created = persistence_->createSnapshot(item_list, request_list);
    });

    if (!created) {
        ErrorHandler::logError(ErrorCode::SNAPSHOT_CREATE_FAILED, "Snapshot creation failed",
                               ERROR_CONTEXT("RestockEngine", "createSnapshot"));
    }
    return created;
}

std::optional<PersistenceManager::StorageInfo> RestockEngine::getStorageInfo() const {
    if (!persistence_enabled_ || !persistence_) {
        return std::nullopt;
    }
    return persistence_->getStorageInfo();
}

template<typename T>
Result<T> RestockEngine::track(Result<T> result) const {
    INC_COUNTER("engine_operations_total");

    if (result.isError()) {
        ErrorCode code = result.getErrorCode();
        if (ErrorHandler::errorKind(code) == ErrorKind::INTERNAL_ERROR) {
            RECORD_OPERATION_ERROR(ErrorHandler::errorCodeToString(code));
            ErrorHandler::logError(code, result.getErrorMessage(), result.getErrorContext());
        } else {
            ErrorHandler::logWarning(code, result.getErrorMessage(), result.getErrorContext());
        }
    }
    return result;
}

// ========== 库存目录 ==========

Result<Item> RestockEngine::addItem(const Item& item) {
    return track(catalog_.addItem(item));
}

Result<Item> RestockEngine::updateItem(const std::string& item_id, const ItemPatch& patch) {
    return track(catalog_.updateItem(item_id, patch));
}

Result<Item> RestockEngine::setStock(const std::string& item_id, int64_t quantity) {
    return track(catalog_.setStock(item_id, quantity));
}

Result<Item> RestockEngine::setDailyUsage(const std::string& item_id, double daily_usage) {
    return track(catalog_.setDailyUsage(item_id, daily_usage));
}

Result<Item> RestockEngine::recordUsage(const std::string& item_id, int64_t quantity_used) {
    return track(catalog_.recordUsage(item_id, quantity_used));
}

Result<void> RestockEngine::removeItem(const std::string& item_id) {
    return track(catalog_.removeItem(item_id));
}

std::optional<Item> RestockEngine::getItem(const std::string& item_id) const {
    return catalog_.getItem(item_id);
}

std::vector<Item> RestockEngine::listItems(const std::string& facility_id) const {
    return catalog_.listItems(facility_id);
}

Result<Forecast> RestockEngine::forecastItem(const std::string& item_id) const {
    auto item = catalog_.getItem(item_id);
    if (!item) {
        return RESULT_ERROR(Forecast, ErrorCode::ITEM_NOT_FOUND, "Item not found: " + item_id,
                            ERROR_CONTEXT_WITH_IDS("RestockEngine", "forecastItem", item_id, ""));
    }
    return Result<Forecast>::success(DepletionForecaster::forecast(*item));
}

Result<std::vector<LowStockEntry>> RestockEngine::lowStock(int64_t threshold_days,
                                                           const std::string& facility_id) const {
    if (threshold_days < 0) {
        return RESULT_ERROR(std::vector<LowStockEntry>, ErrorCode::INVALID_PARAMETER,
                            "Threshold days cannot be negative",
                            ERROR_CONTEXT("RestockEngine", "lowStock"));
    }

    std::vector<LowStockEntry> entries;
    for (const auto& item : catalog_.listItems(facility_id)) {
        Forecast forecast = DepletionForecaster::forecast(item);
        if (forecast.has_estimate && forecast.remaining_days <= threshold_days) {
            LowStockEntry entry;
            entry.item = item;
            entry.forecast = forecast;
            entries.push_back(entry);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const LowStockEntry& a, const LowStockEntry& b) {
        if (a.forecast.remaining_days != b.forecast.remaining_days) {
            return a.forecast.remaining_days < b.forecast.remaining_days;
        }
        if (a.forecast.exact_days != b.forecast.exact_days) {
            return a.forecast.exact_days < b.forecast.exact_days;
        }
        return a.item.id < b.item.id;
    });

    return Result<std::vector<LowStockEntry>>::success(std::move(entries));
}

// ========== 补货请求 ==========

Result<RestockRequest> RestockEngine::requestRestock(const ManualRestockRequest& request) {
    auto item = catalog_.getItem(request.item_id);
    if (!item) {
        return track(RESULT_ERROR(RestockRequest, ErrorCode::ITEM_NOT_FOUND, "Item not found: " + request.item_id,
                                  ERROR_CONTEXT_WITH_IDS("RestockEngine", "requestRestock", request.item_id, "")));
    }

    Forecast forecast = DepletionForecaster::forecast(*item);

    RestockSpec spec;
    spec.item_id = request.item_id;
    spec.quantity = request.quantity ? *request.quantity : policy_.suggestedQuantity(*item);
    spec.priority = request.priority ? *request.priority : priorityFromTier(forecast.tier);
    spec.source = RequestSource::MANUAL;
    if (forecast.has_estimate) {
        spec.days_remaining = forecast.remaining_days;
    }
    spec.comments = request.comments;

    auto created = ledger_.create(spec);
    if (created.isError()) {
        return track(RESULT_ERROR(RestockRequest, created.getErrorCode(), created.getErrorMessage(),
                                  created.getErrorContext()));
    }

    auto stored = ledger_.get(created.getValue());
    if (!stored) {
        return track(RESULT_ERROR(RestockRequest, ErrorCode::REQUEST_NOT_FOUND,
                                  "Created request disappeared: " + std::to_string(created.getValue()),
                                  ERROR_CONTEXT_WITH_IDS("RestockEngine", "requestRestock", request.item_id,
                                                         std::to_string(created.getValue()))));
    }
    return track(Result<RestockRequest>::success(*stored));
}

Result<RestockRequest> RestockEngine::approveRequest(uint64_t request_id,
                                                     const std::optional<std::string>& comments) {
    return track(ledger_.approve(request_id, comments));
}

Result<RestockRequest> RestockEngine::declineRequest(uint64_t request_id,
                                                     const std::optional<std::string>& comments) {
    return track(ledger_.decline(request_id, comments));
}

Result<RestockRequest> RestockEngine::fulfillRequest(uint64_t request_id,
                                                     const std::optional<std::string>& comments) {
    return track(ledger_.fulfill(request_id, comments));
}

std::optional<RestockRequest> RestockEngine::getRequest(uint64_t request_id) const {
    return ledger_.get(request_id);
}

std::vector<RestockRequest> RestockEngine::listRequests(std::optional<RequestStatus> status,
                                                        const std::string& facility_id) const {
    return ledger_.list(status, facility_id);
}

// ========== 巡检 ==========

SweepReport RestockEngine::autoRestockCheck() {
    return sweep_.run(SweepMode::COMMIT);
}

SweepReport RestockEngine::previewRestock() {
    return sweep_.run(SweepMode::PREVIEW);
}

bool RestockEngine::startRecurringSweep(int interval_seconds) {
    return sweep_.start(interval_seconds);
}

void RestockEngine::stopRecurringSweep() {
    sweep_.stop();
}

// ========== 系统状态 ==========

RestockEngine::SystemStatus RestockEngine::getSystemStatus() const {
    SystemStatus status;
    status.total_items = catalog_.size();
    status.total_requests = ledger_.size();
    status.open_requests = ledger_.openCount();
    status.pending_requests = ledger_.list(RequestStatus::PENDING).size();
    status.approved_requests = ledger_.list(RequestStatus::APPROVED).size();
    status.persistence_enabled = persistence_enabled_;
    status.recurring_sweep_running = sweep_.isRunning();
    status.sweeps_completed = sweep_.completedRuns();
    return status;
}
