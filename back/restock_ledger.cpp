#include "restock_ledger.h"
#include "logger.h"
#include "monitoring.h"
#include <algorithm>

RestockLedger::RestockLedger(StockCatalog& catalog)
    : catalog_(catalog), journal_(nullptr), next_id_(1) {
}

void RestockLedger::attachJournal(PersistenceManager* journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = journal;
}

// ========== 状态变更 ==========

Result<uint64_t> RestockLedger::create(const RestockSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (spec.quantity < 0) {
        LOG_WARNING("RestockLedger", "create", "Negative quantity for item " + spec.item_id);
        return RESULT_ERROR(uint64_t, ErrorCode::NEGATIVE_QUANTITY, "Quantity cannot be negative",
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "create", spec.item_id, ""));
    }
    if (spec.quantity == 0) {
        LOG_WARNING("RestockLedger", "create", "Zero quantity for item " + spec.item_id);
        return RESULT_ERROR(uint64_t, ErrorCode::INVALID_PARAMETER, "Quantity must be positive",
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "create", spec.item_id, ""));
    }

    auto item = catalog_.getItem(spec.item_id);
    if (!item) {
        LOG_WARNING("RestockLedger", "create", "Item not found: " + spec.item_id);
        return RESULT_ERROR(uint64_t, ErrorCode::ITEM_NOT_FOUND, "Item not found: " + spec.item_id,
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "create", spec.item_id, ""));
    }

    auto open = open_by_item_.find(spec.item_id);
    if (open != open_by_item_.end()) {
        MONITOR().recordDuplicateRejected();
        LOG_DEBUG("RestockLedger", "create",
                  "Open request " + std::to_string(open->second) + " already exists for item " + spec.item_id);
        return RESULT_ERROR(uint64_t, ErrorCode::DUPLICATE_OPEN_REQUEST,
                            "An open restock request already exists for item " + spec.item_id,
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "create", spec.item_id,
                                                   std::to_string(open->second)));
    }

    RestockRequest request;
    request.request_id = next_id_;
    request.item_id = item->id;
    request.item_name = item->name;
    request.facility_id = item->facility_id;
    request.facility_name = item->facility_name;
    request.quantity = spec.quantity;
    request.priority = spec.priority;
    request.status = RequestStatus::PENDING;
    request.source = spec.source;
    request.requested_at = currentUtcTimestamp();
    request.updated_at = request.requested_at;
    request.comments = spec.comments;
    request.days_remaining = spec.days_remaining;

    // WAL: 先写磁盘，再更新内存
    if (journal_ && !journal_->writeRequest(request)) {
        LOG_ERROR("RestockLedger", "create", "Journal write failed for item " + spec.item_id);
        return RESULT_ERROR(uint64_t, ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal restock request",
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "create", spec.item_id,
                                                   std::to_string(request.request_id)));
    }

    requests_[request.request_id] = request;
    open_by_item_[request.item_id] = request.request_id;
    next_id_++;

    RECORD_REQUEST_CREATED(sourceToString(request.source), priorityToString(request.priority));
    updateOpenGauge();

    LOG_BUSINESS_EVENT("REQUEST_CREATED", request.item_id,
                       "request_id=" + std::to_string(request.request_id) +
                       ", quantity=" + std::to_string(request.quantity) +
                       ", priority=" + priorityToString(request.priority) +
                       ", source=" + sourceToString(request.source));

    return Result<uint64_t>::success(request.request_id);
}

Result<RestockRequest> RestockLedger::approve(uint64_t request_id, const std::optional<std::string>& comments) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition(request_id, RequestStatus::APPROVED, "approve", comments);
}

Result<RestockRequest> RestockLedger::decline(uint64_t request_id, const std::optional<std::string>& comments) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition(request_id, RequestStatus::DECLINED, "decline", comments);
}

Result<RestockRequest> RestockLedger::transition(uint64_t request_id, RequestStatus to,
                                                 const std::string& operation,
                                                 const std::optional<std::string>& comments) {
    std::string id_text = std::to_string(request_id);

    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return RESULT_ERROR(RestockRequest, ErrorCode::REQUEST_NOT_FOUND, "Restock request not found: " + id_text,
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", operation, "", id_text));
    }

    if (it->second.status != RequestStatus::PENDING) {
        LOG_WARNING("RestockLedger", operation,
                    "Cannot move request " + id_text + " from " + statusToString(it->second.status) +
                    " to " + statusToString(to));
        return RESULT_ERROR(RestockRequest, ErrorCode::INVALID_TRANSITION,
                            "Cannot " + operation + " a request in status " + statusToString(it->second.status),
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", operation, it->second.item_id, id_text));
    }

    RestockRequest updated = it->second;
    updated.status = to;
    updated.updated_at = currentUtcTimestamp();
    if (comments) {
        updated.comments = *comments;
    }

    if (journal_ && !journal_->writeRequest(updated)) {
        LOG_ERROR("RestockLedger", operation, "Journal write failed for request " + id_text);
        return RESULT_ERROR(RestockRequest, ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal status change",
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", operation, updated.item_id, id_text));
    }

    it->second = updated;
    if (!updated.isOpen()) {
        open_by_item_.erase(updated.item_id);
    }

    RECORD_REQUEST_TRANSITION(statusToString(to));
    updateOpenGauge();
    LOG_BUSINESS_EVENT(to == RequestStatus::APPROVED ? "REQUEST_APPROVED" : "REQUEST_DECLINED",
                       updated.item_id, "request_id=" + id_text);

    return Result<RestockRequest>::success(updated);
}

Result<RestockRequest> RestockLedger::fulfill(uint64_t request_id, const std::optional<std::string>& comments) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id_text = std::to_string(request_id);

    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return RESULT_ERROR(RestockRequest, ErrorCode::REQUEST_NOT_FOUND, "Restock request not found: " + id_text,
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "fulfill", "", id_text));
    }

    if (it->second.status != RequestStatus::APPROVED) {
        LOG_WARNING("RestockLedger", "fulfill",
                    "Cannot fulfill request " + id_text + " in status " + statusToString(it->second.status));
        return RESULT_ERROR(RestockRequest, ErrorCode::INVALID_TRANSITION,
                            "Only approved requests can be fulfilled, request is " +
                            statusToString(it->second.status),
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "fulfill", it->second.item_id, id_text));
    }

    RestockRequest updated = it->second;
    updated.status = RequestStatus::FULFILLED;
    updated.updated_at = currentUtcTimestamp();
    if (comments) {
        updated.comments = *comments;
    }

    // 库存与请求状态在同一次日志写入中落盘，写入成功后目录才提交
    PersistenceManager* journal = journal_;
    auto credited = catalog_.creditStock(updated.item_id, updated.quantity,
        [journal, &updated, &id_text](const Item& item) -> Result<void> {
            if (journal && !journal->writeFulfillment(item, updated)) {
                return RESULT_ERROR_VOID(ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal fulfillment",
                                         ERROR_CONTEXT_WITH_IDS("RestockLedger", "fulfill", item.id, id_text));
            }
            return RESULT_SUCCESS_VOID();
        });

    if (credited.isError()) {
        LOG_WARNING("RestockLedger", "fulfill",
                    "Request " + id_text + " stays Approved: " + credited.getErrorMessage());
        return RESULT_ERROR(RestockRequest, credited.getErrorCode(), credited.getErrorMessage(),
                            ERROR_CONTEXT_WITH_IDS("RestockLedger", "fulfill", updated.item_id, id_text));
    }

    it->second = updated;
    open_by_item_.erase(updated.item_id);

    RECORD_REQUEST_TRANSITION(statusToString(RequestStatus::FULFILLED));
    updateOpenGauge();
    LOG_BUSINESS_EVENT("REQUEST_FULFILLED", updated.item_id,
                       "request_id=" + id_text + ", quantity=" + std::to_string(updated.quantity) +
                       ", new_stock=" + std::to_string(credited.getValue().current_stock));

    return Result<RestockRequest>::success(updated);
}

// ========== 查询 ==========

std::optional<RestockRequest> RestockLedger::get(uint64_t request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RestockRequest> RestockLedger::openRequestFor(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto open = open_by_item_.find(item_id);
    if (open == open_by_item_.end()) {
        return std::nullopt;
    }
    return requests_.at(open->second);
}

std::vector<RestockRequest> RestockLedger::list(std::optional<RequestStatus> status,
                                                const std::string& facility_id) const {
    std::vector<RestockRequest> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : requests_) {
            const RestockRequest& request = pair.second;
            if (status && request.status != *status) continue;
            if (!facility_id.empty() && request.facility_id != facility_id) continue;
            result.push_back(request);
        }
    }

    std::sort(result.begin(), result.end(), [](const RestockRequest& a, const RestockRequest& b) {
        if (a.requested_at != b.requested_at) {
            return a.requested_at < b.requested_at;
        }
        return a.request_id < b.request_id;
    });
    return result;
}

size_t RestockLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

size_t RestockLedger::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_by_item_.size();
}

// ========== 恢复与快照 ==========

void RestockLedger::restoreRequest(const RestockRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto previous = requests_.find(request.request_id);
    if (previous != requests_.end() && previous->second.isOpen()) {
        open_by_item_.erase(previous->second.item_id);
    }

    requests_[request.request_id] = request;
    if (request.isOpen()) {
        open_by_item_[request.item_id] = request.request_id;
    }
    if (request.request_id >= next_id_) {
        next_id_ = request.request_id + 1;
    }
    updateOpenGauge();
}

void RestockLedger::withConsistentState(
    const std::function<void(const std::map<std::string, Item>&,
                             const std::map<uint64_t, RestockRequest>&)>& visitor) const {
    // 锁顺序：台账 -> 目录
    std::lock_guard<std::mutex> lock(mutex_);
    catalog_.withLockedItems([this, &visitor](const std::map<std::string, Item>& items) {
        visitor(items, requests_);
    });
}

void RestockLedger::updateOpenGauge() const {
    SET_GAUGE("open_requests_count", static_cast<double>(open_by_item_.size()));
}
