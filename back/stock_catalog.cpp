#include "stock_catalog.h"
#include "logger.h"
#include "monitoring.h"
#include <cmath>
#include <limits>

StockCatalog::StockCatalog() : journal_(nullptr) {
}

void StockCatalog::attachJournal(PersistenceManager* journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = journal;
}

Result<void> StockCatalog::validateItem(const Item& item) {
    if (item.id.empty()) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_PARAMETER, "Item ID cannot be empty",
                                 ERROR_CONTEXT("StockCatalog", "validateItem"));
    }
    if (item.name.empty()) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_PARAMETER, "Item name cannot be empty",
                                 ERROR_CONTEXT_WITH_IDS("StockCatalog", "validateItem", item.id, ""));
    }
    if (item.current_stock < 0) {
        return RESULT_ERROR_VOID(ErrorCode::NEGATIVE_QUANTITY,
                                 "Stock cannot be negative: " + std::to_string(item.current_stock),
                                 ERROR_CONTEXT_WITH_IDS("StockCatalog", "validateItem", item.id, ""));
    }
    if (!std::isfinite(item.daily_usage) || item.daily_usage < 0.0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_PARAMETER,
                                 "Daily usage must be a finite non-negative number",
                                 ERROR_CONTEXT_WITH_IDS("StockCatalog", "validateItem", item.id, ""));
    }
    return RESULT_SUCCESS_VOID();
}

// ========== 物品录入与修改 ==========

Result<Item> StockCatalog::addItem(const Item& item) {
    auto validation = validateItem(item);
    if (validation.isError()) {
        LOG_WARNING("StockCatalog", "addItem", validation.getErrorMessage());
        return RESULT_ERROR(Item, validation.getErrorCode(), validation.getErrorMessage(),
                            validation.getErrorContext());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (items_.count(item.id) > 0) {
        LOG_WARNING("StockCatalog", "addItem", "Duplicate item ID: " + item.id);
        return RESULT_ERROR(Item, ErrorCode::DUPLICATE_ITEM_ID, "Item ID already exists: " + item.id,
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", "addItem", item.id, ""));
    }

    Item stored = item;
    stored.updated_at = currentUtcTimestamp();

    // WAL: 先写磁盘，再更新内存
    if (journal_ && !journal_->writeItem(stored)) {
        return RESULT_ERROR(Item, ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal new item",
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", "addItem", item.id, ""));
    }

    items_[stored.id] = stored;
    SET_GAUGE("catalog_items_count", static_cast<double>(items_.size()));

    LOG_INFO("StockCatalog", "addItem",
             "Item added: " + stored.id + " (" + stored.name + "), stock=" +
             std::to_string(stored.current_stock));
    return Result<Item>::success(stored);
}

Result<Item> StockCatalog::updateItem(const std::string& id, const ItemPatch& patch) {
    if (patch.empty()) {
        return RESULT_ERROR(Item, ErrorCode::INVALID_PARAMETER, "Update contains no fields",
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", "updateItem", id, ""));
    }

    return applyChange(id, "updateItem", [&patch](Item& item) {
        if (patch.name) item.name = *patch.name;
        if (patch.category) item.category = *patch.category;
        if (patch.unit) item.unit = *patch.unit;
        if (patch.facility_id) item.facility_id = *patch.facility_id;
        if (patch.facility_name) item.facility_name = *patch.facility_name;
        if (patch.current_stock) item.current_stock = *patch.current_stock;
        if (patch.daily_usage) item.daily_usage = *patch.daily_usage;
        return RESULT_SUCCESS_VOID();
    });
}

Result<Item> StockCatalog::setStock(const std::string& id, int64_t quantity) {
    return applyChange(id, "setStock", [quantity](Item& item) {
        item.current_stock = quantity;
        return RESULT_SUCCESS_VOID();
    });
}

Result<Item> StockCatalog::setDailyUsage(const std::string& id, double daily_usage) {
    return applyChange(id, "setDailyUsage", [daily_usage](Item& item) {
        item.daily_usage = daily_usage;
        return RESULT_SUCCESS_VOID();
    });
}

Result<Item> StockCatalog::recordUsage(const std::string& id, int64_t quantity_used) {
    if (quantity_used < 0) {
        return RESULT_ERROR(Item, ErrorCode::NEGATIVE_QUANTITY, "Quantity used cannot be negative",
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", "recordUsage", id, ""));
    }

    auto result = applyChange(id, "recordUsage", [quantity_used, &id](Item& item) {
        if (quantity_used > item.current_stock) {
            return RESULT_ERROR_VOID(ErrorCode::INSUFFICIENT_STOCK,
                                     "Usage of " + std::to_string(quantity_used) +
                                     " exceeds current stock " + std::to_string(item.current_stock),
                                     ERROR_CONTEXT_WITH_IDS("StockCatalog", "recordUsage", id, ""));
        }
        item.current_stock -= quantity_used;
        return RESULT_SUCCESS_VOID();
    });

    if (result.isSuccess()) {
        LOG_BUSINESS_EVENT("USAGE_RECORDED", id,
                           "used=" + std::to_string(quantity_used) +
                           ", remaining=" + std::to_string(result.getValue().current_stock));
    }
    return result;
}

Result<Item> StockCatalog::creditStock(const std::string& id, int64_t quantity, const CommitGuard& guard) {
    if (quantity <= 0) {
        return RESULT_ERROR(Item, ErrorCode::INVALID_PARAMETER, "Credit quantity must be positive",
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", "creditStock", id, ""));
    }

    return applyChange(id, "creditStock", [quantity, &id](Item& item) {
        if (item.current_stock > std::numeric_limits<int64_t>::max() - quantity) {
            return RESULT_ERROR_VOID(ErrorCode::INVALID_PARAMETER, "Stock would overflow",
                                     ERROR_CONTEXT_WITH_IDS("StockCatalog", "creditStock", id, ""));
        }
        item.current_stock += quantity;
        return RESULT_SUCCESS_VOID();
    }, guard);
}

Result<void> StockCatalog::removeItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (items_.count(id) == 0) {
        return RESULT_ERROR_VOID(ErrorCode::ITEM_NOT_FOUND, "Item not found: " + id,
                                 ERROR_CONTEXT_WITH_IDS("StockCatalog", "removeItem", id, ""));
    }

    if (journal_ && !journal_->writeItemRemoval(id)) {
        return RESULT_ERROR_VOID(ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal item removal",
                                 ERROR_CONTEXT_WITH_IDS("StockCatalog", "removeItem", id, ""));
    }

    items_.erase(id);
    SET_GAUGE("catalog_items_count", static_cast<double>(items_.size()));
    LOG_INFO("StockCatalog", "removeItem", "Item archived: " + id);
    return RESULT_SUCCESS_VOID();
}

Result<Item> StockCatalog::applyChange(const std::string& id, const std::string& operation,
                                       const std::function<Result<void>(Item&)>& mutate,
                                       const CommitGuard& guard) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        LOG_WARNING("StockCatalog", operation, "Item not found: " + id);
        return RESULT_ERROR(Item, ErrorCode::ITEM_NOT_FOUND, "Item not found: " + id,
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", operation, id, ""));
    }

    // 在副本上修改，失败时原记录不变
    Item updated = it->second;
    auto mutation = mutate(updated);
    if (mutation.isError()) {
        LOG_WARNING("StockCatalog", operation, mutation.getErrorMessage());
        return RESULT_ERROR(Item, mutation.getErrorCode(), mutation.getErrorMessage(),
                            mutation.getErrorContext());
    }

    auto validation = validateItem(updated);
    if (validation.isError()) {
        LOG_WARNING("StockCatalog", operation, validation.getErrorMessage());
        return RESULT_ERROR(Item, validation.getErrorCode(), validation.getErrorMessage(),
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", operation, id, ""));
    }

    updated.updated_at = currentUtcTimestamp();

    if (guard) {
        auto guarded = guard(updated);
        if (guarded.isError()) {
            return RESULT_ERROR(Item, guarded.getErrorCode(), guarded.getErrorMessage(),
                                guarded.getErrorContext());
        }
    } else if (journal_ && !journal_->writeItem(updated)) {
        return RESULT_ERROR(Item, ErrorCode::JOURNAL_WRITE_FAILED, "Failed to journal item update",
                            ERROR_CONTEXT_WITH_IDS("StockCatalog", operation, id, ""));
    }

    it->second = updated;

    LOG_DEBUG("StockCatalog", operation,
              "Item " + id + " committed: stock=" + std::to_string(updated.current_stock) +
              ", daily_usage=" + std::to_string(updated.daily_usage));
    return Result<Item>::success(updated);
}

// ========== 查询 ==========

std::optional<Item> StockCatalog::getItem(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StockCatalog::hasItem(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.count(id) > 0;
}

std::vector<Item> StockCatalog::listItems(const std::string& facility_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Item> result;
    result.reserve(items_.size());
    for (const auto& pair : items_) {
        if (facility_id.empty() || pair.second.facility_id == facility_id) {
            result.push_back(pair.second);
        }
    }
    return result;
}

size_t StockCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

// ========== 恢复与快照 ==========

void StockCatalog::restoreItem(const Item& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_[item.id] = item;
    SET_GAUGE("catalog_items_count", static_cast<double>(items_.size()));
}

void StockCatalog::withLockedItems(const std::function<void(const std::map<std::string, Item>&)>& visitor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    visitor(items_);
}
