#include "restock_policy.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

std::string quantityModeToString(QuantityMode mode) {
    return mode == QuantityMode::FIXED ? "fixed" : "top_up";
}

bool parseQuantityMode(const std::string& text, QuantityMode& mode) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "top_up") { mode = QuantityMode::TOP_UP; return true; }
    if (lower == "fixed") { mode = QuantityMode::FIXED; return true; }
    return false;
}

RestockPolicy::RestockPolicy(const PolicyConfig& config) : config_(config) {
}

Result<void> RestockPolicy::validateConfig(const PolicyConfig& config) {
    if (config.trigger_tier == UrgencyTier::UNKNOWN) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Trigger tier cannot be Unknown",
                                 ERROR_CONTEXT("RestockPolicy", "validateConfig"));
    }
    if (config.target_days <= 0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Target days must be positive",
                                 ERROR_CONTEXT("RestockPolicy", "validateConfig"));
    }
    if (config.fixed_reorder_quantity <= 0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Fixed reorder quantity must be positive",
                                 ERROR_CONTEXT("RestockPolicy", "validateConfig"));
    }
    if (config.minimum_quantity <= 0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Minimum quantity must be positive",
                                 ERROR_CONTEXT("RestockPolicy", "validateConfig"));
    }
    return RESULT_SUCCESS_VOID();
}

bool RestockPolicy::triggers(UrgencyTier tier) const {
    if (tier == UrgencyTier::UNKNOWN) {
        return false;
    }
    return static_cast<int>(tier) >= static_cast<int>(config_.trigger_tier);
}

int64_t RestockPolicy::suggestedQuantity(const Item& item) const {
    int64_t quantity = config_.fixed_reorder_quantity;

    if (config_.quantity_mode == QuantityMode::TOP_UP && item.daily_usage > 0.0) {
        double target = std::ceil(item.daily_usage * static_cast<double>(config_.target_days));
        double needed = target - static_cast<double>(item.current_stock);
        if (needed >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            quantity = std::numeric_limits<int64_t>::max();
        } else if (needed <= 0.0) {
            quantity = 0;
        } else {
            quantity = static_cast<int64_t>(needed);
        }
    }

    return std::max(quantity, config_.minimum_quantity);
}

std::optional<RestockSpec> RestockPolicy::evaluate(const Item& item, const Forecast& forecast,
                                                   bool has_open_request) const {
    if (has_open_request || !forecast.has_estimate || !triggers(forecast.tier)) {
        return std::nullopt;
    }

    RestockSpec spec;
    spec.item_id = item.id;
    spec.quantity = suggestedQuantity(item);
    spec.priority = priorityFromTier(forecast.tier);
    spec.source = RequestSource::AUTO;
    spec.days_remaining = forecast.remaining_days;
    spec.comments = "Auto-generated: " + std::to_string(forecast.remaining_days) +
                    " days of stock remaining";
    return spec;
}
