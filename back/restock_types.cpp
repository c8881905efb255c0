#include "restock_types.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

std::string urgencyTierToString(UrgencyTier tier) {
    switch (tier) {
        case UrgencyTier::UNKNOWN: return "Unknown";
        case UrgencyTier::NORMAL: return "Normal";
        case UrgencyTier::HIGH: return "High";
        case UrgencyTier::CRITICAL: return "Critical";
    }
    return "Unknown";
}

bool parseUrgencyTier(const std::string& text, UrgencyTier& tier) {
    std::string lower = toLower(text);
    if (lower == "unknown") { tier = UrgencyTier::UNKNOWN; return true; }
    if (lower == "normal") { tier = UrgencyTier::NORMAL; return true; }
    if (lower == "high") { tier = UrgencyTier::HIGH; return true; }
    if (lower == "critical") { tier = UrgencyTier::CRITICAL; return true; }
    return false;
}

std::string priorityToString(RequestPriority priority) {
    switch (priority) {
        case RequestPriority::NORMAL: return "Normal";
        case RequestPriority::HIGH: return "High";
        case RequestPriority::CRITICAL: return "Critical";
    }
    return "Normal";
}

bool parsePriority(const std::string& text, RequestPriority& priority) {
    std::string lower = toLower(text);
    if (lower == "normal") { priority = RequestPriority::NORMAL; return true; }
    if (lower == "high") { priority = RequestPriority::HIGH; return true; }
    if (lower == "critical") { priority = RequestPriority::CRITICAL; return true; }
    return false;
}

RequestPriority priorityFromTier(UrgencyTier tier) {
    switch (tier) {
        case UrgencyTier::CRITICAL: return RequestPriority::CRITICAL;
        case UrgencyTier::HIGH: return RequestPriority::HIGH;
        case UrgencyTier::NORMAL:
        case UrgencyTier::UNKNOWN:
            return RequestPriority::NORMAL;
    }
    return RequestPriority::NORMAL;
}

std::string statusToString(RequestStatus status) {
    switch (status) {
        case RequestStatus::PENDING: return "Pending";
        case RequestStatus::APPROVED: return "Approved";
        case RequestStatus::DECLINED: return "Declined";
        case RequestStatus::FULFILLED: return "Fulfilled";
    }
    return "Pending";
}

bool parseStatus(const std::string& text, RequestStatus& status) {
    std::string lower = toLower(text);
    if (lower == "pending") { status = RequestStatus::PENDING; return true; }
    if (lower == "approved") { status = RequestStatus::APPROVED; return true; }
    if (lower == "declined") { status = RequestStatus::DECLINED; return true; }
    if (lower == "fulfilled") { status = RequestStatus::FULFILLED; return true; }
    return false;
}

std::string sourceToString(RequestSource source) {
    return source == RequestSource::MANUAL ? "manual" : "auto";
}

bool parseSource(const std::string& text, RequestSource& source) {
    std::string lower = toLower(text);
    if (lower == "auto") { source = RequestSource::AUTO; return true; }
    if (lower == "manual") { source = RequestSource::MANUAL; return true; }
    return false;
}

std::string currentUtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return ss.str();
}
