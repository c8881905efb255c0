#include "error_handling.h"
#include "logger.h"

std::string ErrorHandler::errorCodeToString(ErrorCode code) {
    const auto& strings = errorCodeStrings();
    auto it = strings.find(code);
    if (it != strings.end()) {
        return it->second;
    }

    return "UNKNOWN_ERROR_CODE_" + std::to_string(static_cast<int>(code));
}

std::string ErrorHandler::errorCodeToUserMessage(ErrorCode code) {
    const auto& messages = userMessages();
    auto it = messages.find(code);
    if (it != messages.end()) {
        return it->second;
    }

    return "系统发生未知错误，请联系管理员";
}

ErrorKind ErrorHandler::errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return ErrorKind::NONE;
        case ErrorCode::INVALID_PARAMETER:
        case ErrorCode::NEGATIVE_QUANTITY:
        case ErrorCode::INSUFFICIENT_STOCK:
        case ErrorCode::INVALID_CONFIG:
        case ErrorCode::DUPLICATE_ITEM_ID:
        case ErrorCode::HTTP_PARSE_ERROR:
        case ErrorCode::JSON_PARSE_ERROR:
            return ErrorKind::VALIDATION_ERROR;
        case ErrorCode::ITEM_NOT_FOUND:
        case ErrorCode::REQUEST_NOT_FOUND:
        case ErrorCode::HTTP_ROUTE_NOT_FOUND:
            return ErrorKind::NOT_FOUND;
        case ErrorCode::DUPLICATE_OPEN_REQUEST:
            return ErrorKind::DUPLICATE_OPEN_REQUEST;
        case ErrorCode::INVALID_TRANSITION:
            return ErrorKind::INVALID_TRANSITION;
        default:
            return ErrorKind::INTERNAL_ERROR;
    }
}

std::string ErrorHandler::errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::VALIDATION_ERROR: return "ValidationError";
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::DUPLICATE_OPEN_REQUEST: return "DuplicateOpenRequest";
        case ErrorKind::INVALID_TRANSITION: return "InvalidTransition";
        case ErrorKind::INTERNAL_ERROR: return "InternalError";
    }
    return "InternalError";
}

void ErrorHandler::logError(ErrorCode code, const std::string& message, const ErrorContext& context) {
    Logger::getInstance().error(context.component, context.operation,
                                formatDetails(code, message, context));
}

void ErrorHandler::logWarning(ErrorCode code, const std::string& message, const ErrorContext& context) {
    Logger::getInstance().warning(context.component, context.operation,
                                  formatDetails(code, message, context));
}

ErrorContext ErrorHandler::createContext(const std::string& component, const std::string& operation,
                                         const std::string& item_id, const std::string& request_id) {
    ErrorContext context;
    context.component = component;
    context.operation = operation;
    context.item_id = item_id;
    context.request_id = request_id;
    return context;
}

std::string ErrorHandler::formatDetails(ErrorCode code, const std::string& message,
                                        const ErrorContext& context) {
    std::string details = errorCodeToString(code) + ": " + message;

    if (!context.item_id.empty() || !context.request_id.empty()) {
        details += " [";
        if (!context.item_id.empty()) {
            details += "Item: " + context.item_id;
        }
        if (!context.request_id.empty()) {
            if (!context.item_id.empty()) {
                details += ", ";
            }
            details += "Request: " + context.request_id;
        }
        details += "]";
    }

    if (!context.additional_info.empty()) {
        details += " - " + context.additional_info;
    }

    return details;
}

const std::unordered_map<ErrorCode, std::string>& ErrorHandler::errorCodeStrings() {
    // 函数内静态变量，首次使用时线程安全地初始化
    static const std::unordered_map<ErrorCode, std::string> strings = {
        {ErrorCode::SUCCESS, "SUCCESS"},
        {ErrorCode::UNKNOWN_ERROR, "UNKNOWN_ERROR"},
        {ErrorCode::INVALID_PARAMETER, "INVALID_PARAMETER"},
        {ErrorCode::NEGATIVE_QUANTITY, "NEGATIVE_QUANTITY"},
        {ErrorCode::INSUFFICIENT_STOCK, "INSUFFICIENT_STOCK"},
        {ErrorCode::INVALID_CONFIG, "INVALID_CONFIG"},

        {ErrorCode::ITEM_NOT_FOUND, "ITEM_NOT_FOUND"},
        {ErrorCode::DUPLICATE_ITEM_ID, "DUPLICATE_ITEM_ID"},

        {ErrorCode::REQUEST_NOT_FOUND, "REQUEST_NOT_FOUND"},
        {ErrorCode::DUPLICATE_OPEN_REQUEST, "DUPLICATE_OPEN_REQUEST"},
        {ErrorCode::INVALID_TRANSITION, "INVALID_TRANSITION"},

        {ErrorCode::PERSISTENCE_INIT_FAILED, "PERSISTENCE_INIT_FAILED"},
        {ErrorCode::JOURNAL_WRITE_FAILED, "JOURNAL_WRITE_FAILED"},
        {ErrorCode::JOURNAL_READ_FAILED, "JOURNAL_READ_FAILED"},
        {ErrorCode::SNAPSHOT_CREATE_FAILED, "SNAPSHOT_CREATE_FAILED"},
        {ErrorCode::SNAPSHOT_LOAD_FAILED, "SNAPSHOT_LOAD_FAILED"},
        {ErrorCode::DATA_CORRUPTION_DETECTED, "DATA_CORRUPTION_DETECTED"},
        {ErrorCode::FILE_LOCK_FAILED, "FILE_LOCK_FAILED"},

        {ErrorCode::HTTP_PARSE_ERROR, "HTTP_PARSE_ERROR"},
        {ErrorCode::HTTP_ROUTE_NOT_FOUND, "HTTP_ROUTE_NOT_FOUND"},
        {ErrorCode::HTTP_METHOD_NOT_ALLOWED, "HTTP_METHOD_NOT_ALLOWED"},
        {ErrorCode::JSON_PARSE_ERROR, "JSON_PARSE_ERROR"},

        {ErrorCode::SOCKET_CREATE_FAILED, "SOCKET_CREATE_FAILED"},
        {ErrorCode::SOCKET_BIND_FAILED, "SOCKET_BIND_FAILED"},
        {ErrorCode::SOCKET_LISTEN_FAILED, "SOCKET_LISTEN_FAILED"}
    };
    return strings;
}

const std::unordered_map<ErrorCode, std::string>& ErrorHandler::userMessages() {
    static const std::unordered_map<ErrorCode, std::string> messages = {
        {ErrorCode::SUCCESS, "操作成功"},
        {ErrorCode::UNKNOWN_ERROR, "系统发生未知错误"},
        {ErrorCode::INVALID_PARAMETER, "输入参数无效"},
        {ErrorCode::NEGATIVE_QUANTITY, "数量不能为负数"},
        {ErrorCode::INSUFFICIENT_STOCK, "库存不足，无法扣减"},
        {ErrorCode::INVALID_CONFIG, "配置项无效"},

        {ErrorCode::ITEM_NOT_FOUND, "物品不存在"},
        {ErrorCode::DUPLICATE_ITEM_ID, "物品ID已存在"},

        {ErrorCode::REQUEST_NOT_FOUND, "补货请求不存在"},
        {ErrorCode::DUPLICATE_OPEN_REQUEST, "该物品已有未完成的补货请求"},
        {ErrorCode::INVALID_TRANSITION, "当前状态不允许该操作"},

        {ErrorCode::PERSISTENCE_INIT_FAILED, "数据持久化初始化失败"},
        {ErrorCode::JOURNAL_WRITE_FAILED, "数据写入失败"},
        {ErrorCode::JOURNAL_READ_FAILED, "数据读取失败"},
        {ErrorCode::SNAPSHOT_CREATE_FAILED, "数据快照创建失败"},
        {ErrorCode::SNAPSHOT_LOAD_FAILED, "数据恢复失败"},
        {ErrorCode::DATA_CORRUPTION_DETECTED, "检测到数据损坏"},
        {ErrorCode::FILE_LOCK_FAILED, "数据目录已被其他进程占用"},

        {ErrorCode::HTTP_PARSE_ERROR, "请求解析错误"},
        {ErrorCode::HTTP_ROUTE_NOT_FOUND, "请求的接口不存在"},
        {ErrorCode::HTTP_METHOD_NOT_ALLOWED, "不支持的请求方法"},
        {ErrorCode::JSON_PARSE_ERROR, "数据格式错误"},

        {ErrorCode::SOCKET_CREATE_FAILED, "网络套接字创建失败"},
        {ErrorCode::SOCKET_BIND_FAILED, "端口绑定失败"},
        {ErrorCode::SOCKET_LISTEN_FAILED, "服务器监听失败"}
    };
    return messages;
}
