#ifndef ERROR_HANDLING_H
#define ERROR_HANDLING_H

#include <string>
#include <exception>
#include <unordered_map>
#include <memory>
#include <stdexcept>
#include <cstdint>

// 错误码枚举 - 分模块设计
enum class ErrorCode {
    // 通用错误 (1000-1999)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1000,
    INVALID_PARAMETER = 1001,
    NEGATIVE_QUANTITY = 1002,
    INSUFFICIENT_STOCK = 1003,
    INVALID_CONFIG = 1004,

    // 库存目录错误 (2000-2099)
    ITEM_NOT_FOUND = 2000,
    DUPLICATE_ITEM_ID = 2001,

    // 补货请求台账错误 (2100-2199)
    REQUEST_NOT_FOUND = 2100,
    DUPLICATE_OPEN_REQUEST = 2101,
    INVALID_TRANSITION = 2102,

    // 持久化错误 (3000-3999)
    PERSISTENCE_INIT_FAILED = 3000,
    JOURNAL_WRITE_FAILED = 3001,
    JOURNAL_READ_FAILED = 3002,
    SNAPSHOT_CREATE_FAILED = 3003,
    SNAPSHOT_LOAD_FAILED = 3004,
    DATA_CORRUPTION_DETECTED = 3005,
    FILE_LOCK_FAILED = 3006,

    // HTTP服务器错误 (4000-4999)
    HTTP_PARSE_ERROR = 4001,
    HTTP_ROUTE_NOT_FOUND = 4003,
    HTTP_METHOD_NOT_ALLOWED = 4004,
    JSON_PARSE_ERROR = 4005,

    // 网络错误 (5000-5999)
    SOCKET_CREATE_FAILED = 5000,
    SOCKET_BIND_FAILED = 5001,
    SOCKET_LISTEN_FAILED = 5002
};

// 面向调用方的错误分类
enum class ErrorKind {
    NONE,
    VALIDATION_ERROR,
    NOT_FOUND,
    DUPLICATE_OPEN_REQUEST,
    INVALID_TRANSITION,
    INTERNAL_ERROR
};

// 错误上下文信息
struct ErrorContext {
    std::string component;       // 出错的组件
    std::string operation;       // 出错的操作
    std::string item_id;         // 相关的物品ID（如果有）
    std::string request_id;      // 相关的补货请求ID（如果有）
    std::string additional_info; // 额外信息

    ErrorContext() = default;

    ErrorContext(const std::string& comp, const std::string& op)
        : component(comp), operation(op) {}

    ErrorContext(const std::string& comp, const std::string& op,
                 const std::string& item, const std::string& request = "")
        : component(comp), operation(op), item_id(item), request_id(request) {}
};

// 结果类模板 - 用于返回操作结果或错误
template<typename T>
class Result {
public:
    static Result<T> success(T&& value) {
        Result<T> result;
        result.success_ = true;
        result.value_ = std::move(value);
        return result;
    }

    static Result<T> success(const T& value) {
        Result<T> result;
        result.success_ = true;
        result.value_ = value;
        return result;
    }

    static Result<T> error(ErrorCode code, const std::string& message = "",
                           const ErrorContext& context = ErrorContext()) {
        Result<T> result;
        result.success_ = false;
        result.error_code_ = code;
        result.error_message_ = message;
        result.error_context_ = context;
        return result;
    }

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    // 获取值（仅在成功时有效）
    const T& getValue() const {
        if (!success_) {
            throw std::runtime_error("Attempt to get value from error result: " + error_message_);
        }
        return value_;
    }

    T& getValue() {
        if (!success_) {
            throw std::runtime_error("Attempt to get value from error result: " + error_message_);
        }
        return value_;
    }

    ErrorCode getErrorCode() const { return error_code_; }
    const std::string& getErrorMessage() const { return error_message_; }
    const ErrorContext& getErrorContext() const { return error_context_; }

    explicit operator bool() const { return success_; }

private:
    bool success_ = false;
    T value_{};
    ErrorCode error_code_ = ErrorCode::UNKNOWN_ERROR;
    std::string error_message_;
    ErrorContext error_context_;
};

// void类型的特化
template<>
class Result<void> {
public:
    static Result<void> success() {
        Result<void> result;
        result.success_ = true;
        return result;
    }

    static Result<void> error(ErrorCode code, const std::string& message = "",
                              const ErrorContext& context = ErrorContext()) {
        Result<void> result;
        result.success_ = false;
        result.error_code_ = code;
        result.error_message_ = message;
        result.error_context_ = context;
        return result;
    }

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    ErrorCode getErrorCode() const { return error_code_; }
    const std::string& getErrorMessage() const { return error_message_; }
    const ErrorContext& getErrorContext() const { return error_context_; }

    explicit operator bool() const { return success_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::UNKNOWN_ERROR;
    std::string error_message_;
    ErrorContext error_context_;
};

// 自定义异常类（构造阶段的失败，例如数据目录无法初始化）
class StockwatchException : public std::exception {
public:
    StockwatchException(ErrorCode code, const std::string& message,
                        const ErrorContext& context = ErrorContext())
        : error_code_(code), error_message_(message), error_context_(context) {

        full_message_ = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (!context.component.empty()) {
            full_message_ += " (Component: " + context.component;
            if (!context.operation.empty()) {
                full_message_ += ", Operation: " + context.operation;
            }
            full_message_ += ")";
        }
    }

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCode getErrorCode() const { return error_code_; }
    const std::string& getErrorMessage() const { return error_message_; }
    const ErrorContext& getErrorContext() const { return error_context_; }

private:
    ErrorCode error_code_;
    std::string error_message_;
    ErrorContext error_context_;
    std::string full_message_;
};

// 错误处理工具类
class ErrorHandler {
public:
    // 错误码转字符串
    static std::string errorCodeToString(ErrorCode code);

    // 错误码转用户友好的消息
    static std::string errorCodeToUserMessage(ErrorCode code);

    // 错误码归类
    static ErrorKind errorKind(ErrorCode code);
    static std::string errorKindToString(ErrorKind kind);

    // 记录错误到日志系统
    static void logError(ErrorCode code, const std::string& message,
                         const ErrorContext& context = ErrorContext());

    // 记录警告到日志系统
    static void logWarning(ErrorCode code, const std::string& message,
                           const ErrorContext& context = ErrorContext());

    // 从异常创建Result
    template<typename T>
    static Result<T> fromException(const std::exception& e,
                                   const ErrorContext& context = ErrorContext()) {
        if (const auto* stock_ex = dynamic_cast<const StockwatchException*>(&e)) {
            return Result<T>::error(stock_ex->getErrorCode(),
                                    stock_ex->getErrorMessage(),
                                    stock_ex->getErrorContext());
        }

        return Result<T>::error(ErrorCode::UNKNOWN_ERROR, e.what(), context);
    }

    static ErrorContext createContext(const std::string& component,
                                      const std::string& operation,
                                      const std::string& item_id = "",
                                      const std::string& request_id = "");

private:
    static std::string formatDetails(ErrorCode code, const std::string& message,
                                     const ErrorContext& context);
    static const std::unordered_map<ErrorCode, std::string>& errorCodeStrings();
    static const std::unordered_map<ErrorCode, std::string>& userMessages();
};

// ========== 便捷宏定义 ==========

#define RESULT_SUCCESS_VOID() Result<void>::success()

#define RESULT_ERROR(type, code, message, context) Result<type>::error(code, message, context)
#define RESULT_ERROR_VOID(code, message, context) Result<void>::error(code, message, context)

#define ERROR_CONTEXT(component, operation) \
    ErrorHandler::createContext(component, operation)

#define ERROR_CONTEXT_WITH_IDS(component, operation, item_id, request_id) \
    ErrorHandler::createContext(component, operation, item_id, request_id)

#define THROW_ERROR(code, message, context) \
    throw StockwatchException(code, message, context)

#endif // ERROR_HANDLING_H
