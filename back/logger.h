#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <chrono>
#include <thread>
#include <queue>
#include <deque>
#include <vector>
#include <atomic>
#include <cstdint>
#include <condition_variable>

// 日志级别枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    FATAL = 4
};

// 日志条目结构
struct LogEntry {
    LogLevel level;
    std::string timestamp;
    std::string thread_id;
    std::string component;      // 组件名称 (如 "RestockLedger", "StockCatalog")
    std::string operation;      // 操作名称 (如 "create", "fulfill")
    std::string message;
    std::string file;           // 源文件名
    int line;                   // 行号

    LogEntry() : level(LogLevel::INFO), line(0) {}
};

// 异步日志系统：start() 之前同步写控制台，start() 之后由后台线程写文件
class Logger {
public:
    static Logger& getInstance();

    // ========== 配置管理 ==========

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return log_level_.load(); }

    void setLogFile(const std::string& file_path);

    void enableConsoleOutput(bool enable = true);

    void enableAsyncMode(bool enable = true);

    // 日志文件轮转大小（MB）
    void setMaxFileSize(int mb);

    // 保留的轮转文件数量
    void setMaxFileCount(int count);

    // 解析 "DEBUG"/"info"/... ，无法识别时返回 false
    static bool parseLogLevel(const std::string& text, LogLevel& level);

    // ========== 日志记录接口 ==========

    void log(LogLevel level, const std::string& component, const std::string& operation,
             const std::string& message, const std::string& file = "", int line = 0);

    void debug(const std::string& component, const std::string& operation, const std::string& message,
               const std::string& file = "", int line = 0);
    void info(const std::string& component, const std::string& operation, const std::string& message,
              const std::string& file = "", int line = 0);
    void warning(const std::string& component, const std::string& operation, const std::string& message,
                 const std::string& file = "", int line = 0);
    void error(const std::string& component, const std::string& operation, const std::string& message,
               const std::string& file = "", int line = 0);
    void fatal(const std::string& component, const std::string& operation, const std::string& message,
               const std::string& file = "", int line = 0);

    // ========== 特殊用途日志 ==========

    // 性能监控日志
    void logPerformance(const std::string& operation, double duration_ms, const std::string& details = "");

    // 业务事件日志（补货请求创建/审批/入库、消耗登记等）
    void logBusinessEvent(const std::string& event_type, const std::string& item_id,
                          const std::string& details);

    // ========== 生命周期管理 ==========

    bool start();

    // 停止日志系统（刷新所有缓冲的日志）
    void stop();

    // ========== 查询和统计 ==========

    struct LogStatistics {
        uint64_t total_logs;
        uint64_t debug_count;
        uint64_t info_count;
        uint64_t warning_count;
        uint64_t error_count;
        uint64_t fatal_count;
        double uptime_seconds;

        LogStatistics() : total_logs(0), debug_count(0), info_count(0),
                          warning_count(0), error_count(0), fatal_count(0), uptime_seconds(0.0) {}
    };

    LogStatistics getStatistics() const;

    // 最近的错误日志（从旧到新）
    std::vector<LogEntry> getRecentErrors(int count = 10) const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void asyncLogWorker();
    void writeLogEntry(const LogEntry& entry);
    std::string formatLogEntry(const LogEntry& entry) const;

    // 文件轮转（调用方持有 output_mutex_）
    bool rotateLogFile();
    void removeExpiredLogFiles();

    std::string getCurrentTimestamp() const;
    std::string getThreadId() const;
    std::string logLevelToString(LogLevel level) const;
    std::string colorizeOutput(LogLevel level, const std::string& message) const;

    // ========== 成员变量 ==========

    std::atomic<LogLevel> log_level_;
    std::string log_file_path_;
    std::atomic<bool> console_output_enabled_;
    std::atomic<bool> async_mode_enabled_;
    std::atomic<int> max_file_size_;
    std::atomic<int> max_file_count_;

    // 输出（控制台与文件共用一把锁，避免多线程交错）
    std::unique_ptr<std::ofstream> log_file_;
    std::mutex output_mutex_;

    // 异步队列
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    bool stop_requested_;
    std::atomic<bool> worker_running_;
    std::thread async_worker_;

    mutable std::mutex stats_mutex_;
    LogStatistics statistics_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex recent_errors_mutex_;
    std::deque<LogEntry> recent_errors_;
    static const size_t MAX_RECENT_ERRORS = 100;
};

// ========== 便捷宏定义 ==========

#define LOG_DEBUG(component, operation, message) \
    Logger::getInstance().debug(component, operation, message, __FILE__, __LINE__)

#define LOG_INFO(component, operation, message) \
    Logger::getInstance().info(component, operation, message, __FILE__, __LINE__)

#define LOG_WARNING(component, operation, message) \
    Logger::getInstance().warning(component, operation, message, __FILE__, __LINE__)

#define LOG_ERROR(component, operation, message) \
    Logger::getInstance().error(component, operation, message, __FILE__, __LINE__)

#define LOG_FATAL(component, operation, message) \
    Logger::getInstance().fatal(component, operation, message, __FILE__, __LINE__)

#define LOG_PERFORMANCE(operation, duration_ms, details) \
    Logger::getInstance().logPerformance(operation, duration_ms, details)

#define LOG_BUSINESS_EVENT(event_type, item_id, details) \
    Logger::getInstance().logBusinessEvent(event_type, item_id, details)

// ========== 性能计时器 ==========

// RAII风格的性能计时器
class PerformanceTimer {
public:
    PerformanceTimer(const std::string& operation_name)
        : operation_name_(operation_name)
        , start_time_(std::chrono::steady_clock::now()) {
    }

    ~PerformanceTimer() {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
        LOG_PERFORMANCE(operation_name_, duration.count() / 1000.0, "");
    }

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define PERF_TIMER(operation) PerformanceTimer _perf_timer(operation)

#endif // LOGGER_H
