#include "logger.h"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : log_level_(LogLevel::INFO)
    , console_output_enabled_(true)
    , async_mode_enabled_(true)
    , max_file_size_(100)  // 100MB
    , max_file_count_(10)
    , stop_requested_(false)
    , worker_running_(false)
    , start_time_(std::chrono::steady_clock::now()) {

    log_file_path_ = "./logs/stockwatch.log";
}

Logger::~Logger() {
    stop();
}

bool Logger::start() {
    try {
        std::filesystem::path log_path(log_file_path_);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            log_file_ = std::make_unique<std::ofstream>(log_file_path_, std::ios::app);
            if (!log_file_->is_open()) {
                std::cerr << "Failed to open log file: " << log_file_path_ << std::endl;
                log_file_.reset();
                return false;
            }
        }

        if (async_mode_enabled_ && !worker_running_) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                stop_requested_ = false;
            }
            async_worker_ = std::thread(&Logger::asyncLogWorker, this);
            worker_running_ = true;
        }

        info("Logger", "start", "Log system started, writing to " + log_file_path_);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::stop() {
    if (worker_running_ && async_worker_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_requested_ = true;
        }
        queue_condition_.notify_all();
        async_worker_.join();
        worker_running_ = false;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_ && log_file_->is_open()) {
        log_file_->flush();
        log_file_->close();
    }
    log_file_.reset();
}

void Logger::setLogLevel(LogLevel level) {
    log_level_ = level;
}

void Logger::setLogFile(const std::string& file_path) {
    log_file_path_ = file_path;
}

void Logger::enableConsoleOutput(bool enable) {
    console_output_enabled_ = enable;
}

void Logger::enableAsyncMode(bool enable) {
    async_mode_enabled_ = enable;
}

void Logger::setMaxFileSize(int mb) {
    max_file_size_ = mb;
}

void Logger::setMaxFileCount(int count) {
    max_file_count_ = count;
}

bool Logger::parseLogLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { level = LogLevel::INFO; return true; }
    if (upper == "WARNING" || upper == "WARN") { level = LogLevel::WARNING; return true; }
    if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
    if (upper == "FATAL") { level = LogLevel::FATAL; return true; }
    return false;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& operation,
                 const std::string& message, const std::string& file, int line) {

    if (level < log_level_) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = getCurrentTimestamp();
    entry.thread_id = getThreadId();
    entry.component = component;
    entry.operation = operation;
    entry.message = message;
    entry.file = file;
    entry.line = line;

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        statistics_.total_logs++;
        switch (level) {
            case LogLevel::DEBUG: statistics_.debug_count++; break;
            case LogLevel::INFO: statistics_.info_count++; break;
            case LogLevel::WARNING: statistics_.warning_count++; break;
            case LogLevel::ERROR: statistics_.error_count++; break;
            case LogLevel::FATAL: statistics_.fatal_count++; break;
        }
    }

    if (level >= LogLevel::ERROR) {
        std::lock_guard<std::mutex> lock(recent_errors_mutex_);
        recent_errors_.push_back(entry);
        if (recent_errors_.size() > MAX_RECENT_ERRORS) {
            recent_errors_.pop_front();
        }
    }

    // 后台线程未启动时直接同步写出，避免队列无限堆积
    if (worker_running_) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(entry);
        queue_condition_.notify_one();
    } else {
        writeLogEntry(entry);
    }
}

void Logger::debug(const std::string& component, const std::string& operation,
                   const std::string& message, const std::string& file, int line) {
    log(LogLevel::DEBUG, component, operation, message, file, line);
}

void Logger::info(const std::string& component, const std::string& operation,
                  const std::string& message, const std::string& file, int line) {
    log(LogLevel::INFO, component, operation, message, file, line);
}

void Logger::warning(const std::string& component, const std::string& operation,
                     const std::string& message, const std::string& file, int line) {
    log(LogLevel::WARNING, component, operation, message, file, line);
}

void Logger::error(const std::string& component, const std::string& operation,
                   const std::string& message, const std::string& file, int line) {
    log(LogLevel::ERROR, component, operation, message, file, line);
}

void Logger::fatal(const std::string& component, const std::string& operation,
                   const std::string& message, const std::string& file, int line) {
    log(LogLevel::FATAL, component, operation, message, file, line);
}

void Logger::logPerformance(const std::string& operation, double duration_ms, const std::string& details) {
    std::ostringstream oss;
    oss << "Operation '" << operation << "' completed in "
        << std::fixed << std::setprecision(3) << duration_ms << "ms";
    if (!details.empty()) {
        oss << " (" << details << ")";
    }

    // 超过1秒的操作提升为警告
    LogLevel level = (duration_ms > 1000.0) ? LogLevel::WARNING : LogLevel::DEBUG;
    log(level, "Performance", operation, oss.str());
}

void Logger::logBusinessEvent(const std::string& event_type, const std::string& item_id,
                              const std::string& details) {
    std::ostringstream oss;
    oss << "Business event: " << event_type << " for item: " << item_id;
    if (!details.empty()) {
        oss << " - " << details;
    }

    log(LogLevel::INFO, "Business", event_type, oss.str());
}

void Logger::asyncLogWorker() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_condition_.wait(lock, [this] {
            return !log_queue_.empty() || stop_requested_;
        });

        while (!log_queue_.empty()) {
            LogEntry entry = std::move(log_queue_.front());
            log_queue_.pop();
            lock.unlock();

            writeLogEntry(entry);

            lock.lock();
        }

        if (stop_requested_) {
            break;
        }
    }
}

void Logger::writeLogEntry(const LogEntry& entry) {
    std::string formatted_log = formatLogEntry(entry);

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (console_output_enabled_) {
        std::ostream& out = (entry.level >= LogLevel::ERROR) ? std::cerr : std::cout;
        out << colorizeOutput(entry.level, formatted_log) << std::endl;
    }

    if (log_file_ && log_file_->is_open()) {
        *log_file_ << formatted_log << '\n';
        log_file_->flush();

        auto file_size = log_file_->tellp();
        if (file_size > static_cast<std::streamoff>(max_file_size_.load()) * 1024 * 1024) {
            rotateLogFile();
        }
    }
}

std::string Logger::formatLogEntry(const LogEntry& entry) const {
    std::ostringstream oss;

    oss << "[" << entry.timestamp << "] ";
    oss << "[" << std::setw(7) << std::left << logLevelToString(entry.level) << "] ";
    oss << "[" << entry.thread_id << "] ";

    oss << "[" << entry.component;
    if (!entry.operation.empty()) {
        oss << "::" << entry.operation;
    }
    oss << "] ";

    oss << entry.message;

    // 文件和行号（仅在DEBUG级别显示）
    if (entry.level == LogLevel::DEBUG && !entry.file.empty()) {
        const char* filename = strrchr(entry.file.c_str(), '/');
        filename = filename ? filename + 1 : entry.file.c_str();
        oss << " (" << filename << ":" << entry.line << ")";
    }

    return oss.str();
}

bool Logger::rotateLogFile() {
    if (!log_file_ || !log_file_->is_open()) {
        return false;
    }

    try {
        log_file_->close();

        std::string timestamp = getCurrentTimestamp();
        std::replace(timestamp.begin(), timestamp.end(), ':', '-');
        std::replace(timestamp.begin(), timestamp.end(), ' ', '_');

        std::filesystem::rename(log_file_path_, log_file_path_ + "." + timestamp);
        removeExpiredLogFiles();

        log_file_ = std::make_unique<std::ofstream>(log_file_path_, std::ios::app);
        return log_file_->is_open();
    } catch (const std::exception& e) {
        std::cerr << "Log file rotation failed: " << e.what() << std::endl;
        // 轮转失败时继续写原路径
        log_file_ = std::make_unique<std::ofstream>(log_file_path_, std::ios::app);
        if (!log_file_->is_open()) {
            std::cerr << "Failed to reopen log file: " << log_file_path_ << std::endl;
            log_file_.reset();
        }
        return false;
    }
}

void Logger::removeExpiredLogFiles() {
    std::filesystem::path log_path(log_file_path_);
    std::filesystem::path dir = log_path.has_parent_path() ? log_path.parent_path()
                                                           : std::filesystem::path(".");
    const std::string prefix = log_path.filename().string() + ".";

    std::vector<std::filesystem::path> rotated;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().filename().string().starts_with(prefix)) {
            rotated.push_back(entry.path());
        }
    }

    // 轮转文件名带时间戳，按名字排序即按时间排序
    std::sort(rotated.begin(), rotated.end());
    int keep = std::max(0, max_file_count_.load());
    while (rotated.size() > static_cast<size_t>(keep)) {
        std::error_code ec;
        std::filesystem::remove(rotated.front(), ec);
        rotated.erase(rotated.begin());
    }
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::getThreadId() const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

std::string Logger::logLevelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::colorizeOutput(LogLevel level, const std::string& message) const {
    const char* color_code = "";
    const char* reset_code = "\033[0m";

    switch (level) {
        case LogLevel::DEBUG: color_code = "\033[36m"; break;   // 青色
        case LogLevel::INFO: color_code = "\033[32m"; break;    // 绿色
        case LogLevel::WARNING: color_code = "\033[33m"; break; // 黄色
        case LogLevel::ERROR: color_code = "\033[31m"; break;   // 红色
        case LogLevel::FATAL: color_code = "\033[35m"; break;   // 紫色
    }

    return std::string(color_code) + message + reset_code;
}

Logger::LogStatistics Logger::getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    LogStatistics stats = statistics_;
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
    stats.uptime_seconds = static_cast<double>(duration.count());

    return stats;
}

std::vector<LogEntry> Logger::getRecentErrors(int count) const {
    std::lock_guard<std::mutex> lock(recent_errors_mutex_);

    std::vector<LogEntry> errors;
    size_t wanted = count > 0 ? static_cast<size_t>(count) : 0;
    size_t start = recent_errors_.size() > wanted ? recent_errors_.size() - wanted : 0;
    for (size_t i = start; i < recent_errors_.size(); ++i) {
        errors.push_back(recent_errors_[i]);
    }

    return errors;
}
