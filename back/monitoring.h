#ifndef MONITORING_H
#define MONITORING_H

#include <string>
#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <map>
#include <memory>
#include <limits>
#include <vector>
#include <cstdint>

// 度量指标类型
enum class MetricType {
    COUNTER,    // 计数器（只增不减）
    GAUGE,      // 仪表盘（可增可减）
    HISTOGRAM   // 直方图（用于耗时分布）
};

// 基础度量指标
class Metric {
public:
    Metric(const std::string& name, MetricType type, const std::string& description = "")
        : name_(name), type_(type), description_(description) {}

    virtual ~Metric() = default;

    const std::string& getName() const { return name_; }
    MetricType getType() const { return type_; }
    const std::string& getDescription() const { return description_; }

    virtual std::string getValue() const = 0;
    virtual void reset() = 0;

protected:
    std::string name_;
    MetricType type_;
    std::string description_;
};

class Counter : public Metric {
public:
    Counter(const std::string& name, const std::string& description = "")
        : Metric(name, MetricType::COUNTER, description), value_(0) {}

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t get() const {
        return value_.load(std::memory_order_relaxed);
    }

    std::string getValue() const override {
        return std::to_string(get());
    }

    void reset() override {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<uint64_t> value_;
};

class Gauge : public Metric {
public:
    Gauge(const std::string& name, const std::string& description = "")
        : Metric(name, MetricType::GAUGE, description), value_(0) {}

    void set(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = value;
    }

    void increment(double delta = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ += delta;
    }

    double get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    std::string getValue() const override {
        return std::to_string(get());
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = 0.0;
    }

private:
    mutable std::mutex mutex_;
    double value_;
};

// 直方图指标（毫秒耗时分布）
class Histogram : public Metric {
public:
    Histogram(const std::string& name, const std::string& description = "")
        : Metric(name, MetricType::HISTOGRAM, description)
        , count_(0), sum_(0.0), min_(std::numeric_limits<double>::max())
        , max_(std::numeric_limits<double>::lowest()) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
        sum_ += value;
        if (value < min_) min_ = value;
        if (value > max_) max_ = value;
        updateBuckets(value);
    }

    struct Statistics {
        uint64_t count;
        double sum;
        double min;
        double max;
        double average;
        std::map<double, uint64_t> buckets;   // 上界 -> 累计个数
    };

    Statistics getStatistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Statistics stats;
        stats.count = count_;
        stats.sum = sum_;
        stats.min = (count_ > 0) ? min_ : 0.0;
        stats.max = (count_ > 0) ? max_ : 0.0;
        stats.average = (count_ > 0) ? sum_ / count_ : 0.0;
        stats.buckets = buckets_;
        return stats;
    }

    std::string getValue() const override {
        auto stats = getStatistics();
        return "count=" + std::to_string(stats.count) +
               ",avg=" + std::to_string(stats.average) +
               ",min=" + std::to_string(stats.min) +
               ",max=" + std::to_string(stats.max);
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        count_ = 0;
        sum_ = 0.0;
        min_ = std::numeric_limits<double>::max();
        max_ = std::numeric_limits<double>::lowest();
        buckets_.clear();
    }

private:
    mutable std::mutex mutex_;
    uint64_t count_;
    double sum_;
    double min_;
    double max_;
    std::map<double, uint64_t> buckets_;

    // Prometheus 风格的累计分桶
    void updateBuckets(double value) {
        static const double bounds[] = {1.0, 5.0, 10.0, 50.0, 100.0, 500.0, 1000.0};
        for (double bound : bounds) {
            if (value <= bound) {
                buckets_[bound]++;
            }
        }
    }
};

// 系统监控管理器
class MonitoringManager {
public:
    static MonitoringManager& getInstance();

    // ========== 指标注册 ==========
    // 同名同类型指标已存在时返回已有实例

    std::shared_ptr<Counter> registerCounter(const std::string& name, const std::string& description = "");
    std::shared_ptr<Gauge> registerGauge(const std::string& name, const std::string& description = "");
    std::shared_ptr<Histogram> registerHistogram(const std::string& name, const std::string& description = "");

    // 注册补货引擎使用的全部指标
    void registerEngineMetrics();

    // ========== 快捷操作 ==========

    void incrementCounter(const std::string& name, uint64_t delta = 1);
    void setGauge(const std::string& name, double value);
    void observeHistogram(const std::string& name, double value);

    // 读取计数器当前值，不存在时返回0
    uint64_t getCounter(const std::string& name) const;

    // ========== 预定义业务指标 ==========

    void recordRequestCreated(const std::string& source, const std::string& priority);
    void recordRequestTransition(const std::string& new_status);
    void recordDuplicateRejected();
    void recordSweep(const std::string& mode, size_t created, size_t skipped, double duration_ms);
    void recordOperationError(const std::string& error_code);
    void recordHTTPRequest(const std::string& method, int status_code, double duration_ms);

    // ========== 查询和导出 ==========

    std::unordered_map<std::string, std::shared_ptr<Metric>> getAllMetrics() const;

    struct MetricSnapshot {
        std::string name;
        std::string type;
        std::string value;
        std::string description;
    };

    // 按名称排序的指标快照
    std::vector<MetricSnapshot> getMetricsSnapshot() const;

    std::string exportPrometheusFormat() const;
    std::string exportJSONFormat() const;

    // ========== 健康检查 ==========

    struct HealthStatus {
        bool healthy;
        std::string status;  // "healthy", "warning", "critical"
        std::vector<std::string> issues;
        std::map<std::string, std::string> details;
    };

    HealthStatus getHealthStatus() const;

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    // 清零所有指标（测试与重启统计用）
    void resetAll();

private:
    MonitoringManager();
    ~MonitoringManager() = default;

    MonitoringManager(const MonitoringManager&) = delete;
    MonitoringManager& operator=(const MonitoringManager&) = delete;

    template<typename T>
    std::shared_ptr<T> findMetric(const std::string& name) const;

    static std::string metricTypeToString(MetricType type);

    mutable std::mutex metrics_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Metric>> metrics_;
    std::atomic<bool> enabled_;
};

// ========== 便捷宏定义 ==========

#define MONITOR() MonitoringManager::getInstance()

#define INC_COUNTER(name) MONITOR().incrementCounter(name)
#define SET_GAUGE(name, value) MONITOR().setGauge(name, value)
#define OBSERVE_HISTOGRAM(name, value) MONITOR().observeHistogram(name, value)

#define RECORD_REQUEST_CREATED(source, priority) MONITOR().recordRequestCreated(source, priority)
#define RECORD_REQUEST_TRANSITION(status) MONITOR().recordRequestTransition(status)
#define RECORD_OPERATION_ERROR(code) MONITOR().recordOperationError(code)
#define RECORD_HTTP_REQUEST(method, status, duration) \
    MONITOR().recordHTTPRequest(method, status, duration)

// RAII风格的操作计时器，析构时写入直方图
class OperationTimer {
public:
    OperationTimer(const std::string& metric_name)
        : metric_name_(metric_name)
        , start_time_(std::chrono::steady_clock::now()) {}

    ~OperationTimer() {
        OBSERVE_HISTOGRAM(metric_name_, elapsedMs());
    }

    double elapsedMs() const {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time_);
        return duration.count() / 1000.0;
    }

private:
    std::string metric_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define TIMER(metric_name) OperationTimer _timer(metric_name)

#endif // MONITORING_H
