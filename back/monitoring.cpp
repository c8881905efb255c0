#include "monitoring.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

MonitoringManager::MonitoringManager() : enabled_(true) {
}

MonitoringManager& MonitoringManager::getInstance() {
    static MonitoringManager instance;
    return instance;
}

// ========== 指标注册 ==========

std::shared_ptr<Counter> MonitoringManager::registerCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (auto existing = std::dynamic_pointer_cast<Counter>(it->second)) {
            return existing;
        }
    }
    auto counter = std::make_shared<Counter>(name, description);
    metrics_[name] = counter;
    return counter;
}

std::shared_ptr<Gauge> MonitoringManager::registerGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (auto existing = std::dynamic_pointer_cast<Gauge>(it->second)) {
            return existing;
        }
    }
    auto gauge = std::make_shared<Gauge>(name, description);
    metrics_[name] = gauge;
    return gauge;
}

std::shared_ptr<Histogram> MonitoringManager::registerHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (auto existing = std::dynamic_pointer_cast<Histogram>(it->second)) {
            return existing;
        }
    }
    auto histogram = std::make_shared<Histogram>(name, description);
    metrics_[name] = histogram;
    return histogram;
}

void MonitoringManager::registerEngineMetrics() {
    registerCounter("restock_requests_created", "Restock requests created");
    registerCounter("restock_requests_created_auto", "Restock requests created by the restock policy");
    registerCounter("restock_requests_created_manual", "Restock requests created by operators");
    registerCounter("restock_requests_approved", "Restock requests approved");
    registerCounter("restock_requests_declined", "Restock requests declined");
    registerCounter("restock_requests_fulfilled", "Restock requests fulfilled");
    registerCounter("restock_duplicates_rejected", "Create attempts rejected by the open request guard");
    registerCounter("sweeps_total", "Catalog sweeps executed");
    registerCounter("sweeps_commit", "Catalog sweeps executed in commit mode");
    registerCounter("sweeps_preview", "Catalog sweeps executed in preview mode");
    registerCounter("sweep_items_skipped", "Items skipped by sweeps because an open request exists");
    registerCounter("engine_operations_total", "Mutating engine operations attempted");
    registerCounter("engine_errors_total", "Mutating engine operations that failed with an internal error");
    registerCounter("http_requests_total", "HTTP requests served");
    registerCounter("http_requests_2xx", "HTTP requests answered with 2xx");
    registerCounter("http_requests_4xx", "HTTP requests answered with 4xx");
    registerCounter("http_requests_5xx", "HTTP requests answered with 5xx");
    registerGauge("catalog_items_count", "Items in the stock catalog");
    registerGauge("open_requests_count", "Pending or approved restock requests");
    registerGauge("last_sweep_created", "Requests created by the most recent commit sweep");
    registerHistogram("sweep_duration", "Catalog sweep duration (ms)");
    registerHistogram("engine_recovery_time", "Journal recovery duration at startup (ms)");
    registerHistogram("http_request_duration", "HTTP request handling duration (ms)");
}

// ========== 快捷操作 ==========

template<typename T>
std::shared_ptr<T> MonitoringManager::findMetric(const std::string& name) const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return nullptr;
    }
    return std::dynamic_pointer_cast<T>(it->second);
}

void MonitoringManager::incrementCounter(const std::string& name, uint64_t delta) {
    if (!enabled_) return;

    if (auto counter = findMetric<Counter>(name)) {
        counter->increment(delta);
    }
}

void MonitoringManager::setGauge(const std::string& name, double value) {
    if (!enabled_) return;

    if (auto gauge = findMetric<Gauge>(name)) {
        gauge->set(value);
    }
}

void MonitoringManager::observeHistogram(const std::string& name, double value) {
    if (!enabled_) return;

    if (auto histogram = findMetric<Histogram>(name)) {
        histogram->observe(value);
    }
}

uint64_t MonitoringManager::getCounter(const std::string& name) const {
    auto counter = findMetric<Counter>(name);
    return counter ? counter->get() : 0;
}

// ========== 预定义业务指标 ==========

void MonitoringManager::recordRequestCreated(const std::string& source, const std::string& priority) {
    if (!enabled_) return;

    incrementCounter("restock_requests_created");
    incrementCounter("restock_requests_created_" + source);

    // 按优先级的计数器按需注册
    std::string name = "restock_requests_priority_" + priority;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    registerCounter(name, "Restock requests created with priority " + priority)->increment();
}

void MonitoringManager::recordRequestTransition(const std::string& new_status) {
    if (!enabled_) return;

    std::string name = "restock_requests_" + new_status;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    incrementCounter(name);
}

void MonitoringManager::recordDuplicateRejected() {
    incrementCounter("restock_duplicates_rejected");
}

void MonitoringManager::recordSweep(const std::string& mode, size_t created, size_t skipped, double duration_ms) {
    if (!enabled_) return;

    incrementCounter("sweeps_total");
    incrementCounter("sweeps_" + mode);
    if (mode == "commit") {
        setGauge("last_sweep_created", static_cast<double>(created));
    }
    incrementCounter("sweep_items_skipped", skipped);
    observeHistogram("sweep_duration", duration_ms);
}

void MonitoringManager::recordOperationError(const std::string& error_code) {
    if (!enabled_) return;

    incrementCounter("engine_errors_total");
    registerCounter("error_" + error_code, "Operations failed with " + error_code)->increment();
}

void MonitoringManager::recordHTTPRequest(const std::string& method, int status_code, double duration_ms) {
    if (!enabled_) return;

    incrementCounter("http_requests_total");
    registerCounter("http_requests_" + method, "HTTP " + method + " requests")->increment();

    if (status_code >= 200 && status_code < 300) {
        incrementCounter("http_requests_2xx");
    } else if (status_code >= 400 && status_code < 500) {
        incrementCounter("http_requests_4xx");
    } else if (status_code >= 500) {
        incrementCounter("http_requests_5xx");
    }

    observeHistogram("http_request_duration", duration_ms);
}

// ========== 查询和导出 ==========

std::unordered_map<std::string, std::shared_ptr<Metric>> MonitoringManager::getAllMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

std::string MonitoringManager::metricTypeToString(MetricType type) {
    switch (type) {
        case MetricType::COUNTER: return "counter";
        case MetricType::GAUGE: return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
    }
    return "untyped";
}

std::vector<MonitoringManager::MetricSnapshot> MonitoringManager::getMetricsSnapshot() const {
    std::vector<MetricSnapshot> snapshots;

    for (const auto& pair : getAllMetrics()) {
        MetricSnapshot snapshot;
        snapshot.name = pair.second->getName();
        snapshot.type = metricTypeToString(pair.second->getType());
        snapshot.value = pair.second->getValue();
        snapshot.description = pair.second->getDescription();
        snapshots.push_back(snapshot);
    }

    std::sort(snapshots.begin(), snapshots.end(),
              [](const MetricSnapshot& a, const MetricSnapshot& b) { return a.name < b.name; });
    return snapshots;
}

std::string MonitoringManager::exportPrometheusFormat() const {
    auto metrics = getAllMetrics();

    std::vector<std::string> names;
    for (const auto& pair : metrics) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream output;
    for (const auto& name : names) {
        const auto& metric = metrics[name];

        output << "# HELP " << name << " " << metric->getDescription() << "\n";
        output << "# TYPE " << name << " " << metricTypeToString(metric->getType()) << "\n";

        if (metric->getType() == MetricType::HISTOGRAM) {
            auto histogram = std::dynamic_pointer_cast<Histogram>(metric);
            if (histogram) {
                auto stats = histogram->getStatistics();
                for (const auto& bucket : stats.buckets) {
                    output << name << "_bucket{le=\"" << bucket.first << "\"} " << bucket.second << "\n";
                }
                output << name << "_bucket{le=\"+Inf\"} " << stats.count << "\n";
                output << name << "_sum " << stats.sum << "\n";
                output << name << "_count " << stats.count << "\n";
            }
        } else {
            output << name << " " << metric->getValue() << "\n";
        }
    }

    return output.str();
}

std::string MonitoringManager::exportJSONFormat() const {
    std::ostringstream json;
    json << "{\"metrics\":[";

    auto snapshots = getMetricsSnapshot();
    for (size_t i = 0; i < snapshots.size(); ++i) {
        if (i > 0) json << ",";

        const auto& snapshot = snapshots[i];
        json << "{";
        json << "\"name\":\"" << snapshot.name << "\",";
        json << "\"type\":\"" << snapshot.type << "\",";
        json << "\"value\":\"" << snapshot.value << "\",";
        json << "\"description\":\"" << snapshot.description << "\"";
        json << "}";
    }

    json << "]}";
    return json.str();
}

// ========== 健康检查 ==========

MonitoringManager::HealthStatus MonitoringManager::getHealthStatus() const {
    HealthStatus status;
    status.healthy = true;
    status.status = "healthy";

    uint64_t operations = getCounter("engine_operations_total");
    uint64_t errors = getCounter("engine_errors_total");

    double error_rate = 0.0;
    if (operations > 0) {
        error_rate = static_cast<double>(errors) / operations;
    }
    status.details["error_rate"] = std::to_string(error_rate);
    status.details["operations"] = std::to_string(operations);

    if (error_rate > 0.1) {
        status.healthy = false;
        status.status = "critical";
        status.issues.push_back("High internal error rate: " + std::to_string(error_rate * 100) + "%");
    } else if (error_rate > 0.05) {
        status.status = "warning";
        status.issues.push_back("Elevated internal error rate: " + std::to_string(error_rate * 100) + "%");
    }

    return status;
}

void MonitoringManager::resetAll() {
    for (const auto& pair : getAllMetrics()) {
        pair.second->reset();
    }
}
