#include "restock_engine.h"
#include "http_server.h"
#include "config.h"
#include "logger.h"
#include "error_handling.h"
#include "monitoring.h"
#include <iostream>
#include <memory>
#include <csignal>
#include <thread>
#include <chrono>

// 信号处理只设置标志，由主循环执行关闭
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

namespace {

Item demoItem(const std::string& id, const std::string& name, const std::string& category,
              const std::string& unit, int64_t stock, double daily_usage) {
    Item item;
    item.id = id;
    item.name = name;
    item.category = category;
    item.unit = unit;
    item.facility_id = "PHC001";
    item.facility_name = "Central Primary Health Centre";
    item.current_stock = stock;
    item.daily_usage = daily_usage;
    return item;
}

void seedDemoData(RestockEngine& engine) {
    if (!engine.listItems().empty()) {
        LOG_INFO("Main", "demo_data", "Catalog is not empty, demo data skipped");
        return;
    }

    const Item demo_items[] = {
        demoItem("DRUG-PCM-500", "Paracetamol 500mg", "Drug", "tablet", 45, 10.0),
        demoItem("DRUG-AMX-250", "Amoxicillin 250mg", "Drug", "capsule", 80, 9.0),
        demoItem("DRUG-ORS-01", "Oral rehydration salts", "Drug", "sachet", 120, 10.0),
        demoItem("SUP-GLV-M", "Nitrile gloves (M)", "Supply", "pair", 300, 0.0),
        demoItem("SUP-SYR-5", "Syringe 5ml", "Supply", "piece", 18, 6.5)
    };

    size_t added = 0;
    for (const auto& item : demo_items) {
        auto result = engine.addItem(item);
        if (result.isSuccess()) {
            added++;
        } else {
            LOG_ERROR("Main", "demo_data", "Demo item " + item.id + " error: " + result.getErrorMessage());
        }
    }

    LOG_INFO("Main", "demo_data", "Demo data added: " + std::to_string(added) + " items");
}

void printEndpoints() {
    std::cout << "--------------------------------------" << std::endl;
    std::cout << "API 端点:" << std::endl;
    std::cout << "GET  /api/items                          - 物品列表（含消耗预测）" << std::endl;
    std::cout << "POST /api/items                          - 录入物品" << std::endl;
    std::cout << "GET/PUT/DELETE /api/items/{id}           - 查询/修改/归档物品" << std::endl;
    std::cout << "POST /api/items/{id}/usage               - 登记消耗" << std::endl;
    std::cout << "GET  /api/inventory/low-stock            - 低库存查询" << std::endl;
    std::cout << "GET  /api/inventory/restock-preview      - 补货预览" << std::endl;
    std::cout << "POST /api/inventory/auto-restock-check   - 自动补货巡检" << std::endl;
    std::cout << "GET/POST /api/restock-requests           - 补货请求列表/手工请求" << std::endl;
    std::cout << "GET/PUT /api/restock-requests/{id}       - 查询/审批/入库" << std::endl;
    std::cout << "GET  /api/system/status                  - 系统状态" << std::endl;
    std::cout << "GET  /api/system/metrics                 - 监控指标" << std::endl;
    std::cout << "--------------------------------------" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = EngineConfig::fromCommandLine(argc, argv);
    if (parsed.isError()) {
        std::cerr << "配置错误: " << parsed.getErrorMessage() << std::endl;
        std::cerr << EngineConfig::usage(argv[0]);
        return 2;
    }
    const EngineConfig& config = parsed.getValue();

    if (config.show_help) {
        std::cout << EngineConfig::usage(argv[0]);
        return 0;
    }

    std::cout << "=== stockwatch 库存预测与补货系统 ===" << std::endl;

    // 初始化日志系统
    auto& logger = Logger::getInstance();
    logger.setLogLevel(config.log_level);
    logger.setLogFile(config.log_file);
    logger.enableConsoleOutput(config.console_log);
    logger.enableAsyncMode(true);
    logger.setMaxFileSize(config.log_max_file_mb);
    logger.setMaxFileCount(config.log_max_files);

    if (!logger.start()) {
        std::cerr << "Failed to initialize logging system" << std::endl;
        return 1;
    }

    LOG_INFO("Main", "startup", "=== Stockwatch Restock Engine Starting ===");
    if (!config.config_file.empty()) {
        LOG_INFO("Main", "startup", "Configuration loaded from " + config.config_file);
    }

    // 初始化监控系统
    auto& monitor = MonitoringManager::getInstance();
    monitor.setEnabled(true);
    monitor.registerEngineMetrics();

    // 创建补货引擎实例
    std::shared_ptr<RestockEngine> engine;
    try {
        engine = std::make_shared<RestockEngine>(config.data_dir, config.policy);
    } catch (const StockwatchException& e) {
        LOG_FATAL("Main", "startup", "Failed to initialize restock engine: " + std::string(e.what()));
        logger.stop();
        return 1;
    }

    if (config.seed_demo_data) {
        seedDemoData(*engine);
    }

    if (config.sweep_interval_seconds > 0 && !engine->startRecurringSweep(config.sweep_interval_seconds)) {
        LOG_WARNING("Main", "startup", "Recurring sweep could not be started");
    }

    auto server = std::make_shared<HttpServer>(config.port, engine, config.low_stock_default_days);
    server->setRequestTimeout(std::chrono::seconds(config.request_timeout_seconds));

    // 设置信号处理器
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!server->start()) {
        std::cerr << "错误：服务器启动失败" << std::endl;
        LOG_FATAL("Main", "startup", "HTTP server failed to start on port " + std::to_string(config.port));
        engine->stopRecurringSweep();
        logger.stop();
        return 1;
    }

    std::cout << "✓ 服务器启动成功，端口: " << config.port << std::endl;
    printEndpoints();
    std::cout << "按 Ctrl+C 停止服务器" << std::endl;

    // 主循环
    while (!g_shutdown_requested && server->isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n正在关闭服务器..." << std::endl;
    server->stop();
    engine->stopRecurringSweep();

    // 引擎析构时写最终快照
    server.reset();
    engine.reset();

    LOG_INFO("Main", "shutdown", "=== Stockwatch Restock Engine Stopped ===");
    logger.stop();

    std::cout << "服务器已关闭" << std::endl;
    return 0;
}
