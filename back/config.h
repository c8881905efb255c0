#ifndef CONFIG_H
#define CONFIG_H

#include "logger.h"
#include "error_handling.h"
#include "restock_policy.h"
#include <string>
#include <cstdint>

// 引擎配置：默认值 <- 配置文件 (key=value, # 注释) <- 命令行参数
struct EngineConfig {
    // 服务
    int port = 8080;
    // 读取单个请求的总时限（秒）
    int request_timeout_seconds = 10;

    // 存储（data_dir 为空时不持久化）
    std::string data_dir = "./data";

    // 日志
    std::string log_file = "./logs/stockwatch.log";
    LogLevel log_level = LogLevel::INFO;
    bool console_log = true;
    int log_max_file_mb = 100;
    int log_max_files = 10;

    // 周期巡检间隔（秒），0 表示只按需巡检
    int sweep_interval_seconds = 0;

    // 补货策略
    PolicyConfig policy;

    // 低库存查询默认阈值（天）
    int64_t low_stock_default_days = 5;

    // 启动时写入演示数据（目录为空时）
    bool seed_demo_data = false;

    bool show_help = false;
    std::string config_file;

    // 设置单个配置项，key 与配置文件中的写法一致（如 "policy.target_days"）
    Result<void> applySetting(const std::string& key, const std::string& value);

    Result<void> loadFromFile(const std::string& path);

    Result<void> validate() const;

    // 解析命令行：先加载 --config 指定的文件，其余参数覆盖文件中的值
    static Result<EngineConfig> fromCommandLine(int argc, char* argv[]);

    static std::string usage(const std::string& program);
};

#endif // CONFIG_H
