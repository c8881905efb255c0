#include "config.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <vector>
#include <utility>

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool parseInt(const std::string& text, int64_t& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool(const std::string& text, bool& value) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        value = false;
        return true;
    }
    return false;
}

Result<void> invalidValue(const std::string& key, const std::string& value) {
    ErrorContext context = ERROR_CONTEXT("EngineConfig", "applySetting");
    context.additional_info = key;
    return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG,
                             "Invalid value for " + key + ": '" + value + "'", context);
}

} // namespace

Result<void> EngineConfig::applySetting(const std::string& key, const std::string& value) {
    int64_t number = 0;

    if (key == "port") {
        if (!parseInt(value, number) || number <= 0 || number > 65535) return invalidValue(key, value);
        port = static_cast<int>(number);
    } else if (key == "request_timeout_seconds") {
        if (!parseInt(value, number) || number <= 0 || number > 3600) return invalidValue(key, value);
        request_timeout_seconds = static_cast<int>(number);
    } else if (key == "data_dir") {
        data_dir = value;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "log_level") {
        if (!Logger::parseLogLevel(value, log_level)) return invalidValue(key, value);
    } else if (key == "console_log") {
        if (!parseBool(value, console_log)) return invalidValue(key, value);
    } else if (key == "log_max_file_mb") {
        if (!parseInt(value, number) || number <= 0 || number > 10240) return invalidValue(key, value);
        log_max_file_mb = static_cast<int>(number);
    } else if (key == "log_max_files") {
        if (!parseInt(value, number) || number < 0 || number > 1000) return invalidValue(key, value);
        log_max_files = static_cast<int>(number);
    } else if (key == "sweep_interval_seconds") {
        if (!parseInt(value, number) || number < 0 || number > 86400 * 7) return invalidValue(key, value);
        sweep_interval_seconds = static_cast<int>(number);
    } else if (key == "policy.trigger_tier") {
        UrgencyTier tier;
        if (!parseUrgencyTier(value, tier) || tier == UrgencyTier::UNKNOWN) return invalidValue(key, value);
        policy.trigger_tier = tier;
    } else if (key == "policy.quantity_mode") {
        if (!parseQuantityMode(value, policy.quantity_mode)) return invalidValue(key, value);
    } else if (key == "policy.target_days") {
        if (!parseInt(value, number) || number <= 0) return invalidValue(key, value);
        policy.target_days = number;
    } else if (key == "policy.fixed_reorder_quantity") {
        if (!parseInt(value, number) || number <= 0) return invalidValue(key, value);
        policy.fixed_reorder_quantity = number;
    } else if (key == "policy.minimum_quantity") {
        if (!parseInt(value, number) || number <= 0) return invalidValue(key, value);
        policy.minimum_quantity = number;
    } else if (key == "low_stock_default_days") {
        if (!parseInt(value, number) || number < 0) return invalidValue(key, value);
        low_stock_default_days = number;
    } else {
        ErrorContext context = ERROR_CONTEXT("EngineConfig", "applySetting");
        context.additional_info = key;
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Unknown configuration key: " + key, context);
    }

    return RESULT_SUCCESS_VOID();
}

Result<void> EngineConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Cannot open configuration file: " + path,
                                 ERROR_CONTEXT("EngineConfig", "loadFromFile"));
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        size_t eq = content.find('=');
        if (eq == std::string::npos) {
            return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG,
                                     path + ":" + std::to_string(line_number) + ": expected key=value",
                                     ERROR_CONTEXT("EngineConfig", "loadFromFile"));
        }

        auto applied = applySetting(trim(content.substr(0, eq)), trim(content.substr(eq + 1)));
        if (applied.isError()) {
            return RESULT_ERROR_VOID(applied.getErrorCode(),
                                     path + ":" + std::to_string(line_number) + ": " + applied.getErrorMessage(),
                                     applied.getErrorContext());
        }
    }

    config_file = path;
    return RESULT_SUCCESS_VOID();
}

Result<void> EngineConfig::validate() const {
    if (port <= 0 || port > 65535) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Port out of range: " + std::to_string(port),
                                 ERROR_CONTEXT("EngineConfig", "validate"));
    }
    if (sweep_interval_seconds < 0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Sweep interval cannot be negative",
                                 ERROR_CONTEXT("EngineConfig", "validate"));
    }
    if (low_stock_default_days < 0) {
        return RESULT_ERROR_VOID(ErrorCode::INVALID_CONFIG, "Low stock threshold cannot be negative",
                                 ERROR_CONTEXT("EngineConfig", "validate"));
    }
    return RestockPolicy::validateConfig(policy);
}

Result<EngineConfig> EngineConfig::fromCommandLine(int argc, char* argv[]) {
    EngineConfig config;

    // 拆分 "--key=value" 与 "--key value" 两种写法
    std::vector<std::pair<std::string, std::string>> options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--demo") {
            config.seed_demo_data = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }
        if (!arg.starts_with("--")) {
            return RESULT_ERROR(EngineConfig, ErrorCode::INVALID_CONFIG, "Unexpected argument: " + arg,
                                ERROR_CONTEXT("EngineConfig", "fromCommandLine"));
        }

        std::string name = arg.substr(2);
        std::string value;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            return RESULT_ERROR(EngineConfig, ErrorCode::INVALID_CONFIG, "Missing value for --" + name,
                                ERROR_CONTEXT("EngineConfig", "fromCommandLine"));
        }
        options.emplace_back(name, value);
    }

    for (const auto& option : options) {
        if (option.first == "config") {
            auto loaded = config.loadFromFile(option.second);
            if (loaded.isError()) {
                return RESULT_ERROR(EngineConfig, loaded.getErrorCode(), loaded.getErrorMessage(),
                                    loaded.getErrorContext());
            }
        }
    }

    for (const auto& option : options) {
        std::string key;
        if (option.first == "config") {
            continue;
        } else if (option.first == "port") {
            key = "port";
        } else if (option.first == "data-dir") {
            key = "data_dir";
        } else if (option.first == "log-file") {
            key = "log_file";
        } else if (option.first == "log-level") {
            key = "log_level";
        } else if (option.first == "sweep-interval") {
            key = "sweep_interval_seconds";
        } else {
            return RESULT_ERROR(EngineConfig, ErrorCode::INVALID_CONFIG, "Unknown option: --" + option.first,
                                ERROR_CONTEXT("EngineConfig", "fromCommandLine"));
        }

        auto applied = config.applySetting(key, option.second);
        if (applied.isError()) {
            return RESULT_ERROR(EngineConfig, applied.getErrorCode(), applied.getErrorMessage(),
                                applied.getErrorContext());
        }
    }

    auto validation = config.validate();
    if (validation.isError()) {
        return RESULT_ERROR(EngineConfig, validation.getErrorCode(), validation.getErrorMessage(),
                            validation.getErrorContext());
    }

    return Result<EngineConfig>::success(std::move(config));
}

std::string EngineConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --port <n>              HTTP port (default 8080)\n"
        << "  --config <file>         key=value configuration file\n"
        << "  --data-dir <dir>        journal and snapshot directory, empty to disable\n"
        << "  --log-file <file>       log file path\n"
        << "  --log-level <level>     DEBUG, INFO, WARNING, ERROR, FATAL\n"
        << "  --sweep-interval <sec>  recurring auto-restock sweep, 0 to disable\n"
        << "  --demo                  seed demo items into an empty catalog\n"
        << "  --help                  show this message\n";
    return oss.str();
}
