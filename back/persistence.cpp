#include "persistence.h"
#include "logger.h"
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <limits>
#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <fcntl.h>
#include <unistd.h>

namespace {

const char* const ITEM_TAG = "ITEM";
const char* const REQUEST_TAG = "REQUEST";
const char* const REMOVE_TAG = "REMOVE";
const char* const FULFILL_TAG = "FULFILL";
const char* const RECORD_END = "END";
const size_t ITEM_FIELD_COUNT = 10;
const size_t REQUEST_FIELD_COUNT = 14;
// FULFILL | 物品字段 | 请求字段 | END
const size_t FULFILL_FIELD_COUNT = 1 + ITEM_FIELD_COUNT + REQUEST_FIELD_COUNT + 1;

bool parseInt64(const std::string& text, int64_t& value) {
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

bool parseUint64(const std::string& text, uint64_t& value) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t pos = 0;
        double parsed = std::stod(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

PersistenceManager::PersistenceManager(const std::string& data_dir)
    : data_dir_(data_dir)
    , max_snapshots_(3)
    , records_written_(0)
    , lock_fd_(-1) {

    if (!initializeDataDirectory()) {
        THROW_ERROR(ErrorCode::PERSISTENCE_INIT_FAILED,
                    "Failed to initialize data directory: " + data_dir_,
                    ERROR_CONTEXT("PersistenceManager", "constructor"));
    }

    if (!acquireFileLock()) {
        THROW_ERROR(ErrorCode::FILE_LOCK_FAILED,
                    "Data directory is locked by another process: " + data_dir_,
                    ERROR_CONTEXT("PersistenceManager", "constructor"));
    }

    journal_file_path_ = data_dir_ + "/current.wal";
    journal_stream_ = std::make_unique<std::ofstream>(journal_file_path_, std::ios::app);

    if (!journal_stream_->is_open()) {
        releaseFileLock();
        THROW_ERROR(ErrorCode::PERSISTENCE_INIT_FAILED,
                    "Failed to open journal file: " + journal_file_path_,
                    ERROR_CONTEXT("PersistenceManager", "constructor"));
    }

    terminateTornRecord();

    LOG_INFO("PersistenceManager", "constructor", "Journal opened at " + journal_file_path_);
}

// 上次进程在写入中途退出时，WAL 末尾残留半行；补一个换行，新记录从新行开始
void PersistenceManager::terminateTornRecord() {
    std::ifstream tail(journal_file_path_, std::ios::binary);
    if (!tail.is_open() || !tail.seekg(-1, std::ios::end)) {
        return;
    }

    char last = '\n';
    tail.get(last);
    if (last != '\n') {
        LOG_WARNING("PersistenceManager", "constructor", "Journal ends with an incomplete record");
        journal_stream_->put('\n');
        journal_stream_->flush();
    }
}

PersistenceManager::~PersistenceManager() {
    {
        std::lock_guard<std::mutex> lock(journal_mutex_);
        if (journal_stream_ && journal_stream_->is_open()) {
            journal_stream_->flush();
            journal_stream_->close();
        }
    }

    releaseFileLock();
}

// ========== WAL (Write-Ahead Logging) ==========

bool PersistenceManager::writeItem(const Item& item) {
    return appendLines({encodeItem(item)});
}

bool PersistenceManager::writeRequest(const RestockRequest& request) {
    return appendLines({encodeRequest(request)});
}

bool PersistenceManager::writeItemRemoval(const std::string& item_id) {
    return appendLines({std::string(REMOVE_TAG) + "|" + escapeField(item_id)});
}

bool PersistenceManager::writeFulfillment(const Item& item, const RestockRequest& request) {
    return appendLines({encodeFulfillment(item, request)});
}

bool PersistenceManager::appendLines(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(journal_mutex_);

    if (!journal_stream_ || !journal_stream_->is_open()) {
        LOG_ERROR("PersistenceManager", "appendLines", "Journal stream not available");
        return false;
    }

    // 多条记录拼成一个缓冲区一次写出
    std::string buffer;
    for (const auto& line : lines) {
        buffer += line;
        buffer += '\n';
    }

    std::error_code size_error;
    auto size_before = std::filesystem::file_size(journal_file_path_, size_error);

    journal_stream_->write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    journal_stream_->flush();

    if (!journal_stream_->good()) {
        LOG_ERROR("PersistenceManager", "appendLines", "Journal write failed: " + journal_file_path_);
        discardFailedWrite(size_error ? 0 : size_before, !size_error);
        return false;
    }

    records_written_ += lines.size();
    return true;
}

// 丢弃缓冲区中未写出的记录并截掉已写出的半行，避免被拒绝的操作在之后落盘
void PersistenceManager::discardFailedWrite(std::uintmax_t size_before, bool truncate) {
    journal_stream_->clear();
    journal_stream_->close();

    if (truncate) {
        std::error_code ec;
        std::filesystem::resize_file(journal_file_path_, size_before, ec);
        if (ec) {
            LOG_ERROR("PersistenceManager", "appendLines",
                      "Failed to truncate partial journal record: " + ec.message());
        }
    }

    journal_stream_ = std::make_unique<std::ofstream>(journal_file_path_, std::ios::app);
    if (!journal_stream_->is_open()) {
        LOG_ERROR("PersistenceManager", "appendLines", "Failed to reopen journal: " + journal_file_path_);
    }
}

// ========== 记录编解码 ==========

std::string PersistenceManager::escapeField(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '|': escaped += "\\|"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::vector<std::string> PersistenceManager::splitRecord(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            char next = line[++i];
            switch (next) {
                case 'n': current += '\n'; break;
                case 'r': current += '\r'; break;
                default: current += next; break;
            }
        } else if (c == '|') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(current);

    return fields;
}

std::string PersistenceManager::encodeItem(const Item& item) {
    std::ostringstream oss;
    oss << ITEM_TAG << "|"
        << escapeField(item.id) << "|"
        << escapeField(item.name) << "|"
        << escapeField(item.category) << "|"
        << escapeField(item.unit) << "|"
        << escapeField(item.facility_id) << "|"
        << escapeField(item.facility_name) << "|"
        << item.current_stock << "|"
        << std::setprecision(std::numeric_limits<double>::max_digits10) << item.daily_usage << "|"
        << escapeField(item.updated_at);
    return oss.str();
}

std::string PersistenceManager::encodeRequest(const RestockRequest& request) {
    std::ostringstream oss;
    oss << REQUEST_TAG << "|"
        << request.request_id << "|"
        << escapeField(request.item_id) << "|"
        << escapeField(request.item_name) << "|"
        << escapeField(request.facility_id) << "|"
        << escapeField(request.facility_name) << "|"
        << request.quantity << "|"
        << priorityToString(request.priority) << "|"
        << statusToString(request.status) << "|"
        << sourceToString(request.source) << "|"
        << escapeField(request.requested_at) << "|"
        << escapeField(request.updated_at) << "|";
    if (request.days_remaining) {
        oss << *request.days_remaining;
    } else {
        oss << "-";
    }
    oss << "|" << escapeField(request.comments);
    return oss.str();
}

std::string PersistenceManager::encodeFulfillment(const Item& item, const RestockRequest& request) {
    return std::string(FULFILL_TAG) + "|" + encodeItem(item) + "|" + encodeRequest(request) + "|" + RECORD_END;
}

bool PersistenceManager::decodeFulfillment(const std::vector<std::string>& fields, Item& item,
                                           RestockRequest& request) {
    // 缺少结束标记说明该行被截断，整条丢弃
    if (fields.size() != FULFILL_FIELD_COUNT || fields[0] != FULFILL_TAG || fields.back() != RECORD_END) {
        return false;
    }

    std::vector<std::string> item_fields(fields.begin() + 1, fields.begin() + 1 + ITEM_FIELD_COUNT);
    std::vector<std::string> request_fields(fields.begin() + 1 + ITEM_FIELD_COUNT, fields.end() - 1);

    return decodeItem(item_fields, item) &&
           decodeRequest(request_fields, request) &&
           request.item_id == item.id &&
           request.status == RequestStatus::FULFILLED;
}

bool PersistenceManager::decodeItem(const std::vector<std::string>& fields, Item& item) {
    if (fields.size() != ITEM_FIELD_COUNT || fields[0] != ITEM_TAG) {
        return false;
    }

    item.id = fields[1];
    item.name = fields[2];
    item.category = fields[3];
    item.unit = fields[4];
    item.facility_id = fields[5];
    item.facility_name = fields[6];
    item.updated_at = fields[9];

    return !item.id.empty() &&
           parseInt64(fields[7], item.current_stock) &&
           parseDouble(fields[8], item.daily_usage);
}

bool PersistenceManager::decodeRequest(const std::vector<std::string>& fields, RestockRequest& request) {
    if (fields.size() != REQUEST_FIELD_COUNT || fields[0] != REQUEST_TAG) {
        return false;
    }

    if (!parseUint64(fields[1], request.request_id) || request.request_id == 0) {
        return false;
    }
    request.item_id = fields[2];
    request.item_name = fields[3];
    request.facility_id = fields[4];
    request.facility_name = fields[5];
    if (!parseInt64(fields[6], request.quantity)) {
        return false;
    }
    if (!parsePriority(fields[7], request.priority) ||
        !parseStatus(fields[8], request.status) ||
        !parseSource(fields[9], request.source)) {
        return false;
    }
    request.requested_at = fields[10];
    request.updated_at = fields[11];

    if (fields[12] == "-") {
        request.days_remaining.reset();
    } else {
        int64_t days = 0;
        if (!parseInt64(fields[12], days)) {
            return false;
        }
        request.days_remaining = days;
    }
    request.comments = fields[13];

    return !request.item_id.empty();
}

// ========== 数据恢复 ==========

bool PersistenceManager::applyLine(const std::string& line, RecoveredState& state) const {
    auto fields = splitRecord(line);
    if (fields.empty()) {
        return false;
    }

    if (fields[0] == ITEM_TAG) {
        Item item;
        if (!decodeItem(fields, item)) {
            return false;
        }
        state.items[item.id] = item;
        return true;
    }

    if (fields[0] == REMOVE_TAG) {
        if (fields.size() != 2 || fields[1].empty()) {
            return false;
        }
        state.items.erase(fields[1]);
        return true;
    }

    if (fields[0] == REQUEST_TAG) {
        RestockRequest request;
        if (!decodeRequest(fields, request)) {
            return false;
        }
        state.requests[request.request_id] = request;
        return true;
    }

    // 入库记录：库存与请求状态同时生效或同时丢弃
    if (fields[0] == FULFILL_TAG) {
        Item item;
        RestockRequest request;
        if (!decodeFulfillment(fields, item, request)) {
            return false;
        }
        state.items[item.id] = item;
        state.requests[request.request_id] = request;
        return true;
    }

    return false;
}

void PersistenceManager::replayFile(const std::string& path, RecoveredState& state,
                                    ErrorCode open_failure) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        ErrorHandler::logError(open_failure, "Cannot open file: " + path,
                               ERROR_CONTEXT("PersistenceManager", "recover"));
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        state.records_read++;
        if (!applyLine(line, state)) {
            state.records_rejected++;
            LOG_WARNING("PersistenceManager", "recover", "Failed to parse record in " + path + ": " + line);
        }
    }
}

PersistenceManager::RecoveredState PersistenceManager::recover() {
    RecoveredState state;

    auto snapshots = getSnapshotFiles();
    if (!snapshots.empty()) {
        replayFile(data_dir_ + "/" + snapshots.back(), state, ErrorCode::SNAPSHOT_LOAD_FAILED);
        LOG_INFO("PersistenceManager", "recover", "Loaded snapshot " + snapshots.back());
    }

    {
        std::lock_guard<std::mutex> lock(journal_mutex_);
        if (journal_stream_) {
            journal_stream_->flush();
        }
    }
    if (std::filesystem::exists(journal_file_path_)) {
        replayFile(journal_file_path_, state, ErrorCode::JOURNAL_READ_FAILED);
    }

    LOG_INFO("PersistenceManager", "recover",
             "Recovered " + std::to_string(state.items.size()) + " items and " +
             std::to_string(state.requests.size()) + " requests from " +
             std::to_string(state.records_read) + " records");

    return state;
}

Result<void> PersistenceManager::validateDataIntegrity(const RecoveredState& state) const {
    for (const auto& pair : state.items) {
        const Item& item = pair.second;
        if (item.current_stock < 0 || !(item.daily_usage >= 0.0)) {
            return RESULT_ERROR_VOID(ErrorCode::DATA_CORRUPTION_DETECTED,
                                     "Invalid stock or usage for recovered item",
                                     ERROR_CONTEXT_WITH_IDS("PersistenceManager", "validateDataIntegrity", item.id, ""));
        }
    }

    std::unordered_map<std::string, uint64_t> open_by_item;
    for (const auto& pair : state.requests) {
        const RestockRequest& request = pair.second;
        if (request.quantity <= 0) {
            return RESULT_ERROR_VOID(ErrorCode::DATA_CORRUPTION_DETECTED,
                                     "Non-positive quantity in recovered request",
                                     ERROR_CONTEXT_WITH_IDS("PersistenceManager", "validateDataIntegrity",
                                                            request.item_id, std::to_string(request.request_id)));
        }
        if (request.isOpen()) {
            auto inserted = open_by_item.emplace(request.item_id, request.request_id);
            if (!inserted.second) {
                return RESULT_ERROR_VOID(ErrorCode::DATA_CORRUPTION_DETECTED,
                                         "More than one open request for item",
                                         ERROR_CONTEXT_WITH_IDS("PersistenceManager", "validateDataIntegrity",
                                                                request.item_id, std::to_string(request.request_id)));
            }
        }
    }

    return RESULT_SUCCESS_VOID();
}

// ========== 快照管理 ==========

bool PersistenceManager::createSnapshot(const std::vector<Item>& items,
                                        const std::vector<RestockRequest>& requests) {
    std::lock_guard<std::mutex> lock(journal_mutex_);

    std::string snapshot_file = generateSnapshotFilename();
    std::string temp_file = snapshot_file + ".tmp";

    {
        std::ofstream file(temp_file, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("PersistenceManager", "createSnapshot", "Cannot create snapshot file: " + temp_file);
            return false;
        }

        file << "# Snapshot created at: " << currentUtcTimestamp() << "\n";
        file << "# Items: " << items.size() << ", requests: " << requests.size() << "\n";
        for (const auto& item : items) {
            file << encodeItem(item) << "\n";
        }
        for (const auto& request : requests) {
            file << encodeRequest(request) << "\n";
        }

        file.flush();
        if (!file.good()) {
            LOG_ERROR("PersistenceManager", "createSnapshot", "Failed writing snapshot: " + temp_file);
            file.close();
            std::remove(temp_file.c_str());
            return false;
        }
    }

    // 原子性重命名
    if (std::rename(temp_file.c_str(), snapshot_file.c_str()) != 0) {
        LOG_ERROR("PersistenceManager", "createSnapshot", "Failed to rename temp file to snapshot");
        std::remove(temp_file.c_str());
        return false;
    }

    // 快照已包含全部状态，截断 WAL
    if (journal_stream_) {
        journal_stream_->close();
    }
    journal_stream_ = std::make_unique<std::ofstream>(journal_file_path_, std::ios::trunc);
    if (!journal_stream_->is_open()) {
        LOG_ERROR("PersistenceManager", "createSnapshot", "Failed to reopen journal after snapshot");
        return false;
    }

    last_snapshot_time_ = currentUtcTimestamp();
    removeOldSnapshots();

    LOG_INFO("PersistenceManager", "createSnapshot", "Snapshot written to " + snapshot_file);
    return true;
}

// ========== 工具方法 ==========

bool PersistenceManager::initializeDataDirectory() {
    try {
        std::filesystem::create_directories(data_dir_);
        return std::filesystem::is_directory(data_dir_);
    } catch (const std::exception& e) {
        LOG_ERROR("PersistenceManager", "initializeDataDirectory", e.what());
        return false;
    }
}

std::string PersistenceManager::generateSnapshotFilename() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::stringstream ss;
    ss << data_dir_ << "/snapshot_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
       << "_" << std::setfill('0') << std::setw(3) << ms.count() << ".dat";

    return ss.str();
}

std::vector<std::string> PersistenceManager::getSnapshotFiles() const {
    std::vector<std::string> snapshot_files;

    for (const auto& entry : std::filesystem::directory_iterator(data_dir_)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (filename.starts_with("snapshot_") && filename.ends_with(".dat")) {
                snapshot_files.push_back(filename);
            }
        }
    }

    std::sort(snapshot_files.begin(), snapshot_files.end());
    return snapshot_files;
}

void PersistenceManager::removeOldSnapshots() {
    auto snapshots = getSnapshotFiles();
    size_t keep = max_snapshots_ > 0 ? static_cast<size_t>(max_snapshots_) : 1;

    for (size_t i = 0; i + keep < snapshots.size(); ++i) {
        std::error_code ec;
        std::filesystem::remove(data_dir_ + "/" + snapshots[i], ec);
        if (ec) {
            LOG_WARNING("PersistenceManager", "removeOldSnapshots",
                        "Failed to remove " + snapshots[i] + ": " + ec.message());
        }
    }
}

PersistenceManager::StorageInfo PersistenceManager::getStorageInfo() const {
    StorageInfo info;
    info.data_dir = data_dir_;
    info.journal_file = journal_file_path_;

    auto snapshots = getSnapshotFiles();
    if (!snapshots.empty()) {
        info.latest_snapshot_file = snapshots.back();
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(journal_file_path_, ec);
    info.journal_file_size = ec ? 0 : static_cast<size_t>(size);

    std::lock_guard<std::mutex> lock(journal_mutex_);
    info.records_written = records_written_;
    info.last_snapshot_time = last_snapshot_time_;
    return info;
}

bool PersistenceManager::acquireFileLock() {
    std::string lock_file = data_dir_ + "/.lock";
    lock_fd_ = open(lock_file.c_str(), O_CREAT | O_WRONLY, 0644);

    if (lock_fd_ == -1) {
        return false;
    }

    struct flock fl;
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;

    if (fcntl(lock_fd_, F_SETLK, &fl) == -1) {
        close(lock_fd_);
        lock_fd_ = -1;
        return false;
    }
    return true;
}

void PersistenceManager::releaseFileLock() {
    if (lock_fd_ != -1) {
        close(lock_fd_);
        lock_fd_ = -1;
    }
}
