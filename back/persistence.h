#ifndef PERSISTENCE_H
#define PERSISTENCE_H

#include "restock_types.h"
#include "error_handling.h"
#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <map>
#include <vector>
#include <cstdint>

// 持久化管理器：预写日志 (WAL) + 快照
//
// 每次实体状态变化追加一行完整记录（ITEM|...、REQUEST|...、REMOVE|... 或 FULFILL|...），
// 恢复时按 "最新快照 -> current.wal" 的顺序回放，同一ID以最后一条为准。
class PersistenceManager {
public:
    // 数据目录无法初始化或已被其他进程锁定时抛出 StockwatchException
    explicit PersistenceManager(const std::string& data_dir = "./data");
    ~PersistenceManager();

    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    // ========== WAL (Write-Ahead Logging) ==========

    // 写前日志：在内存更新前先写磁盘并刷新
    bool writeItem(const Item& item);
    bool writeRequest(const RestockRequest& request);

    // 物品归档（从目录移除），回放时删除该物品
    bool writeItemRemoval(const std::string& item_id);

    // 入库：物品库存与请求状态写成一条 FULFILL 记录，回放时整条生效
    bool writeFulfillment(const Item& item, const RestockRequest& request);

    // ========== 数据恢复 ==========

    struct RecoveredState {
        std::map<std::string, Item> items;
        std::map<uint64_t, RestockRequest> requests;
        size_t records_read;
        size_t records_rejected;     // 无法解析的行

        RecoveredState() : records_read(0), records_rejected(0) {}
    };

    RecoveredState recover();

    // 库存非负、数量为正、同一物品最多一个未完成请求
    Result<void> validateDataIntegrity(const RecoveredState& state) const;

    // ========== 快照管理 ==========

    // 写入全部实体后截断 WAL；只保留最近 max_snapshots_ 个快照
    bool createSnapshot(const std::vector<Item>& items, const std::vector<RestockRequest>& requests);

    // ========== 文件管理 ==========

    struct StorageInfo {
        std::string data_dir;
        std::string journal_file;
        std::string latest_snapshot_file;
        size_t journal_file_size;
        size_t records_written;       // 本次运行写入的记录数
        std::string last_snapshot_time;

        StorageInfo() : journal_file_size(0), records_written(0) {}
    };

    StorageInfo getStorageInfo() const;

    // ========== 记录编解码 ==========

    static std::string encodeItem(const Item& item);
    static std::string encodeRequest(const RestockRequest& request);
    static bool decodeItem(const std::vector<std::string>& fields, Item& item);
    static bool decodeRequest(const std::vector<std::string>& fields, RestockRequest& request);
    static std::string encodeFulfillment(const Item& item, const RestockRequest& request);
    static bool decodeFulfillment(const std::vector<std::string>& fields, Item& item, RestockRequest& request);

    // 按未转义的 '|' 切分，并还原 \| \\ \n \r
    static std::vector<std::string> splitRecord(const std::string& line);
    static std::string escapeField(const std::string& value);

private:
    std::string data_dir_;
    std::string journal_file_path_;
    std::unique_ptr<std::ofstream> journal_stream_;
    mutable std::mutex journal_mutex_;

    int max_snapshots_;
    size_t records_written_;
    std::string last_snapshot_time_;
    int lock_fd_;

    bool appendLines(const std::vector<std::string>& lines);
    void discardFailedWrite(std::uintmax_t size_before, bool truncate);
    void terminateTornRecord();
    bool applyLine(const std::string& line, RecoveredState& state) const;
    void replayFile(const std::string& path, RecoveredState& state, ErrorCode open_failure) const;

    bool initializeDataDirectory();
    std::string generateSnapshotFilename() const;
    std::vector<std::string> getSnapshotFiles() const;
    void removeOldSnapshots();

    bool acquireFileLock();
    void releaseFileLock();
};

#endif // PERSISTENCE_H
