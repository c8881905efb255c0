#include "../restock_engine.h"
#include "../persistence.h"
#include "../logger.h"
#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <csignal>
#include <unistd.h>
#include <sys/resource.h>

// 持久化测试：日志编解码、WAL 回放、快照与引擎重启恢复
class PersistenceTester {
public:
    PersistenceTester() {
        base_dir_ = (std::filesystem::temp_directory_path() /
                     ("stockwatch_persistence_test_" + std::to_string(getpid()))).string();
        std::filesystem::remove_all(base_dir_);
    }

    ~PersistenceTester() {
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
    }

    int runAllTests() {
        std::cout << "🔬 开始持久化测试..." << std::endl;

        testFieldEscaping();
        testRecordCodec();
        testJournalReplay();
        testEngineRestart();
        testSnapshotRotation();
        testCorruptJournalDisablesPersistence();
        testTornFulfillmentRecord();
        testJournalWriteFailureRejects();

        std::cout << "\n📊 持久化测试完成! 失败: " << failures_ << " 项" << std::endl;
        return failures_;
    }

private:
    int failures_ = 0;
    std::string base_dir_;

    void expect(bool condition, const std::string& description) {
        if (condition) {
            std::cout << "  ✓ " << description << std::endl;
        } else {
            std::cout << "  ❌ " << description << std::endl;
            failures_++;
        }
    }

    std::string dataDir(const std::string& name) const {
        return base_dir_ + "/" + name;
    }

    static Item makeItem(const std::string& id, int64_t stock, double usage) {
        Item item;
        item.id = id;
        item.name = "Item " + id;
        item.category = "Drug";
        item.unit = "tablet";
        item.facility_id = "PHC001";
        item.facility_name = "Central Primary Health Centre";
        item.current_stock = stock;
        item.daily_usage = usage;
        item.updated_at = "2026-03-01T08:00:00.000Z";
        return item;
    }

    void testFieldEscaping() {
        std::cout << "\n🔤 测试字段转义..." << std::endl;

        std::string tricky = "a|b\\c\nd";
        std::string line = "X|" + PersistenceManager::escapeField(tricky) + "|tail";
        auto fields = PersistenceManager::splitRecord(line);
        expect(fields.size() == 3, "escaped separator does not split the record");
        expect(fields.size() == 3 && fields[1] == tricky, "escaped field restored exactly");
        expect(line.find('\n') == std::string::npos, "newline never reaches the journal line");

        auto empty = PersistenceManager::splitRecord("A||B");
        expect(empty.size() == 3 && empty[1].empty(), "empty fields preserved");
    }

    void testRecordCodec() {
        std::cout << "\n🧬 测试记录编解码..." << std::endl;

        Item item = makeItem("PCM|500", 45, 2.0 / 3.0);
        item.name = "Paracetamol, 500mg | strip";
        Item decoded;
        bool ok = PersistenceManager::decodeItem(
            PersistenceManager::splitRecord(PersistenceManager::encodeItem(item)), decoded);
        expect(ok && decoded.id == item.id && decoded.name == item.name, "item text fields survive");
        expect(ok && decoded.current_stock == 45 && decoded.daily_usage == item.daily_usage,
               "item numbers survive with full precision");

        RestockRequest request;
        request.request_id = 7;
        request.item_id = "PCM|500";
        request.item_name = item.name;
        request.quantity = 95;
        request.priority = RequestPriority::CRITICAL;
        request.status = RequestStatus::APPROVED;
        request.source = RequestSource::MANUAL;
        request.requested_at = "2026-03-01T08:00:00.000Z";
        request.updated_at = "2026-03-01T09:00:00.000Z";
        request.comments = "line one\nline two";

        RestockRequest decoded_request;
        ok = PersistenceManager::decodeRequest(
            PersistenceManager::splitRecord(PersistenceManager::encodeRequest(request)), decoded_request);
        expect(ok && decoded_request.request_id == 7 && decoded_request.status == RequestStatus::APPROVED &&
               decoded_request.priority == RequestPriority::CRITICAL &&
               decoded_request.source == RequestSource::MANUAL, "request enums survive");
        expect(ok && !decoded_request.days_remaining, "absent forecast snapshot stays absent");
        expect(ok && decoded_request.comments == request.comments, "multi-line comments survive");

        auto truncated = PersistenceManager::splitRecord("REQUEST|1|PCM|name");
        expect(!PersistenceManager::decodeRequest(truncated, decoded_request), "short record rejected");

        auto bad_number = PersistenceManager::splitRecord(
            "ITEM|A|name|cat|unit|F|Facility|many|1.0|2026-03-01T08:00:00.000Z");
        expect(!PersistenceManager::decodeItem(bad_number, decoded), "non-numeric stock rejected");
    }

    void testJournalReplay() {
        std::cout << "\n📼 测试日志回放..." << std::endl;
        std::string dir = dataDir("replay");

        {
            PersistenceManager journal(dir);
            Item item = makeItem("A", 45, 10.0);
            journal.writeItem(item);
            journal.writeItem(makeItem("B", 10, 1.0));

            RestockRequest request;
            request.request_id = 3;
            request.item_id = "A";
            request.item_name = item.name;
            request.quantity = 95;
            request.status = RequestStatus::APPROVED;
            request.requested_at = "2026-03-01T08:00:00.000Z";
            request.updated_at = request.requested_at;
            journal.writeRequest(request);

            item.current_stock = 140;
            request.status = RequestStatus::FULFILLED;
            journal.writeFulfillment(item, request);
            journal.writeItemRemoval("B");
            expect(journal.getStorageInfo().records_written == 5, "fulfillment written as a single record");
        }

        {
            std::ofstream garbage(dir + "/current.wal", std::ios::app);
            garbage << "# operator note" << std::endl;
            garbage << "NONSENSE|1|2" << std::endl;
        }

        PersistenceManager journal(dir);
        auto state = journal.recover();
        expect(state.items.size() == 1 && state.items.count("A") == 1, "removed item is not restored");
        expect(state.items["A"].current_stock == 140, "last item record wins");
        expect(state.requests.size() == 1 && state.requests[3].status == RequestStatus::FULFILLED,
               "last request record wins");
        expect(state.records_rejected == 1, "unreadable line counted and skipped");
        expect(journal.validateDataIntegrity(state).isSuccess(), "replayed state passes integrity check");
    }

    void testEngineRestart() {
        std::cout << "\n🔄 测试引擎重启恢复..." << std::endl;
        std::string dir = dataDir("engine");
        uint64_t fulfilled_id = 0;

        {
            RestockEngine engine(dir);
            expect(engine.isPersistenceEnabled(), "persistence enabled");
            engine.addItem(makeItem("PCM", 45, 10.0));
            engine.addItem(makeItem("AMX", 80, 10.0));
            engine.addItem(makeItem("ORS", 120, 10.0));

            SweepReport report = engine.autoRestockCheck();
            expect(report.created.size() == 2, "sweep created two requests before restart");

            for (const auto& request : report.created) {
                if (request.item_id == "PCM") {
                    fulfilled_id = request.request_id;
                    engine.approveRequest(request.request_id);
                    engine.fulfillRequest(request.request_id, std::string("received"));
                }
            }
            engine.recordUsage("ORS", 20);
        }

        {
            RestockEngine engine(dir);
            expect(engine.isPersistenceEnabled(), "persistence enabled after restart");
            expect(engine.listItems().size() == 3, "items restored");
            expect(engine.getItem("PCM") && engine.getItem("PCM")->current_stock == 140, "fulfilled stock restored");
            expect(engine.getItem("ORS") && engine.getItem("ORS")->current_stock == 100, "recorded usage restored");

            auto fulfilled = engine.getRequest(fulfilled_id);
            expect(fulfilled && fulfilled->status == RequestStatus::FULFILLED && fulfilled->comments == "received",
                   "request status and comments restored");
            expect(engine.getSystemStatus().open_requests == 1, "open request restored");

            SweepReport report = engine.autoRestockCheck();
            expect(report.skipped.size() == 1 && report.skipped[0] == "AMX",
                   "restored open request still blocks duplicates");

            ManualRestockRequest manual;
            manual.item_id = "ORS";
            manual.quantity = 10;
            auto created = engine.requestRestock(manual);
            expect(created.isSuccess() && created.getValue().request_id == 3, "request IDs continue after restart");

            engine.removeItem("ORS");
        }

        {
            RestockEngine engine(dir);
            expect(!engine.getItem("ORS"), "archived item stays archived");
            expect(engine.getRequest(3).has_value(), "requests of archived items are kept");

            auto info = engine.getStorageInfo();
            expect(info && !info->latest_snapshot_file.empty(), "shutdown snapshot exists");
        }
    }

    void testSnapshotRotation() {
        std::cout << "\n🗃️ 测试快照轮转..." << std::endl;
        std::string dir = dataDir("snapshots");

        {
            RestockEngine engine(dir);
            engine.addItem(makeItem("A", 45, 10.0));
            for (int i = 0; i < 5; i++) {
                engine.setStock("A", 45 + i);
                expect(engine.createSnapshot(), "snapshot " + std::to_string(i + 1) + " created");
                usleep(5000);
            }

            auto info = engine.getStorageInfo();
            expect(info && info->journal_file_size == 0, "snapshot truncates the journal");
        }

        size_t snapshot_count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            std::string name = entry.path().filename().string();
            if (name.starts_with("snapshot_") && name.ends_with(".dat")) {
                snapshot_count++;
            }
        }
        expect(snapshot_count == 3, "only the three newest snapshots kept");

        RestockEngine engine(dir);
        expect(engine.getItem("A") && engine.getItem("A")->current_stock == 49, "latest snapshot restored");
    }

    void testCorruptJournalDisablesPersistence() {
        std::cout << "\n💥 测试损坏数据..." << std::endl;
        std::string dir = dataDir("corrupt");
        std::filesystem::create_directories(dir);

        {
            std::ofstream wal(dir + "/current.wal");
            wal << PersistenceManager::encodeItem(makeItem("A", 45, 10.0)) << "\n";

            RestockRequest first;
            first.request_id = 1;
            first.item_id = "A";
            first.quantity = 10;
            first.status = RequestStatus::PENDING;
            first.requested_at = "2026-03-01T08:00:00.000Z";
            first.updated_at = first.requested_at;
            RestockRequest second = first;
            second.request_id = 2;
            second.status = RequestStatus::APPROVED;

            wal << PersistenceManager::encodeRequest(first) << "\n";
            wal << PersistenceManager::encodeRequest(second) << "\n";
        }
        auto size_before = std::filesystem::file_size(dir + "/current.wal");

        {
            RestockEngine engine(dir);
            expect(!engine.isPersistenceEnabled(), "two open requests for one item disable persistence");
            expect(engine.listItems().empty() && engine.listRequests().empty(), "engine starts empty");
            expect(engine.addItem(makeItem("B", 1, 1.0)).isSuccess(), "engine still serves in memory");
        }

        expect(std::filesystem::file_size(dir + "/current.wal") == size_before, "corrupt journal left untouched");
    }

    void testTornFulfillmentRecord() {
        std::cout << "\n✂️ 测试入库记录截断..." << std::endl;
        std::string dir = dataDir("torn");
        uint64_t request_id = 0;
        Item credited;
        RestockRequest fulfilled;

        {
            RestockEngine engine(dir);
            engine.addItem(makeItem("A", 45, 10.0));

            ManualRestockRequest manual;
            manual.item_id = "A";
            manual.quantity = 500;
            auto created = engine.requestRestock(manual);
            expect(created.isSuccess(), "request created");
            if (created.isError()) return;
            request_id = created.getValue().request_id;

            auto approved = engine.approveRequest(request_id);
            expect(approved.isSuccess(), "request approved");
            if (approved.isError()) return;

            credited = *engine.getItem("A");
            credited.current_stock = 545;
            fulfilled = approved.getValue();
            fulfilled.status = RequestStatus::FULFILLED;
        }

        std::string record = PersistenceManager::encodeFulfillment(credited, fulfilled);
        Item decoded_item;
        RestockRequest decoded_request;
        expect(PersistenceManager::decodeFulfillment(PersistenceManager::splitRecord(record),
                                                     decoded_item, decoded_request) &&
               decoded_item.current_stock == 545 && decoded_request.request_id == request_id,
               "complete fulfillment record decodes");
        expect(!PersistenceManager::decodeFulfillment(
                   PersistenceManager::splitRecord(record.substr(0, record.size() / 2)),
                   decoded_item, decoded_request),
               "half a fulfillment record is rejected");

        // 进程在写入中途退出：末尾记录缺少结束标记且没有换行
        {
            std::ofstream wal(dir + "/current.wal", std::ios::app);
            wal << record.substr(0, record.size() - 2);
        }

        {
            RestockEngine engine(dir);
            expect(engine.isPersistenceEnabled(), "persistence enabled after torn write");
            expect(engine.getItem("A") && engine.getItem("A")->current_stock == 45,
                   "torn fulfillment does not credit stock");
            auto request = engine.getRequest(request_id);
            expect(request && request->status == RequestStatus::APPROVED, "torn fulfillment leaves request approved");

            auto refulfilled = engine.fulfillRequest(request_id);
            expect(refulfilled.isSuccess(), "request can be fulfilled after recovery");
            expect(engine.getItem("A") && engine.getItem("A")->current_stock == 545, "stock credited exactly once");
            auto second = engine.fulfillRequest(request_id);
            expect(second.isError() && second.getErrorCode() == ErrorCode::INVALID_TRANSITION,
                   "second fulfill rejected");
        }

        {
            RestockEngine engine(dir);
            expect(engine.getItem("A") && engine.getItem("A")->current_stock == 545, "credited stock persisted once");
            auto request = engine.getRequest(request_id);
            expect(request && request->status == RequestStatus::FULFILLED, "fulfilled status persisted");
        }
    }

    void testJournalWriteFailureRejects() {
        std::cout << "\n🚫 测试日志写入失败..." << std::endl;
        std::string dir = dataDir("write_failure");
        std::string wal = dir + "/current.wal";
        uint64_t request_id = 0;

        {
            RestockEngine engine(dir);
            engine.addItem(makeItem("A", 45, 10.0));
            engine.addItem(makeItem("B", 30, 10.0));

            ManualRestockRequest manual;
            manual.item_id = "A";
            manual.quantity = 500;
            auto created = engine.requestRestock(manual);
            expect(created.isSuccess(), "request created");
            if (created.isError()) return;
            request_id = created.getValue().request_id;
            expect(engine.approveRequest(request_id).isSuccess(), "request approved");

            // 文件大小上限设为当前 WAL 大小，之后的追加写入失败
            struct rlimit original;
            if (getrlimit(RLIMIT_FSIZE, &original) != 0) {
                expect(false, "read file size limit");
                return;
            }
            auto journal_size = std::filesystem::file_size(wal);
            std::cout.flush();
            std::signal(SIGXFSZ, SIG_IGN);
            struct rlimit capped = original;
            capped.rlim_cur = static_cast<rlim_t>(journal_size);
            bool capped_ok = setrlimit(RLIMIT_FSIZE, &capped) == 0;

            // 限制生效期间不向标准输出写任何内容
            auto fulfill = engine.fulfillRequest(request_id);
            auto stock_after_fulfill = engine.getItem("A")->current_stock;
            auto status_after_fulfill = engine.getRequest(request_id)->status;
            auto open_after_fulfill = engine.getSystemStatus().open_requests;

            ManualRestockRequest other;
            other.item_id = "B";
            other.quantity = 60;
            auto create = engine.requestRestock(other);
            auto requests_after_create = engine.listRequests().size();

            auto usage = engine.recordUsage("A", 5);
            auto stock_after_usage = engine.getItem("A")->current_stock;

            setrlimit(RLIMIT_FSIZE, &original);
            std::signal(SIGXFSZ, SIG_DFL);
            std::cout.clear();

            expect(capped_ok, "file size limit applied");
            expect(fulfill.isError() && fulfill.getErrorCode() == ErrorCode::JOURNAL_WRITE_FAILED,
                   "fulfill rejected with JOURNAL_WRITE_FAILED");
            expect(stock_after_fulfill == 45, "stock unchanged after rejected fulfill");
            expect(status_after_fulfill == RequestStatus::APPROVED, "request stays approved");
            expect(open_after_fulfill == 1, "open request count unchanged");
            expect(create.isError() && create.getErrorCode() == ErrorCode::JOURNAL_WRITE_FAILED,
                   "request creation rejected with JOURNAL_WRITE_FAILED");
            expect(requests_after_create == 1, "no request added by rejected creation");
            expect(usage.isError() && usage.getErrorCode() == ErrorCode::JOURNAL_WRITE_FAILED,
                   "usage recording rejected with JOURNAL_WRITE_FAILED");
            expect(stock_after_usage == 45, "stock unchanged after rejected usage");
            expect(std::filesystem::file_size(wal) == journal_size, "no partial record left in the journal");

            auto retried = engine.fulfillRequest(request_id);
            expect(retried.isSuccess(), "fulfill succeeds once the journal is writable");
            expect(engine.getItem("A") && engine.getItem("A")->current_stock == 545, "stock credited after retry");
        }

        RestockEngine engine(dir);
        expect(engine.getItem("A") && engine.getItem("A")->current_stock == 545, "restart sees a single credit");
        expect(engine.listRequests().size() == 1, "rejected request never reached disk");
        auto request = engine.getRequest(request_id);
        expect(request && request->status == RequestStatus::FULFILLED, "restart sees fulfilled request");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    PersistenceTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
