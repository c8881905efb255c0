#include "../restock_engine.h"
#include "../logger.h"
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <algorithm>

class SweepTester {
public:
    int runAllTests() {
        std::cout << "🔬 开始补货巡检测试..." << std::endl;

        testCommitCreatesForTriggeredItems();
        testSweepIsIdempotent();
        testPreviewWritesNothing();
        testManualRequestBlocksSweep();
        testRecurringSweep();

        std::cout << "\n📊 补货巡检测试完成! 失败: " << failures_ << " 项" << std::endl;
        return failures_;
    }

private:
    int failures_ = 0;

    void expect(bool condition, const std::string& description) {
        if (condition) {
            std::cout << "  ✓ " << description << std::endl;
        } else {
            std::cout << "  ❌ " << description << std::endl;
            failures_++;
        }
    }

    static Item makeItem(const std::string& id, int64_t stock, double usage) {
        Item item;
        item.id = id;
        item.name = "Item " + id;
        item.facility_id = "PHC001";
        item.facility_name = "Central Primary Health Centre";
        item.current_stock = stock;
        item.daily_usage = usage;
        return item;
    }

    static void seed(RestockEngine& engine) {
        engine.addItem(makeItem("PCM", 45, 10.0));    // 4 天, Critical
        engine.addItem(makeItem("AMX", 80, 10.0));    // 8 天, High
        engine.addItem(makeItem("ORS", 120, 10.0));   // 12 天, Normal
        engine.addItem(makeItem("GLV", 300, 0.0));    // Unknown
    }

    static bool contains(const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    void testCommitCreatesForTriggeredItems() {
        std::cout << "\n🧹 测试提交巡检..." << std::endl;
        RestockEngine engine("");
        seed(engine);

        SweepReport report = engine.autoRestockCheck();
        expect(report.mode == SweepMode::COMMIT && report.evaluated == 4, "every item evaluated once");
        expect(report.created.size() == 2, "Critical and High items get requests");

        auto pcm = engine.listRequests(RequestStatus::PENDING);
        bool found_critical = false;
        for (const auto& request : pcm) {
            if (request.item_id == "PCM") {
                found_critical = request.priority == RequestPriority::CRITICAL &&
                                 request.source == RequestSource::AUTO &&
                                 request.days_remaining && *request.days_remaining == 4 &&
                                 request.quantity == 95;
            }
            expect(request.item_id != "ORS" && request.item_id != "GLV", "no request for " + request.item_id +
                   " outside trigger tiers");
        }
        expect(found_critical, "PCM request is Critical, automatic, 95 units, 4 days remaining");
        expect(report.errors.empty() && report.skipped.empty(), "no skips or errors on first sweep");
    }

    void testSweepIsIdempotent() {
        std::cout << "\n🔁 测试巡检幂等..." << std::endl;
        RestockEngine engine("");
        seed(engine);

        engine.autoRestockCheck();
        SweepReport second = engine.autoRestockCheck();
        expect(second.created.empty(), "second sweep creates nothing");
        expect(second.skipped.size() == 2 && contains(second.skipped, "PCM") && contains(second.skipped, "AMX"),
               "items with open requests reported as skipped");
        expect(engine.listRequests().size() == 2, "request count unchanged");

        auto requests = engine.listRequests();
        uint64_t pcm_id = 0;
        for (const auto& request : requests) {
            if (request.item_id == "PCM") pcm_id = request.request_id;
        }
        engine.approveRequest(pcm_id);
        engine.fulfillRequest(pcm_id);
        expect(engine.getItem("PCM")->current_stock == 140, "fulfilled top-up reaches 14 days of stock");

        SweepReport third = engine.autoRestockCheck();
        expect(third.created.empty() && !contains(third.skipped, "PCM"),
               "restocked item no longer triggers");
    }

    void testPreviewWritesNothing() {
        std::cout << "\n👀 测试预览巡检..." << std::endl;
        RestockEngine engine("");
        seed(engine);

        SweepReport preview = engine.previewRestock();
        expect(preview.mode == SweepMode::PREVIEW, "preview mode reported");
        expect(preview.proposed.size() == 2 && preview.created.empty(), "preview proposes without creating");
        expect(engine.listRequests().empty(), "preview leaves the ledger untouched");

        SweepReport commit = engine.autoRestockCheck();
        expect(commit.created.size() == preview.proposed.size(), "commit matches preview");
    }

    void testManualRequestBlocksSweep() {
        std::cout << "\n✋ 测试手工请求..." << std::endl;
        RestockEngine engine("");
        seed(engine);

        ManualRestockRequest manual;
        manual.item_id = "PCM";
        manual.quantity = 300;
        manual.comments = "outbreak";
        auto created = engine.requestRestock(manual);
        expect(created.isSuccess() && created.getValue().source == RequestSource::MANUAL, "manual request created");
        expect(created && created.getValue().priority == RequestPriority::CRITICAL,
               "manual priority defaults to the forecast tier");

        SweepReport report = engine.autoRestockCheck();
        expect(contains(report.skipped, "PCM") && report.created.size() == 1, "sweep skips manually requested item");

        auto duplicate = engine.requestRestock(manual);
        expect(duplicate.isError() && duplicate.getErrorCode() == ErrorCode::DUPLICATE_OPEN_REQUEST,
               "manual duplicate rejected");

        ManualRestockRequest normal;
        normal.item_id = "ORS";
        auto suggested = engine.requestRestock(normal);
        expect(suggested.isSuccess() && suggested.getValue().quantity == 20 &&
               suggested.getValue().priority == RequestPriority::NORMAL,
               "manual request for a Normal item uses the suggested quantity");

        ManualRestockRequest unknown;
        unknown.item_id = "GLV";
        auto fixed = engine.requestRestock(unknown);
        expect(fixed.isSuccess() && fixed.getValue().quantity == 100 && !fixed.getValue().days_remaining,
               "manual request without usage data uses the fixed quantity");

        ManualRestockRequest missing;
        missing.item_id = "NOPE";
        auto not_found = engine.requestRestock(missing);
        expect(not_found.isError() && not_found.getErrorCode() == ErrorCode::ITEM_NOT_FOUND,
               "manual request for unknown item rejected");
    }

    void testRecurringSweep() {
        std::cout << "\n⏱️ 测试周期巡检..." << std::endl;
        RestockEngine engine("");
        seed(engine);

        expect(!engine.startRecurringSweep(0), "zero interval rejected");
        expect(engine.startRecurringSweep(1), "recurring sweep started");
        expect(!engine.startRecurringSweep(1), "second start rejected while running");

        std::this_thread::sleep_for(std::chrono::milliseconds(1600));
        engine.stopRecurringSweep();

        auto status = engine.getSystemStatus();
        expect(!status.recurring_sweep_running, "recurring sweep stopped");
        expect(status.sweeps_completed >= 1, "recurring sweep ran at least once");
        expect(status.open_requests == 2, "recurring sweep created the triggered requests");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    SweepTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
