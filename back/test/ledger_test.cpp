#include "../restock_ledger.h"
#include "../stock_catalog.h"
#include "../logger.h"
#include <iostream>
#include <string>
#include <thread>
#include <chrono>

class LedgerTester {
public:
    int runAllTests() {
        std::cout << "🔬 开始补货台账测试..." << std::endl;

        testCreateValidation();
        testDuplicateOpenRequest();
        testApproveAndFulfill();
        testDeclineReleasesItem();
        testInvalidTransitions();
        testFulfillMissingItem();
        testListing();
        testRestore();

        std::cout << "\n📊 补货台账测试完成! 失败: " << failures_ << " 项" << std::endl;
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

    static Item makeItem(const std::string& id, int64_t stock, double usage,
                         const std::string& facility = "PHC001") {
        Item item;
        item.id = id;
        item.name = "Item " + id;
        item.facility_id = facility;
        item.facility_name = "Facility " + facility;
        item.current_stock = stock;
        item.daily_usage = usage;
        return item;
    }

    static RestockSpec makeSpec(const std::string& item_id, int64_t quantity,
                                RequestPriority priority = RequestPriority::HIGH) {
        RestockSpec spec;
        spec.item_id = item_id;
        spec.quantity = quantity;
        spec.priority = priority;
        spec.source = RequestSource::MANUAL;
        return spec;
    }

    void testCreateValidation() {
        std::cout << "\n🛡️ 测试新建校验..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        auto negative = ledger.create(makeSpec("A", -5));
        expect(negative.isError() && negative.getErrorCode() == ErrorCode::NEGATIVE_QUANTITY,
               "negative quantity rejected");

        auto zero = ledger.create(makeSpec("A", 0));
        expect(zero.isError() && zero.getErrorCode() == ErrorCode::INVALID_PARAMETER, "zero quantity rejected");

        auto missing = ledger.create(makeSpec("missing", 10));
        expect(missing.isError() && missing.getErrorCode() == ErrorCode::ITEM_NOT_FOUND, "unknown item rejected");

        expect(ledger.size() == 0, "no request stored after rejections");

        RestockSpec spec = makeSpec("A", 500, RequestPriority::CRITICAL);
        spec.days_remaining = 4;
        spec.comments = "ward running low";
        auto created = ledger.create(spec);
        expect(created.isSuccess() && created.getValue() == 1, "first request gets ID 1");

        auto stored = ledger.get(1);
        expect(stored && stored->status == RequestStatus::PENDING, "new request is Pending");
        expect(stored && stored->item_name == "Item A" && stored->facility_id == "PHC001",
               "item details copied onto the request");
        expect(stored && stored->days_remaining && *stored->days_remaining == 4, "forecast snapshot stored");
        expect(stored && stored->requested_at == stored->updated_at, "timestamps start equal");
    }

    void testDuplicateOpenRequest() {
        std::cout << "\n🔁 测试重复请求..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        auto first = ledger.create(makeSpec("A", 100));
        auto second = ledger.create(makeSpec("A", 50));
        expect(first.isSuccess(), "first request created");
        expect(second.isError() && second.getErrorCode() == ErrorCode::DUPLICATE_OPEN_REQUEST,
               "second open request rejected while Pending");

        ledger.approve(first.getValue());
        auto third = ledger.create(makeSpec("A", 50));
        expect(third.isError() && third.getErrorCode() == ErrorCode::DUPLICATE_OPEN_REQUEST,
               "second open request rejected while Approved");

        auto open = ledger.openRequestFor("A");
        expect(open && open->request_id == first.getValue(), "open request lookup returns the first request");
        expect(ledger.openCount() == 1 && ledger.size() == 1, "only one request stored");
    }

    void testApproveAndFulfill() {
        std::cout << "\n✅ 测试审批与入库..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        uint64_t id = ledger.create(makeSpec("A", 500)).getValue();

        auto approved = ledger.approve(id, std::string("approved by pharmacist"));
        expect(approved.isSuccess() && approved.getValue().status == RequestStatus::APPROVED, "request approved");
        expect(approved && approved.getValue().comments == "approved by pharmacist", "approval comment stored");
        expect(catalog.getItem("A")->current_stock == 45, "approval does not change stock");

        auto fulfilled = ledger.fulfill(id);
        expect(fulfilled.isSuccess() && fulfilled.getValue().status == RequestStatus::FULFILLED,
               "request fulfilled");
        expect(catalog.getItem("A")->current_stock == 545, "stock increased by request quantity");
        expect(fulfilled && fulfilled.getValue().comments == "approved by pharmacist",
               "comments kept when none supplied");
        expect(ledger.openCount() == 0 && !ledger.openRequestFor("A"), "item has no open request");

        auto again = ledger.fulfill(id);
        expect(again.isError() && again.getErrorCode() == ErrorCode::INVALID_TRANSITION,
               "second fulfill rejected");
        expect(catalog.getItem("A")->current_stock == 545, "second fulfill does not add stock");

        auto next = ledger.create(makeSpec("A", 20));
        expect(next.isSuccess() && next.getValue() == id + 1, "new request allowed after fulfillment");
    }

    void testDeclineReleasesItem() {
        std::cout << "\n🚫 测试拒绝..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        uint64_t id = ledger.create(makeSpec("A", 100)).getValue();
        auto declined = ledger.decline(id, std::string("no funding"));
        expect(declined.isSuccess() && declined.getValue().status == RequestStatus::DECLINED, "request declined");
        expect(declined && declined.getValue().comments == "no funding", "decline comment stored");
        expect(catalog.getItem("A")->current_stock == 45, "decline does not change stock");

        auto replacement = ledger.create(makeSpec("A", 80));
        expect(replacement.isSuccess(), "new request allowed after decline");
    }

    void testInvalidTransitions() {
        std::cout << "\n⛔ 测试非法状态迁移..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        uint64_t id = ledger.create(makeSpec("A", 100)).getValue();

        auto early = ledger.fulfill(id);
        expect(early.isError() && early.getErrorCode() == ErrorCode::INVALID_TRANSITION,
               "Pending request cannot be fulfilled");
        expect(catalog.getItem("A")->current_stock == 45, "failed fulfill leaves stock unchanged");

        ledger.approve(id);
        auto approve_twice = ledger.approve(id);
        expect(approve_twice.isError() && approve_twice.getErrorCode() == ErrorCode::INVALID_TRANSITION,
               "Approved request cannot be approved again");

        auto decline_approved = ledger.decline(id);
        expect(decline_approved.isError() && decline_approved.getErrorCode() == ErrorCode::INVALID_TRANSITION,
               "Approved request cannot be declined");
        expect(ledger.get(id)->status == RequestStatus::APPROVED, "status unchanged by failed transitions");

        auto unknown = ledger.approve(999);
        expect(unknown.isError() && unknown.getErrorCode() == ErrorCode::REQUEST_NOT_FOUND,
               "unknown request reported");
        expect(ledger.fulfill(999).getErrorCode() == ErrorCode::REQUEST_NOT_FOUND, "unknown fulfill reported");
    }

    void testFulfillMissingItem() {
        std::cout << "\n👻 测试物品已归档时入库..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0));

        uint64_t id = ledger.create(makeSpec("A", 100)).getValue();
        ledger.approve(id);
        catalog.removeItem("A");

        auto fulfilled = ledger.fulfill(id);
        expect(fulfilled.isError() && fulfilled.getErrorCode() == ErrorCode::ITEM_NOT_FOUND,
               "fulfill reports missing item");
        expect(ledger.get(id)->status == RequestStatus::APPROVED, "request stays Approved");
    }

    void testListing() {
        std::cout << "\n🗂️ 测试请求列表..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.addItem(makeItem("A", 45, 10.0, "PHC001"));
        catalog.addItem(makeItem("B", 45, 10.0, "PHC002"));
        catalog.addItem(makeItem("C", 45, 10.0, "PHC001"));

        uint64_t a = ledger.create(makeSpec("A", 10)).getValue();
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        uint64_t b = ledger.create(makeSpec("B", 10)).getValue();
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        uint64_t c = ledger.create(makeSpec("C", 10)).getValue();
        ledger.approve(b);

        auto all = ledger.list();
        expect(all.size() == 3 && all[0].request_id == a && all[1].request_id == b && all[2].request_id == c,
               "list ordered by request time");

        auto pending = ledger.list(RequestStatus::PENDING);
        expect(pending.size() == 2 && pending[0].request_id == a && pending[1].request_id == c,
               "status filter applied");

        auto phc1 = ledger.list(std::nullopt, "PHC001");
        expect(phc1.size() == 2, "facility filter applied");

        auto approved_phc2 = ledger.list(RequestStatus::APPROVED, "PHC002");
        expect(approved_phc2.size() == 1 && approved_phc2[0].request_id == b, "filters combine");

        expect(ledger.list(RequestStatus::FULFILLED).empty(), "empty filter result");
    }

    void testRestore() {
        std::cout << "\n♻️ 测试恢复..." << std::endl;
        StockCatalog catalog;
        RestockLedger ledger(catalog);
        catalog.restoreItem(makeItem("A", 45, 10.0));
        catalog.restoreItem(makeItem("B", 45, 10.0));

        RestockRequest restored;
        restored.request_id = 41;
        restored.item_id = "A";
        restored.item_name = "Item A";
        restored.quantity = 100;
        restored.status = RequestStatus::APPROVED;
        restored.requested_at = "2026-01-01T00:00:00.000Z";
        restored.updated_at = restored.requested_at;
        ledger.restoreRequest(restored);

        expect(ledger.openCount() == 1, "restored open request counted");
        auto duplicate = ledger.create(makeSpec("A", 10));
        expect(duplicate.isError() && duplicate.getErrorCode() == ErrorCode::DUPLICATE_OPEN_REQUEST,
               "restored open request blocks duplicates");

        auto next = ledger.create(makeSpec("B", 10));
        expect(next.isSuccess() && next.getValue() == 42, "IDs continue after restored maximum");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    LedgerTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
