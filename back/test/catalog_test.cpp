#include "../stock_catalog.h"
#include "../logger.h"
#include <iostream>
#include <string>
#include <limits>

class CatalogTester {
public:
    int runAllTests() {
        std::cout << "🔬 开始库存目录测试..." << std::endl;

        testAddItem();
        testItemValidation();
        testRecordUsage();
        testPartialUpdate();
        testCreditStock();
        testListingAndRemoval();

        std::cout << "\n📊 库存目录测试完成! 失败: " << failures_ << " 项" << std::endl;
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
        item.category = "Drug";
        item.unit = "tablet";
        item.facility_id = facility;
        item.facility_name = "Facility " + facility;
        item.current_stock = stock;
        item.daily_usage = usage;
        return item;
    }

    void testAddItem() {
        std::cout << "\n📥 测试物品录入..." << std::endl;
        StockCatalog catalog;

        auto added = catalog.addItem(makeItem("A", 45, 10.0));
        expect(added.isSuccess(), "new item accepted");
        expect(added && !added.getValue().updated_at.empty(), "updated_at is stamped");
        expect(catalog.hasItem("A") && catalog.size() == 1, "item is stored");

        auto duplicate = catalog.addItem(makeItem("A", 10, 1.0));
        expect(duplicate.isError() && duplicate.getErrorCode() == ErrorCode::DUPLICATE_ITEM_ID,
               "duplicate ID rejected");
        expect(catalog.getItem("A")->current_stock == 45, "duplicate does not overwrite");

        auto zero = catalog.addItem(makeItem("Z", 0, 0.0));
        expect(zero.isSuccess(), "zero stock and zero usage accepted");
    }

    void testItemValidation() {
        std::cout << "\n🛡️ 测试物品校验..." << std::endl;
        StockCatalog catalog;

        auto negative = catalog.addItem(makeItem("N", -1, 1.0));
        expect(negative.isError() && negative.getErrorCode() == ErrorCode::NEGATIVE_QUANTITY,
               "negative stock rejected");

        auto bad_usage = catalog.addItem(makeItem("U", 5, -0.5));
        expect(bad_usage.isError() && bad_usage.getErrorCode() == ErrorCode::INVALID_PARAMETER,
               "negative usage rejected");

        auto nan_usage = catalog.addItem(makeItem("V", 5, std::numeric_limits<double>::quiet_NaN()));
        expect(nan_usage.isError(), "NaN usage rejected");

        Item unnamed = makeItem("W", 5, 1.0);
        unnamed.name.clear();
        expect(catalog.addItem(unnamed).isError(), "empty name rejected");

        expect(catalog.addItem(makeItem("", 5, 1.0)).isError(), "empty ID rejected");
        expect(catalog.size() == 0, "nothing stored after rejections");

        catalog.addItem(makeItem("A", 10, 1.0));
        auto set_negative = catalog.setStock("A", -3);
        expect(set_negative.isError() && catalog.getItem("A")->current_stock == 10,
               "setStock to negative rejected, stock unchanged");

        auto set_usage = catalog.setDailyUsage("A", 2.5);
        expect(set_usage.isSuccess() && catalog.getItem("A")->daily_usage == 2.5, "setDailyUsage applies");

        auto missing = catalog.setStock("missing", 1);
        expect(missing.isError() && missing.getErrorCode() == ErrorCode::ITEM_NOT_FOUND, "unknown item reported");
    }

    void testRecordUsage() {
        std::cout << "\n📉 测试登记消耗..." << std::endl;
        StockCatalog catalog;
        catalog.addItem(makeItem("A", 45, 10.0));

        auto used = catalog.recordUsage("A", 5);
        expect(used.isSuccess() && used.getValue().current_stock == 40, "usage deducted");

        auto too_much = catalog.recordUsage("A", 41);
        expect(too_much.isError() && too_much.getErrorCode() == ErrorCode::INSUFFICIENT_STOCK,
               "usage above stock rejected");
        expect(catalog.getItem("A")->current_stock == 40, "stock unchanged after rejection");

        auto negative = catalog.recordUsage("A", -1);
        expect(negative.isError() && negative.getErrorCode() == ErrorCode::NEGATIVE_QUANTITY,
               "negative usage rejected");

        auto all = catalog.recordUsage("A", 40);
        expect(all.isSuccess() && all.getValue().current_stock == 0, "using the whole stock reaches zero");

        auto missing = catalog.recordUsage("missing", 1);
        expect(missing.isError() && missing.getErrorCode() == ErrorCode::ITEM_NOT_FOUND, "unknown item reported");
    }

    void testPartialUpdate() {
        std::cout << "\n✏️ 测试局部更新..." << std::endl;
        StockCatalog catalog;
        catalog.addItem(makeItem("A", 45, 10.0));

        ItemPatch patch;
        patch.name = "Paracetamol 500mg";
        patch.daily_usage = 4.0;
        auto updated = catalog.updateItem("A", patch);
        expect(updated.isSuccess(), "patch applied");
        expect(updated && updated.getValue().name == "Paracetamol 500mg" &&
               updated.getValue().daily_usage == 4.0, "patched fields changed");
        expect(updated && updated.getValue().current_stock == 45 && updated.getValue().unit == "tablet",
               "unpatched fields kept");

        auto empty = catalog.updateItem("A", ItemPatch());
        expect(empty.isError() && empty.getErrorCode() == ErrorCode::INVALID_PARAMETER, "empty patch rejected");

        ItemPatch bad;
        bad.current_stock = -10;
        expect(catalog.updateItem("A", bad).isError(), "invalid patch rejected");
        expect(catalog.getItem("A")->current_stock == 45, "invalid patch leaves item unchanged");
    }

    void testCreditStock() {
        std::cout << "\n📦 测试入库加量..." << std::endl;
        StockCatalog catalog;
        catalog.addItem(makeItem("A", 45, 10.0));

        bool guard_called = false;
        auto credited = catalog.creditStock("A", 500, [&guard_called](const Item& item) {
            guard_called = item.current_stock == 545;
            return RESULT_SUCCESS_VOID();
        });
        expect(credited.isSuccess() && catalog.getItem("A")->current_stock == 545, "stock credited");
        expect(guard_called, "guard sees the updated item before commit");

        auto refused = catalog.creditStock("A", 10, [](const Item&) {
            return RESULT_ERROR_VOID(ErrorCode::JOURNAL_WRITE_FAILED, "disk full",
                                     ERROR_CONTEXT("CatalogTester", "guard"));
        });
        expect(refused.isError() && refused.getErrorCode() == ErrorCode::JOURNAL_WRITE_FAILED,
               "guard failure is reported");
        expect(catalog.getItem("A")->current_stock == 545, "guard failure rolls back");

        expect(catalog.creditStock("A", 0, StockCatalog::CommitGuard()).isError(), "zero credit rejected");

        catalog.setStock("A", std::numeric_limits<int64_t>::max() - 1);
        expect(catalog.creditStock("A", 5, StockCatalog::CommitGuard()).isError(), "overflow rejected");
    }

    void testListingAndRemoval() {
        std::cout << "\n🗂️ 测试列表与归档..." << std::endl;
        StockCatalog catalog;
        catalog.addItem(makeItem("C", 1, 1.0, "PHC002"));
        catalog.addItem(makeItem("A", 1, 1.0, "PHC001"));
        catalog.addItem(makeItem("B", 1, 1.0, "PHC001"));

        auto all = catalog.listItems();
        expect(all.size() == 3 && all[0].id == "A" && all[1].id == "B" && all[2].id == "C",
               "listing is ordered by ID");

        auto phc1 = catalog.listItems("PHC001");
        expect(phc1.size() == 2 && phc1[0].id == "A", "facility filter applied");

        expect(catalog.removeItem("B").isSuccess() && !catalog.hasItem("B"), "item archived");
        auto again = catalog.removeItem("B");
        expect(again.isError() && again.getErrorCode() == ErrorCode::ITEM_NOT_FOUND, "second removal reports missing");
        expect(catalog.size() == 2, "size follows removals");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    CatalogTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
