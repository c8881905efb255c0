#include "../depletion_forecaster.h"
#include "../logger.h"
#include <iostream>
#include <string>
#include <limits>
#include <cmath>

class ForecasterTester {
public:
    int runAllTests() {
        std::cout << "🔬 开始消耗预测测试..." << std::endl;

        testTierBoundaries();
        testUnknownUsage();
        testFloorAndDisplayValue();
        testExtremeValues();

        std::cout << "\n📊 消耗预测测试完成! 失败: " << failures_ << " 项" << std::endl;
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

    static Item makeItem(int64_t stock, double usage) {
        Item item;
        item.id = "ITEM";
        item.name = "Test item";
        item.current_stock = stock;
        item.daily_usage = usage;
        return item;
    }

    void testTierBoundaries() {
        std::cout << "\n📏 测试分级边界..." << std::endl;

        Forecast f = DepletionForecaster::forecast(makeItem(45, 10.0));
        expect(f.has_estimate && f.remaining_days == 4 && f.tier == UrgencyTier::CRITICAL,
               "45 units at 10/day -> 4 days, Critical");

        f = DepletionForecaster::forecast(makeItem(59, 10.0));
        expect(f.remaining_days == 5 && f.tier == UrgencyTier::CRITICAL, "5 days is still Critical");

        f = DepletionForecaster::forecast(makeItem(60, 10.0));
        expect(f.remaining_days == 6 && f.tier == UrgencyTier::HIGH, "6 days is High");

        f = DepletionForecaster::forecast(makeItem(109, 10.0));
        expect(f.remaining_days == 10 && f.tier == UrgencyTier::HIGH, "10 days is still High");

        f = DepletionForecaster::forecast(makeItem(110, 10.0));
        expect(f.remaining_days == 11 && f.tier == UrgencyTier::NORMAL, "11 days is Normal");

        f = DepletionForecaster::forecast(makeItem(120, 10.0));
        expect(f.remaining_days == 12 && f.tier == UrgencyTier::NORMAL, "120 units at 10/day -> 12 days, Normal");

        f = DepletionForecaster::forecast(makeItem(0, 3.0));
        expect(f.remaining_days == 0 && f.tier == UrgencyTier::CRITICAL, "empty shelf with usage is Critical");

        expect(DepletionForecaster::tierForDays(-1) == UrgencyTier::CRITICAL, "negative days map to Critical");
    }

    void testUnknownUsage() {
        std::cout << "\n❓ 测试未知消耗..." << std::endl;

        Forecast f = DepletionForecaster::forecast(makeItem(10, 0.0));
        expect(!f.has_estimate && f.tier == UrgencyTier::UNKNOWN, "zero usage gives Unknown");

        f = DepletionForecaster::forecast(makeItem(0, 0.0));
        expect(!f.has_estimate && f.tier == UrgencyTier::UNKNOWN, "zero stock and zero usage gives Unknown");

        f = DepletionForecaster::forecast(makeItem(10, -2.0));
        expect(f.tier == UrgencyTier::UNKNOWN, "negative usage gives Unknown");

        f = DepletionForecaster::forecast(makeItem(10, std::numeric_limits<double>::quiet_NaN()));
        expect(f.tier == UrgencyTier::UNKNOWN, "NaN usage gives Unknown");
    }

    void testFloorAndDisplayValue() {
        std::cout << "\n🔢 测试取整与展示值..." << std::endl;

        Forecast f = DepletionForecaster::forecast(makeItem(45, 10.0));
        expect(std::fabs(f.exact_days - 4.5) < 1e-9, "exact days rounded to one decimal");

        f = DepletionForecaster::forecast(makeItem(3, 0.1));
        expect(f.remaining_days == 30, "3 / 0.1 computes exactly 30");

        // 33 / 1.1 在 double 中为 29.999999999999996
        f = DepletionForecaster::forecast(makeItem(33, 1.1));
        expect(f.remaining_days == 29 && std::fabs(f.exact_days - 30.0) < 1e-9,
               "33 / 1.1 floors the computed quotient to 29, 30.0 displayed");

        f = DepletionForecaster::forecast(makeItem(5999999999LL, 1e9));
        expect(f.remaining_days == 5 && f.tier == UrgencyTier::CRITICAL,
               "quotient just below 6 stays at 5 days and critical");

        f = DepletionForecaster::forecast(makeItem(10, 3.0));
        expect(f.remaining_days == 3 && std::fabs(f.exact_days - 3.3) < 1e-9, "10 / 3 -> 3 days, 3.3 displayed");

        Item a = makeItem(77, 7.5);
        Forecast first = DepletionForecaster::forecast(a);
        Forecast second = DepletionForecaster::forecast(a);
        expect(first.remaining_days == second.remaining_days && first.tier == second.tier,
               "forecast is deterministic");
    }

    void testExtremeValues() {
        std::cout << "\n🌌 测试极端值..." << std::endl;

        Forecast f = DepletionForecaster::forecast(makeItem(std::numeric_limits<int64_t>::max(), 1e-300));
        expect(f.has_estimate && f.remaining_days == std::numeric_limits<int64_t>::max() &&
               f.tier == UrgencyTier::NORMAL, "huge ratio clamps instead of overflowing");

        f = DepletionForecaster::forecast(makeItem(1, 1e9));
        expect(f.remaining_days == 0 && f.tier == UrgencyTier::CRITICAL, "tiny ratio floors to zero");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    ForecasterTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
