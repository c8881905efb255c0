#include "../restock_policy.h"
#include "../depletion_forecaster.h"
#include "../logger.h"
#include <iostream>
#include <string>

class PolicyTester {
public:
    int runAllTests() {
        std::cout << "🔬 开始补货策略测试..." << std::endl;

        testTriggerTiers();
        testOpenRequestSuppression();
        testTopUpQuantity();
        testFixedQuantity();
        testConfigValidation();

        std::cout << "\n📊 补货策略测试完成! 失败: " << failures_ << " 项" << std::endl;
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
        item.name = id;
        item.current_stock = stock;
        item.daily_usage = usage;
        return item;
    }

    std::optional<RestockSpec> evaluate(const RestockPolicy& policy, const Item& item, bool has_open = false) {
        return policy.evaluate(item, DepletionForecaster::forecast(item), has_open);
    }

    void testTriggerTiers() {
        std::cout << "\n🎯 测试触发等级..." << std::endl;
        RestockPolicy policy;

        auto spec = evaluate(policy, makeItem("critical", 45, 10.0));
        expect(spec.has_value() && spec->priority == RequestPriority::CRITICAL,
               "Critical item produces a Critical request");
        expect(spec && spec->days_remaining && *spec->days_remaining == 4, "spec carries forecast snapshot");
        expect(spec && spec->source == RequestSource::AUTO, "policy requests are automatic");

        spec = evaluate(policy, makeItem("high", 80, 10.0));
        expect(spec.has_value() && spec->priority == RequestPriority::HIGH, "High item produces a High request");

        expect(!evaluate(policy, makeItem("normal", 120, 10.0)), "Normal item produces nothing");
        expect(!evaluate(policy, makeItem("unknown", 5, 0.0)), "Unknown item produces nothing");

        PolicyConfig critical_only;
        critical_only.trigger_tier = UrgencyTier::CRITICAL;
        RestockPolicy strict(critical_only);
        expect(!evaluate(strict, makeItem("high", 80, 10.0)), "Critical trigger skips High items");
        expect(evaluate(strict, makeItem("critical", 45, 10.0)).has_value(), "Critical trigger keeps Critical items");

        PolicyConfig everything;
        everything.trigger_tier = UrgencyTier::NORMAL;
        RestockPolicy eager(everything);
        expect(evaluate(eager, makeItem("normal", 120, 10.0)).has_value(), "Normal trigger includes Normal items");
        expect(!evaluate(eager, makeItem("unknown", 5, 0.0)), "Unknown never triggers");
    }

    void testOpenRequestSuppression() {
        std::cout << "\n🔁 测试已有未完成请求..." << std::endl;
        RestockPolicy policy;
        expect(!evaluate(policy, makeItem("critical", 45, 10.0), true), "open request suppresses a new spec");
    }

    void testTopUpQuantity() {
        std::cout << "\n📦 测试补足数量..." << std::endl;
        RestockPolicy policy;

        expect(policy.suggestedQuantity(makeItem("a", 45, 10.0)) == 95, "tops up 45 units to 14 days of 10/day");
        expect(policy.suggestedQuantity(makeItem("b", 0, 2.5)) == 35, "fractional usage rounds target up");
        expect(policy.suggestedQuantity(makeItem("c", 500, 10.0)) == 1, "already above target uses minimum");
        expect(policy.suggestedQuantity(makeItem("d", 5, 0.0)) == 100, "no usage data uses fixed quantity");

        PolicyConfig config;
        config.target_days = 7;
        config.minimum_quantity = 20;
        RestockPolicy weekly(config);
        expect(weekly.suggestedQuantity(makeItem("e", 60, 10.0)) == 20, "minimum quantity applies");
        expect(weekly.suggestedQuantity(makeItem("f", 10, 10.0)) == 60, "one week supply target");
    }

    void testFixedQuantity() {
        std::cout << "\n📌 测试固定数量..." << std::endl;
        PolicyConfig config;
        config.quantity_mode = QuantityMode::FIXED;
        config.fixed_reorder_quantity = 250;
        RestockPolicy policy(config);

        auto spec = evaluate(policy, makeItem("critical", 45, 10.0));
        expect(spec && spec->quantity == 250, "fixed mode always requests the fixed quantity");

        QuantityMode mode = QuantityMode::TOP_UP;
        expect(parseQuantityMode("FIXED", mode) && mode == QuantityMode::FIXED, "quantity mode parses");
        expect(!parseQuantityMode("weekly", mode), "unknown quantity mode rejected");
        expect(quantityModeToString(QuantityMode::TOP_UP) == "top_up", "quantity mode prints");
    }

    void testConfigValidation() {
        std::cout << "\n🛡️ 测试配置校验..." << std::endl;

        expect(RestockPolicy::validateConfig(PolicyConfig()).isSuccess(), "defaults are valid");

        PolicyConfig config;
        config.trigger_tier = UrgencyTier::UNKNOWN;
        auto result = RestockPolicy::validateConfig(config);
        expect(result.isError() && result.getErrorCode() == ErrorCode::INVALID_CONFIG, "Unknown trigger rejected");

        config = PolicyConfig();
        config.target_days = 0;
        expect(RestockPolicy::validateConfig(config).isError(), "zero target days rejected");

        config = PolicyConfig();
        config.fixed_reorder_quantity = -5;
        expect(RestockPolicy::validateConfig(config).isError(), "negative fixed quantity rejected");

        config = PolicyConfig();
        config.minimum_quantity = 0;
        expect(RestockPolicy::validateConfig(config).isError(), "zero minimum quantity rejected");
    }
};

int main() {
    Logger::getInstance().enableConsoleOutput(false);

    PolicyTester tester;
    return tester.runAllTests() == 0 ? 0 : 1;
}
