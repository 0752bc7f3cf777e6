#pragma once

#include "SettlementTypes.hpp"
#include "SettlementConfiguration.hpp"
#include "ILossRuleEngine.hpp"
#include "FifoLotMatcher.hpp"
#include "AggregationReporter.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Результат расчёта по пакету сделок
// ═══════════════════════════════════════════════════════════════════════════════

struct CalculationResult {
    bool success = false;
    std::string message;
    SettlementType settlementType = SettlementType::Twitter;

    // При success == false сводка пуста, частичных итогов не бывает
    LossSummary summary;
    std::vector<MatchResult> matches;        // Продажи, затем удерживаемые позиции
    std::vector<LotAllocation> allocations;
    std::vector<MatchAnomaly> anomalies;
    std::vector<SaleFill> saleFills;
};

// Оценка одной пары покупка/продажа
struct SingleEvaluation {
    double recognizedLossPerShare = 0.0;
    double totalRecognizedLoss = 0.0;
    double quantity = 0.0;
    RuleCode ruleCode = RuleCode::OutsidePeriod;
    std::string ruleLabel;
    Details details;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Settlement Calculator
// ═══════════════════════════════════════════════════════════════════════════════
//
// Неизменяем после создания: каждый вызов calculate() работает
// на собственной копии остатков, повторный запуск даёт тот же результат.

class SettlementCalculator {
public:
    SettlementCalculator(ConfigurationPtr configuration,
                         std::unique_ptr<ILossRuleEngine> engine);

    static std::expected<std::unique_ptr<SettlementCalculator>, std::string> create(
        std::string_view selector);

    static std::expected<std::unique_ptr<SettlementCalculator>, std::string> create(
        ConfigurationPtr configuration);

    CalculationResult calculate(const std::vector<Transaction>& transactions) const;

    SingleEvaluation evaluateSingle(
        const TimePoint& purchaseDate,
        double purchasePrice,
        const std::optional<SaleEvent>& sale,
        double quantity = 1.0,
        bool isBeginningHoldings = false) const;

    const SettlementConfiguration& configuration() const noexcept { return *configuration_; }
    const ILossRuleEngine& engine() const noexcept { return *engine_; }

    SettlementCalculator(const SettlementCalculator&) = delete;
    SettlementCalculator& operator=(const SettlementCalculator&) = delete;

private:
    CalculationResult runCalculation(const std::vector<Transaction>& transactions) const;

    ConfigurationPtr configuration_;
    std::unique_ptr<ILossRuleEngine> engine_;
};

}  // namespace settlement
