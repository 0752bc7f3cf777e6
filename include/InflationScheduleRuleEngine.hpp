#pragma once

#include "LossRuleEngineBase.hpp"

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Метод B: ограничение по разнице искусственной инфляции (KRAFT_HEINZ)
// ═══════════════════════════════════════════════════════════════════════════════

class InflationScheduleRuleEngine : public LossRuleEngineBase {
public:
    // configuration должна содержать график инфляции
    explicit InflationScheduleRuleEngine(ConfigurationPtr configuration);
    ~InflationScheduleRuleEngine() override = default;

    std::string_view getName() const noexcept override { return "InflationSchedule"; }
    LossMethod method() const noexcept override { return LossMethod::InflationSchedule; }

protected:
    double heldCap(
        const TimePoint& purchaseDate,
        Details& details) const override;

    // max(0, инфляция на дату покупки - инфляция на дату продажи)
    double saleCap(
        const TimePoint& purchaseDate,
        const SaleEvent& sale,
        Details& details) const override;

    std::string ruleLabel(RuleCode code) const override;
};

}  // namespace settlement
