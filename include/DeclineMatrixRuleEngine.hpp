#pragma once

#include "LossRuleEngineBase.hpp"

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Метод A: ограничение по матрице снижения цены (TWITTER)
// ═══════════════════════════════════════════════════════════════════════════════

class DeclineMatrixRuleEngine : public LossRuleEngineBase {
public:
    // configuration должна содержать матрицу снижения
    explicit DeclineMatrixRuleEngine(ConfigurationPtr configuration);
    ~DeclineMatrixRuleEngine() override = default;

    std::string_view getName() const noexcept override { return "DeclineMatrix"; }
    LossMethod method() const noexcept override { return LossMethod::DeclineMatrix; }

protected:
    // Снижение от группы покупки до начала lookback-периода
    double heldCap(
        const TimePoint& purchaseDate,
        Details& details) const override;

    double saleCap(
        const TimePoint& purchaseDate,
        const SaleEvent& sale,
        Details& details) const override;

    std::string ruleLabel(RuleCode code) const override;

private:
    void addGroupDetails(
        const TimePoint& purchaseDate,
        std::optional<std::size_t> saleGroup,
        Details& details) const;
};

}  // namespace settlement
