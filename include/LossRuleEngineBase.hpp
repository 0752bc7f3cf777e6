#pragma once

#include "ILossRuleEngine.hpp"
#include <memory>
#include <string>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Base Loss Rule Engine
// ═══════════════════════════════════════════════════════════════════════════════
//
// Общий порядок правил для обоих методов (первое совпадение побеждает):
//   OUTSIDE_PERIOD -> D (нет продажи) -> A -> B -> C -> POST_LOOKBACK
//
// Наследник задаёт только ограничение сверху (cap):
//   heldCap  - для удерживаемых бумаг
//   saleCap  - для пары покупка/продажа

class LossRuleEngineBase : public ILossRuleEngine {
public:
    explicit LossRuleEngineBase(ConfigurationPtr configuration);
    ~LossRuleEngineBase() override = default;

    const SettlementConfiguration& configuration() const noexcept override {
        return *configuration_;
    }

    RuleEvaluation evaluate(
        const TimePoint& purchaseDate,
        double purchasePrice,
        const std::optional<SaleEvent>& sale) const override;

    LossRuleEngineBase(const LossRuleEngineBase&) = delete;
    LossRuleEngineBase& operator=(const LossRuleEngineBase&) = delete;

protected:
    virtual double heldCap(
        const TimePoint& purchaseDate,
        Details& details) const = 0;

    virtual double saleCap(
        const TimePoint& purchaseDate,
        const SaleEvent& sale,
        Details& details) const = 0;

    // Формулировка правила в терминах уведомления
    virtual std::string ruleLabel(RuleCode code) const = 0;

    ConfigurationPtr configuration_;

private:
    RuleEvaluation makeEvaluation(
        RuleCode code,
        double recognizedLossPerShare,
        Details details) const;
};

}  // namespace settlement
