#pragma once

#include "SettlementTypes.hpp"
#include "SettlementConfiguration.hpp"
#include <optional>
#include <string_view>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ILossRuleEngine
// ═══════════════════════════════════════════════════════════════════════════════

class ILossRuleEngine {
public:
    virtual ~ILossRuleEngine() = default;

    virtual std::string_view getName() const noexcept = 0;
    virtual LossMethod method() const noexcept = 0;
    virtual const SettlementConfiguration& configuration() const noexcept = 0;

    // Признанный убыток на одну акцию.
    // sale == std::nullopt означает удерживаемую позицию.
    // Чистая функция: без побочных эффектов, безопасна для параллельного чтения.
    virtual RuleEvaluation evaluate(
        const TimePoint& purchaseDate,
        double purchasePrice,
        const std::optional<SaleEvent>& sale) const = 0;

    ILossRuleEngine(const ILossRuleEngine&) = delete;
    ILossRuleEngine& operator=(const ILossRuleEngine&) = delete;

protected:
    ILossRuleEngine() = default;
};

}  // namespace settlement
