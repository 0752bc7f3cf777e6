#pragma once

#include "ILossRuleEngine.hpp"
#include "InventoryLedger.hpp"
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Held-Position Evaluator - убыток по непроданным остаткам
// ═══════════════════════════════════════════════════════════════════════════════

class HeldPositionEvaluator {
public:
    explicit HeldPositionEvaluator(const ILossRuleEngine& engine);

    // Для каждого лота с остатком > 0: покупки вне класса пропускаются
    // (остатки на начало - никогда), результат только с убытком > 0
    std::vector<MatchResult> evaluateHeld(const InventoryLedger& inventory) const;

    HeldPositionEvaluator(const HeldPositionEvaluator&) = delete;
    HeldPositionEvaluator& operator=(const HeldPositionEvaluator&) = delete;

private:
    const ILossRuleEngine& engine_;
};

}  // namespace settlement
