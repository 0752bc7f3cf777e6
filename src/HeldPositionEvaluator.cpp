#include "HeldPositionEvaluator.hpp"

namespace settlement {

HeldPositionEvaluator::HeldPositionEvaluator(const ILossRuleEngine& engine)
    : engine_(engine)
{
}

std::vector<MatchResult> HeldPositionEvaluator::evaluateHeld(
    const InventoryLedger& inventory) const
{
    std::vector<MatchResult> heldLosses;
    const auto& config = engine_.configuration();

    for (const auto& lot : inventory.lots()) {
        if (lot.isExhausted()) {
            continue;
        }

        if (!lot.isBeginningHoldings() && !config.isWithinClassPeriod(lot.valuationDate)) {
            continue;
        }

        auto evaluation = engine_.evaluate(lot.valuationDate, lot.valuationPrice, std::nullopt);
        double recognizedLoss = evaluation.recognizedLossPerShare * lot.remainingQuantity;

        if (recognizedLoss <= 0.0) {
            continue;
        }

        MatchResult match;
        match.matchId = lot.transaction.id + "_held_" + std::to_string(heldLosses.size());
        match.purchaseId = lot.transaction.id;
        match.quantity = lot.remainingQuantity;
        match.recognizedLoss = recognizedLoss;
        match.ruleCode = evaluation.ruleCode;
        match.ruleApplied = std::move(evaluation.ruleLabel);
        match.purchaseDate = lot.valuationDate;
        match.purchasePrice = lot.valuationPrice;
        match.entity = lot.transaction.entity;
        match.fundName = lot.transaction.fundName;
        match.details = std::move(evaluation.details);

        heldLosses.push_back(std::move(match));
    }

    return heldLosses;
}

}  // namespace settlement
