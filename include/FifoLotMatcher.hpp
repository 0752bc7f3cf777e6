#pragma once

#include "ILossRuleEngine.hpp"
#include "InventoryLedger.hpp"
#include <vector>
#include <string>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Заполнение продажи
// ═══════════════════════════════════════════════════════════════════════════════

struct SaleFill {
    std::string saleId;
    double quantity = 0.0;
    double matchedQuantity = 0.0;

    // Недостаточный запас - не ошибка, а структурный признак
    bool isFullyMatched() const noexcept {
        return quantity - matchedQuantity <= kQuantityTolerance;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результат сопоставления
// ═══════════════════════════════════════════════════════════════════════════════

struct MatchOutcome {
    std::vector<MatchResult> matches;          // Только с убытком > 0
    InventoryLedger inventory;                 // Остатки после всех продаж
    std::vector<LotAllocation> allocations;    // Все списания, включая нулевые
    std::vector<MatchAnomaly> anomalies;
    std::vector<SaleFill> saleFills;
};

// ═══════════════════════════════════════════════════════════════════════════════
// FIFO Lot Matcher
// ═══════════════════════════════════════════════════════════════════════════════

class FifoLotMatcher {
public:
    explicit FifoLotMatcher(const ILossRuleEngine& engine);

    // purchases: покупки и остатки на начало; sales: продажи.
    // Порядок входа не важен: сортировка по (дата, id).
    // Каждая единица лота списывается не более одного раза.
    MatchOutcome match(
        const std::vector<Transaction>& purchases,
        std::vector<Transaction> sales) const;

    FifoLotMatcher(const FifoLotMatcher&) = delete;
    FifoLotMatcher& operator=(const FifoLotMatcher&) = delete;

private:
    const ILossRuleEngine& engine_;

    MatchResult makeMatch(
        const InventoryLot& lot,
        const Transaction& sale,
        double quantity,
        const RuleEvaluation& evaluation,
        std::size_t sequence) const;
};

}  // namespace settlement
