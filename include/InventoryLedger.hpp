#pragma once

#include "SettlementTypes.hpp"
#include "SettlementConfiguration.hpp"
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Лот в очереди FIFO
// ═══════════════════════════════════════════════════════════════════════════════

struct InventoryLot {
    Transaction transaction;        // Исходная запись, не изменяется
    TimePoint valuationDate;        // Дата для движка правил
    double valuationPrice = 0.0;    // Цена для движка правил
    double remainingQuantity = 0.0;

    bool isBeginningHoldings() const noexcept {
        return transaction.type == TransactionType::BeginningHoldings;
    }

    bool isExhausted() const noexcept {
        return remainingQuantity <= kQuantityTolerance;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Inventory Ledger - изменяемые остатки по лотам одного расчёта
// ═══════════════════════════════════════════════════════════════════════════════
//
// Порядок лотов: остатки на начало (по дате, id), затем покупки (по дате, id).
// Курсор указывает на первый неисчерпанный лот и никогда не сдвигается назад.

class InventoryLedger {
public:
    InventoryLedger() = default;

    // Остатки на начало оцениваются на дату начала класса по цене 0;
    // записи с типом Sale игнорируются
    static InventoryLedger build(
        const std::vector<Transaction>& purchases,
        const SettlementConfiguration& configuration);

    const std::vector<InventoryLot>& lots() const noexcept { return lots_; }
    std::size_t size() const noexcept { return lots_.size(); }
    bool empty() const noexcept { return lots_.empty(); }

    // Индекс первого неисчерпанного лота (size(), если всё списано)
    std::size_t firstOpenLot() const noexcept { return cursor_; }

    // Списать количество с лота; возвращает фактически списанное
    // (не больше остатка, остаток не становится отрицательным)
    double consume(std::size_t index, double quantity) noexcept;

    double totalRemaining() const noexcept;

private:
    void advanceCursor() noexcept;

    std::vector<InventoryLot> lots_;
    std::size_t cursor_ = 0;
};

}  // namespace settlement
