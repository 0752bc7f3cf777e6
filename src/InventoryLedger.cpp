#include "InventoryLedger.hpp"
#include <algorithm>
#include <numeric>
#include <tuple>

namespace settlement {

namespace {

bool byDateThenId(const Transaction& a, const Transaction& b)
{
    return std::tie(a.date, a.id) < std::tie(b.date, b.id);
}

}  // namespace

InventoryLedger InventoryLedger::build(
    const std::vector<Transaction>& purchases,
    const SettlementConfiguration& configuration)
{
    std::vector<Transaction> beginningHoldings;
    std::vector<Transaction> regularPurchases;

    for (const auto& txn : purchases) {
        if (txn.type == TransactionType::BeginningHoldings) {
            beginningHoldings.push_back(txn);
        } else if (txn.type == TransactionType::Purchase) {
            regularPurchases.push_back(txn);
        }
    }

    std::stable_sort(beginningHoldings.begin(), beginningHoldings.end(), byDateThenId);
    std::stable_sort(regularPurchases.begin(), regularPurchases.end(), byDateThenId);

    InventoryLedger ledger;
    ledger.lots_.reserve(beginningHoldings.size() + regularPurchases.size());

    // Остатки на начало считаются купленными в начале класса по нулевой цене
    for (auto& txn : beginningHoldings) {
        InventoryLot lot;
        lot.valuationDate = configuration.classStart();
        lot.valuationPrice = 0.0;
        lot.remainingQuantity = txn.quantity;
        lot.transaction = std::move(txn);
        ledger.lots_.push_back(std::move(lot));
    }

    for (auto& txn : regularPurchases) {
        InventoryLot lot;
        lot.valuationDate = txn.date;
        lot.valuationPrice = txn.price;
        lot.remainingQuantity = txn.quantity;
        lot.transaction = std::move(txn);
        ledger.lots_.push_back(std::move(lot));
    }

    ledger.advanceCursor();
    return ledger;
}

double InventoryLedger::consume(std::size_t index, double quantity) noexcept
{
    if (index >= lots_.size() || quantity <= 0.0) {
        return 0.0;
    }

    auto& lot = lots_[index];
    double consumed = std::min(quantity, lot.remainingQuantity);
    lot.remainingQuantity -= consumed;

    if (lot.remainingQuantity <= kQuantityTolerance) {
        lot.remainingQuantity = 0.0;
    }

    advanceCursor();
    return consumed;
}

double InventoryLedger::totalRemaining() const noexcept
{
    return std::accumulate(lots_.begin(), lots_.end(), 0.0,
        [](double sum, const InventoryLot& lot) { return sum + lot.remainingQuantity; });
}

void InventoryLedger::advanceCursor() noexcept
{
    while (cursor_ < lots_.size() && lots_[cursor_].isExhausted()) {
        ++cursor_;
    }
}

}  // namespace settlement
