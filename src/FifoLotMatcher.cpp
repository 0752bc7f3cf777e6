#include "FifoLotMatcher.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <iostream>
#include <tuple>

namespace settlement {

FifoLotMatcher::FifoLotMatcher(const ILossRuleEngine& engine)
    : engine_(engine)
{
}

MatchResult FifoLotMatcher::makeMatch(
    const InventoryLot& lot,
    const Transaction& sale,
    double quantity,
    const RuleEvaluation& evaluation,
    std::size_t sequence) const
{
    MatchResult match;
    match.matchId = lot.transaction.id + "_" + sale.id + "_" + std::to_string(sequence);
    match.purchaseId = lot.transaction.id;
    match.saleId = sale.id;
    match.quantity = quantity;
    match.recognizedLoss = evaluation.recognizedLossPerShare * quantity;
    match.ruleCode = evaluation.ruleCode;
    match.ruleApplied = evaluation.ruleLabel;
    match.purchaseDate = lot.valuationDate;
    match.purchasePrice = lot.valuationPrice;
    match.saleDate = sale.date;
    match.salePrice = sale.price;
    match.entity = lot.transaction.entity;
    match.fundName = lot.transaction.fundName;
    match.details = evaluation.details;
    return match;
}

MatchOutcome FifoLotMatcher::match(
    const std::vector<Transaction>& purchases,
    std::vector<Transaction> sales) const
{
    MatchOutcome outcome;
    outcome.inventory = InventoryLedger::build(purchases, engine_.configuration());

    std::stable_sort(sales.begin(), sales.end(),
        [](const Transaction& a, const Transaction& b) {
            return std::tie(a.date, a.id) < std::tie(b.date, b.id);
        });

    auto& ledger = outcome.inventory;

    for (const auto& sale : sales) {
        double remainingToSell = sale.quantity;

        // ════════════════════════════════════════════════════════════════════
        // Проходим очередь от первого неисчерпанного лота
        // ════════════════════════════════════════════════════════════════════

        for (std::size_t idx = ledger.firstOpenLot();
             idx < ledger.size() && remainingToSell > kQuantityTolerance;
             ++idx) {

            const auto& lot = ledger.lots()[idx];

            if (lot.isExhausted()) {
                continue;
            }

            // Лот датирован позже продажи: данные противоречивы, лот пропускаем
            if (lot.transaction.date > sale.date) {
                MatchAnomaly anomaly;
                anomaly.purchaseId = lot.transaction.id;
                anomaly.saleId = sale.id;
                anomaly.purchaseDate = lot.transaction.date;
                anomaly.saleDate = sale.date;
                anomaly.reason = "Purchase date after sale date";

                std::cerr << "⚠ Warning: Purchase " << anomaly.purchaseId
                          << " (" << formatDateTime(anomaly.purchaseDate) << ")"
                          << " is dated after sale " << anomaly.saleId
                          << " (" << formatDateTime(anomaly.saleDate) << "), lot skipped"
                          << std::endl;

                outcome.anomalies.push_back(std::move(anomaly));

                // Обычные покупки отсортированы по дате: дальше только более поздние
                if (!lot.isBeginningHoldings()) {
                    break;
                }
                continue;
            }

            double matchQuantity = std::min(remainingToSell, lot.remainingQuantity);

            auto evaluation = engine_.evaluate(
                lot.valuationDate,
                lot.valuationPrice,
                SaleEvent{sale.date, sale.price});

            double recognizedLoss = evaluation.recognizedLossPerShare * matchQuantity;

            LotAllocation allocation;
            allocation.purchaseId = lot.transaction.id;
            allocation.saleId = sale.id;
            allocation.quantity = matchQuantity;
            allocation.recognizedLoss = recognizedLoss;
            allocation.ruleCode = evaluation.ruleCode;
            outcome.allocations.push_back(std::move(allocation));

            // Сопоставления с нулевым убытком в результат не попадают
            if (recognizedLoss > 0.0) {
                outcome.matches.push_back(
                    makeMatch(lot, sale, matchQuantity, evaluation, outcome.matches.size()));
            }

            remainingToSell -= ledger.consume(idx, matchQuantity);
        }

        SaleFill fill;
        fill.saleId = sale.id;
        fill.quantity = sale.quantity;
        fill.matchedQuantity = sale.quantity - std::max(0.0, remainingToSell);

        if (!fill.isFullyMatched()) {
            std::cerr << "⚠ Warning: Sale " << sale.id << " matched "
                      << formatQuantity(fill.matchedQuantity) << " of "
                      << formatQuantity(fill.quantity)
                      << " shares (insufficient inventory)" << std::endl;
        }

        outcome.saleFills.push_back(std::move(fill));
    }

    return outcome;
}

}  // namespace settlement
