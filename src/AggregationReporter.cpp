#include "AggregationReporter.hpp"
#include "DateUtils.hpp"

namespace settlement {

namespace {

void accumulate(GroupTotals& totals, const MatchResult& match)
{
    totals.totalRecognizedLoss += match.recognizedLoss;
    totals.totalQuantity += match.quantity;
    totals.matchCount++;
}

void roundTotals(GroupTotals& totals)
{
    totals.totalRecognizedLoss = roundTo(totals.totalRecognizedLoss, 2);
    totals.totalQuantity = roundTo(totals.totalQuantity, 2);
}

void roundByRule(std::map<std::string, double>& lossByRule)
{
    for (auto& [code, loss] : lossByRule) {
        loss = roundTo(loss, 2);
    }
}

}  // namespace

LossSummary AggregationReporter::summarize(const std::vector<MatchResult>& matches) const
{
    LossSummary summary;

    // ════════════════════════════════════════════════════════════════════════
    // Суммирование без округления
    // ════════════════════════════════════════════════════════════════════════

    for (const auto& match : matches) {
        std::string ruleCode(toString(match.ruleCode));

        summary.totalRecognizedLoss += match.recognizedLoss;
        summary.totalQuantity += match.quantity;
        summary.matchCount++;

        auto& entity = summary.byEntity[match.entity];
        accumulate(entity, match);
        entity.funds.insert(match.fundName);
        entity.lossByRule[ruleCode] += match.recognizedLoss;

        auto& fund = summary.byFund[match.fundName];
        accumulate(fund, match);
        fund.entities.insert(match.entity);
        fund.lossByRule[ruleCode] += match.recognizedLoss;

        accumulate(summary.byRule[ruleCode], match);
        accumulate(summary.byMonth[formatMonthKey(match.purchaseDate)], match);
    }

    if (summary.totalQuantity > 0.0) {
        summary.averageLossPerShare =
            roundTo(summary.totalRecognizedLoss / summary.totalQuantity, 4);
    }

    // ════════════════════════════════════════════════════════════════════════
    // Округление итогов
    // ════════════════════════════════════════════════════════════════════════

    summary.totalRecognizedLoss = roundTo(summary.totalRecognizedLoss, 2);
    summary.totalQuantity = roundTo(summary.totalQuantity, 2);

    for (auto& [name, entity] : summary.byEntity) {
        roundTotals(entity);
        roundByRule(entity.lossByRule);
    }

    for (auto& [name, fund] : summary.byFund) {
        roundTotals(fund);
        roundByRule(fund.lossByRule);
    }

    for (auto& [code, rule] : summary.byRule) {
        roundTotals(rule);
    }

    for (auto& [month, totals] : summary.byMonth) {
        roundTotals(totals);
    }

    return summary;
}

}  // namespace settlement
