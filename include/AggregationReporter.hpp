#pragma once

#include "SettlementTypes.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Структуры сводки
// ═══════════════════════════════════════════════════════════════════════════════

struct GroupTotals {
    double totalRecognizedLoss = 0.0;
    double totalQuantity = 0.0;
    std::size_t matchCount = 0;
};

struct EntitySummary : GroupTotals {
    std::set<std::string> funds;
    std::map<std::string, double> lossByRule;   // Код правила -> убыток
};

struct FundSummary : GroupTotals {
    std::set<std::string> entities;
    std::map<std::string, double> lossByRule;
};

struct RuleSummary : GroupTotals {};

// Месяц даты покупки (оценки), "YYYY-MM"
struct MonthSummary : GroupTotals {};

struct LossSummary {
    double totalRecognizedLoss = 0.0;
    double totalQuantity = 0.0;
    std::size_t matchCount = 0;
    double averageLossPerShare = 0.0;

    // Ключи сравниваются как точные строки
    std::map<std::string, EntitySummary> byEntity;
    std::map<std::string, FundSummary> byFund;
    std::map<std::string, RuleSummary> byRule;
    std::map<std::string, MonthSummary> byMonth;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Aggregation Reporter
// ═══════════════════════════════════════════════════════════════════════════════

class AggregationReporter {
public:
    // Денежные итоги округляются до 2 знаков один раз, после суммирования
    LossSummary summarize(const std::vector<MatchResult>& matches) const;
};

}  // namespace settlement
