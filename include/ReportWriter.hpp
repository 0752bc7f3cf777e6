#pragma once

#include "SettlementCalculator.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Report Writer - экспорт результатов расчёта
// ═══════════════════════════════════════════════════════════════════════════════

class ReportWriter {
public:
    // Колонки: match_id, purchase_id, sale_id, quantity, recognized_loss,
    // loss_per_share, rule_code, rule_applied, purchase_date, sale_date,
    // purchase_price, sale_price, entity, fund_name, details
    std::string matchesToCsv(const std::vector<MatchResult>& matches) const;

    nlohmann::json detailsToJson(const Details& details) const;
    nlohmann::json matchToJson(const MatchResult& match) const;
    nlohmann::json summaryToJson(const LossSummary& summary) const;

    // Полный отчёт; сопоставления - только при includeMatches
    nlohmann::json reportToJson(const CalculationResult& result, bool includeMatches) const;

    nlohmann::json singleToJson(const SingleEvaluation& single) const;

    void printReport(std::ostream& out, const CalculationResult& result, bool detailed) const;
    void printSingle(std::ostream& out, const SingleEvaluation& single) const;
    void printConfiguration(std::ostream& out, const SettlementConfiguration& config) const;

    Result writeFile(std::string_view filePath, std::string_view content) const;
};

}  // namespace settlement
