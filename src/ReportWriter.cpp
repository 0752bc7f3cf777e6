#include "ReportWriter.hpp"
#include "DateUtils.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace settlement {

using json = nlohmann::json;

namespace {

std::string formatFixed(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// Поле CSV в кавычках, если содержит разделитель, кавычки или перевод строки
std::string escapeCsv(const std::string& field)
{
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

json groupTotalsToJson(const GroupTotals& totals)
{
    json j;
    j["total_recognized_loss"] = totals.totalRecognizedLoss;
    j["total_quantity"] = totals.totalQuantity;
    j["match_count"] = totals.matchCount;
    return j;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// CSV
// ═══════════════════════════════════════════════════════════════════════════════

std::string ReportWriter::matchesToCsv(const std::vector<MatchResult>& matches) const
{
    std::ostringstream csv;
    csv << "match_id,purchase_id,sale_id,quantity,recognized_loss,loss_per_share,"
           "rule_code,rule_applied,purchase_date,sale_date,purchase_price,sale_price,"
           "entity,fund_name,details\n";

    for (const auto& match : matches) {
        csv << escapeCsv(match.matchId) << ','
            << escapeCsv(match.purchaseId) << ','
            << escapeCsv(match.saleId.value_or("")) << ','
            << formatQuantity(match.quantity) << ','
            << formatFixed(match.recognizedLoss, 2) << ','
            << formatFixed(match.lossPerShare(), 4) << ','
            << toString(match.ruleCode) << ','
            << escapeCsv(match.ruleApplied) << ','
            << formatDateTime(match.purchaseDate) << ','
            << (match.saleDate ? formatDateTime(*match.saleDate) : "") << ','
            << formatFixed(match.purchasePrice, 2) << ','
            << (match.salePrice ? formatFixed(*match.salePrice, 2) : "") << ','
            << escapeCsv(match.entity) << ','
            << escapeCsv(match.fundName) << ','
            << escapeCsv(detailsToJson(match.details).dump())
            << '\n';
    }

    return csv.str();
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════════

json ReportWriter::detailsToJson(const Details& details) const
{
    json j = json::object();
    for (const auto& [key, value] : details) {
        std::visit([&j, &key](const auto& v) { j[key] = v; }, value);
    }
    return j;
}

json ReportWriter::matchToJson(const MatchResult& match) const
{
    json j;
    j["match_id"] = match.matchId;
    j["purchase_id"] = match.purchaseId;
    j["sale_id"] = match.saleId ? json(*match.saleId) : json(nullptr);
    j["quantity"] = match.quantity;
    j["recognized_loss"] = roundTo(match.recognizedLoss, 2);
    j["loss_per_share"] = roundTo(match.lossPerShare(), 4);
    j["rule_code"] = std::string(toString(match.ruleCode));
    j["rule_applied"] = match.ruleApplied;
    j["purchase_date"] = formatDateTime(match.purchaseDate);
    j["sale_date"] = match.saleDate ? json(formatDateTime(*match.saleDate)) : json(nullptr);
    j["purchase_price"] = match.purchasePrice;
    j["sale_price"] = match.salePrice ? json(*match.salePrice) : json(nullptr);
    j["entity"] = match.entity;
    j["fund_name"] = match.fundName;
    j["details"] = detailsToJson(match.details);
    return j;
}

json ReportWriter::summaryToJson(const LossSummary& summary) const
{
    json j;
    j["total_recognized_loss"] = summary.totalRecognizedLoss;
    j["total_quantity"] = summary.totalQuantity;
    j["match_count"] = summary.matchCount;
    j["average_loss_per_share"] = summary.averageLossPerShare;

    json byEntity = json::object();
    for (const auto& [name, entity] : summary.byEntity) {
        json e = groupTotalsToJson(entity);
        e["funds"] = entity.funds;
        e["loss_by_rule"] = entity.lossByRule;
        byEntity[name] = e;
    }
    j["by_entity"] = byEntity;

    json byFund = json::object();
    for (const auto& [name, fund] : summary.byFund) {
        json f = groupTotalsToJson(fund);
        f["entities"] = fund.entities;
        f["loss_by_rule"] = fund.lossByRule;
        byFund[name] = f;
    }
    j["by_fund"] = byFund;

    json byRule = json::object();
    for (const auto& [code, rule] : summary.byRule) {
        byRule[code] = groupTotalsToJson(rule);
    }
    j["by_rule"] = byRule;

    json byMonth = json::object();
    for (const auto& [month, totals] : summary.byMonth) {
        byMonth[month] = groupTotalsToJson(totals);
    }
    j["by_month"] = byMonth;

    return j;
}

json ReportWriter::reportToJson(const CalculationResult& result, bool includeMatches) const
{
    json j;
    j["success"] = result.success;
    j["message"] = result.message;
    j["settlement_type"] = std::string(toString(result.settlementType));
    j["summary"] = summaryToJson(result.summary);

    json anomalies = json::array();
    for (const auto& anomaly : result.anomalies) {
        anomalies.push_back({
            {"purchase_id", anomaly.purchaseId},
            {"sale_id", anomaly.saleId},
            {"purchase_date", formatDateTime(anomaly.purchaseDate)},
            {"sale_date", formatDateTime(anomaly.saleDate)},
            {"reason", anomaly.reason}
        });
    }
    j["anomalies"] = anomalies;

    json unmatched = json::array();
    for (const auto& fill : result.saleFills) {
        if (!fill.isFullyMatched()) {
            unmatched.push_back({
                {"sale_id", fill.saleId},
                {"quantity", fill.quantity},
                {"matched_quantity", fill.matchedQuantity}
            });
        }
    }
    j["unmatched_sales"] = unmatched;

    if (includeMatches) {
        json matches = json::array();
        for (const auto& match : result.matches) {
            matches.push_back(matchToJson(match));
        }
        j["matches"] = matches;
    }

    return j;
}

json ReportWriter::singleToJson(const SingleEvaluation& single) const
{
    json j;
    j["recognized_loss_per_share"] = single.recognizedLossPerShare;
    j["total_recognized_loss"] = single.totalRecognizedLoss;
    j["quantity"] = single.quantity;
    j["rule_code"] = std::string(toString(single.ruleCode));
    j["rule_applied"] = single.ruleLabel;
    j["details"] = detailsToJson(single.details);
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Консольный отчёт
// ═══════════════════════════════════════════════════════════════════════════════

void ReportWriter::printReport(
    std::ostream& out, const CalculationResult& result, bool detailed) const
{
    const auto& summary = result.summary;

    out << "\n" << std::string(70, '=') << std::endl;
    out << "RECOGNIZED LOSS REPORT: " << toString(result.settlementType) << std::endl;
    out << std::string(70, '=') << std::endl << std::endl;

    if (!result.success) {
        out << "Calculation failed: " << result.message << std::endl;
        out << std::string(70, '=') << std::endl << std::endl;
        return;
    }

    out << "Summary:" << std::endl;
    out << "  Total Recognized Loss: $" << formatFixed(summary.totalRecognizedLoss, 2) << std::endl;
    out << "  Total Quantity:        " << formatFixed(summary.totalQuantity, 2) << std::endl;
    out << "  Matches:               " << summary.matchCount << std::endl;
    out << "  Avg Loss per Share:    $" << formatFixed(summary.averageLossPerShare, 4) << std::endl;
    out << std::endl;

    if (!summary.byRule.empty()) {
        out << "By Rule:" << std::endl;
        for (const auto& [code, rule] : summary.byRule) {
            out << "  " << std::left << std::setw(16) << code << std::right
                << " $" << std::setw(14) << formatFixed(rule.totalRecognizedLoss, 2)
                << "  (" << rule.matchCount << " matches, "
                << formatFixed(rule.totalQuantity, 2) << " shares)" << std::endl;
        }
        out << std::endl;
    }

    if (!summary.byEntity.empty()) {
        out << "By Entity:" << std::endl;
        for (const auto& [name, entity] : summary.byEntity) {
            out << "  " << std::left << std::setw(24) << name << std::right
                << " $" << std::setw(14) << formatFixed(entity.totalRecognizedLoss, 2)
                << std::endl;
        }
        out << std::endl;
    }

    if (!summary.byFund.empty()) {
        out << "By Fund:" << std::endl;
        for (const auto& [name, fund] : summary.byFund) {
            out << "  " << std::left << std::setw(24) << name << std::right
                << " $" << std::setw(14) << formatFixed(fund.totalRecognizedLoss, 2)
                << std::endl;
        }
        out << std::endl;
    }

    if (!result.anomalies.empty()) {
        out << "Data Anomalies:" << std::endl;
        for (const auto& anomaly : result.anomalies) {
            out << "  ⚠ " << anomaly.purchaseId << " -> " << anomaly.saleId
                << ": " << anomaly.reason << std::endl;
        }
        out << std::endl;
    }

    if (detailed && !result.matches.empty()) {
        out << "Matches:" << std::endl;
        for (const auto& match : result.matches) {
            out << "  " << match.matchId
                << "  " << formatDateTime(match.purchaseDate)
                << " -> " << (match.saleDate ? formatDateTime(*match.saleDate) : "held")
                << "  qty " << formatQuantity(match.quantity)
                << "  $" << formatFixed(match.recognizedLoss, 2)
                << "  [" << toString(match.ruleCode) << "]" << std::endl;
        }
        out << std::endl;
    }

    out << std::string(70, '=') << std::endl << std::endl;
}

void ReportWriter::printSingle(std::ostream& out, const SingleEvaluation& single) const
{
    out << "\n" << std::string(70, '=') << std::endl;
    out << "SINGLE TRANSACTION EVALUATION" << std::endl;
    out << std::string(70, '=') << std::endl << std::endl;

    out << "  Rule:                  " << single.ruleLabel
        << " [" << toString(single.ruleCode) << "]" << std::endl;
    out << "  Loss per Share:        $" << formatFixed(single.recognizedLossPerShare, 4) << std::endl;
    out << "  Quantity:              " << formatQuantity(single.quantity) << std::endl;
    out << "  Total Recognized Loss: $" << formatFixed(single.totalRecognizedLoss, 2) << std::endl;

    if (!single.details.empty()) {
        out << std::endl << "Details:" << std::endl;
        for (const auto& [key, value] : single.details) {
            out << "  " << std::left << std::setw(22) << key << std::right << " ";
            std::visit([&out](const auto& v) { out << v; }, value);
            out << std::endl;
        }
    }

    out << std::endl << std::string(70, '=') << std::endl << std::endl;
}

void ReportWriter::printConfiguration(
    std::ostream& out, const SettlementConfiguration& config) const
{
    out << "\n" << std::string(70, '=') << std::endl;
    out << "SETTLEMENT: " << toString(config.type())
        << " (" << toString(config.method()) << ")" << std::endl;
    out << std::string(70, '=') << std::endl << std::endl;

    out << "  Class Period:          " << formatDate(config.classStart())
        << " - " << formatDate(config.classEnd()) << std::endl;
    out << "  Lookback Period:       " << formatDate(config.lookbackStart())
        << " - " << formatDate(config.lookbackEnd()) << std::endl;
    out << "  Average Price:         $" << formatFixed(config.averagePrice(), 2) << std::endl;

    out << "  Corrective Dates:      ";
    for (std::size_t i = 0; i < config.correctiveDates().size(); ++i) {
        out << (i ? ", " : "") << formatDate(config.correctiveDates()[i]);
    }
    out << std::endl << std::endl;

    if (const auto* matrix = config.declineMatrix()) {
        out << "Time Groups:" << std::endl;
        for (const auto& group : matrix->groups()) {
            out << "  [" << group.index << "] " << std::left << std::setw(28) << group.name
                << std::right << formatDateTime(group.start) << " - "
                << formatDateTime(group.end) << std::endl;
        }
        out << std::endl << "Decline Matrix (purchase group x sale group):" << std::endl;
        for (const auto& row : matrix->table()) {
            out << " ";
            for (double value : row) {
                out << std::setw(8) << formatFixed(value, 2);
            }
            out << std::endl;
        }
        out << std::endl;
    }

    if (const auto* schedule = config.inflationSchedule()) {
        out << "Inflation Schedule:" << std::endl;
        for (const auto& period : schedule->periods()) {
            out << "  " << formatDate(period.start) << " - " << formatDate(period.end)
                << "  $" << std::setw(6) << formatFixed(period.inflation, 2)
                << (period.saleOnly ? "  (sales only)" : "")
                << "  " << period.label << std::endl;
        }
        out << std::endl;
    }

    out << std::string(70, '=') << std::endl << std::endl;
}

Result ReportWriter::writeFile(std::string_view filePath, std::string_view content) const
{
    std::ofstream file{std::string(filePath)};
    if (!file.is_open()) {
        return std::unexpected("Failed to open output file: " + std::string(filePath));
    }

    file << content;
    if (!file) {
        return std::unexpected("Failed to write output file: " + std::string(filePath));
    }

    return Result{};
}

}  // namespace settlement
