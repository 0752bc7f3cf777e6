#include "SettlementCalculator.hpp"
#include "RuleEngineFactory.hpp"
#include "HeldPositionEvaluator.hpp"
#include <exception>
#include <iterator>
#include <iostream>

namespace settlement {

std::expected<std::unique_ptr<SettlementCalculator>, std::string> SettlementCalculator::create(
    std::string_view selector)
{
    auto configResult = SettlementConfiguration::create(selector);
    if (!configResult) {
        return std::unexpected(configResult.error());
    }

    return create(std::move(*configResult));
}

std::expected<std::unique_ptr<SettlementCalculator>, std::string> SettlementCalculator::create(
    ConfigurationPtr configuration)
{
    if (!configuration) {
        return std::unexpected("Settlement configuration is not set");
    }

    auto engineResult = createRuleEngine(configuration);
    if (!engineResult) {
        return std::unexpected(engineResult.error());
    }

    return std::make_unique<SettlementCalculator>(
        std::move(configuration), std::move(*engineResult));
}

SettlementCalculator::SettlementCalculator(
    ConfigurationPtr configuration,
    std::unique_ptr<ILossRuleEngine> engine)
    : configuration_(std::move(configuration)),
      engine_(std::move(engine))
{
}

CalculationResult SettlementCalculator::calculate(
    const std::vector<Transaction>& transactions) const
{
    try {
        return runCalculation(transactions);
    } catch (const std::exception& e) {
        CalculationResult failed;
        failed.success = false;
        failed.settlementType = configuration_->type();
        failed.message = std::string("Calculation failed: ") + e.what();
        std::cerr << failed.message << std::endl;
        return failed;
    }
}

CalculationResult SettlementCalculator::runCalculation(
    const std::vector<Transaction>& transactions) const
{
    CalculationResult result;
    result.settlementType = configuration_->type();

    if (transactions.empty()) {
        result.success = true;
        result.message = "No transactions to process";
        return result;
    }

    std::vector<Transaction> purchases;
    std::vector<Transaction> sales;

    for (const auto& txn : transactions) {
        if (txn.type == TransactionType::Sale) {
            sales.push_back(txn);
        } else {
            purchases.push_back(txn);
        }
    }

    std::cerr << "\n" << std::string(70, '=') << std::endl;
    std::cerr << "Calculating recognized loss: " << toString(configuration_->type())
              << " (" << engine_->getName() << ")" << std::endl;
    std::cerr << std::string(70, '=') << std::endl;
    std::cerr << "Purchases: " << purchases.size()
              << ", Sales: " << sales.size() << std::endl;

    // ════════════════════════════════════════════════════════════════════════
    // 1. FIFO-сопоставление продаж
    // ════════════════════════════════════════════════════════════════════════

    FifoLotMatcher matcher(*engine_);
    auto outcome = matcher.match(purchases, std::move(sales));

    // ════════════════════════════════════════════════════════════════════════
    // 2. Оценка остатков
    // ════════════════════════════════════════════════════════════════════════

    HeldPositionEvaluator heldEvaluator(*engine_);
    auto heldLosses = heldEvaluator.evaluateHeld(outcome.inventory);

    result.matches = std::move(outcome.matches);
    result.matches.insert(result.matches.end(),
                          std::make_move_iterator(heldLosses.begin()),
                          std::make_move_iterator(heldLosses.end()));

    // ════════════════════════════════════════════════════════════════════════
    // 3. Сводка
    // ════════════════════════════════════════════════════════════════════════

    AggregationReporter reporter;
    result.summary = reporter.summarize(result.matches);
    result.allocations = std::move(outcome.allocations);
    result.anomalies = std::move(outcome.anomalies);
    result.saleFills = std::move(outcome.saleFills);
    result.success = true;
    result.message = "Processed " + std::to_string(transactions.size()) + " transactions";

    std::cerr << "Matches with recognized loss: " << result.summary.matchCount << std::endl;
    std::cerr << "Total recognized loss: $" << result.summary.totalRecognizedLoss << std::endl;

    if (!result.anomalies.empty()) {
        std::cerr << "⚠ Warning: " << result.anomalies.size()
                  << " data anomalies recorded" << std::endl;
    }

    return result;
}

SingleEvaluation SettlementCalculator::evaluateSingle(
    const TimePoint& purchaseDate,
    double purchasePrice,
    const std::optional<SaleEvent>& sale,
    double quantity,
    bool isBeginningHoldings) const
{
    TimePoint valuationDate = isBeginningHoldings ? configuration_->classStart() : purchaseDate;
    double valuationPrice = isBeginningHoldings ? 0.0 : purchasePrice;

    auto evaluation = engine_->evaluate(valuationDate, valuationPrice, sale);

    SingleEvaluation single;
    single.recognizedLossPerShare = evaluation.recognizedLossPerShare;
    single.quantity = quantity;
    single.totalRecognizedLoss = roundTo(evaluation.recognizedLossPerShare * quantity, 2);
    single.ruleCode = evaluation.ruleCode;
    single.ruleLabel = std::move(evaluation.ruleLabel);
    single.details = std::move(evaluation.details);
    return single;
}

}  // namespace settlement
