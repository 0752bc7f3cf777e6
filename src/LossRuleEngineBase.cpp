#include "LossRuleEngineBase.hpp"
#include "DateUtils.hpp"
#include <algorithm>

namespace settlement {

LossRuleEngineBase::LossRuleEngineBase(ConfigurationPtr configuration)
    : configuration_(std::move(configuration))
{
}

RuleEvaluation LossRuleEngineBase::makeEvaluation(
    RuleCode code,
    double recognizedLossPerShare,
    Details details) const
{
    RuleEvaluation evaluation;
    evaluation.recognizedLossPerShare = roundTo(recognizedLossPerShare, 4);
    evaluation.ruleCode = code;
    evaluation.ruleLabel = ruleLabel(code);
    evaluation.details = std::move(details);
    return evaluation;
}

RuleEvaluation LossRuleEngineBase::evaluate(
    const TimePoint& purchaseDate,
    double purchasePrice,
    const std::optional<SaleEvent>& sale) const
{
    const auto& config = *configuration_;

    // ════════════════════════════════════════════════════════════════════════
    // Покупка вне классового периода - независимо от продажи
    // ════════════════════════════════════════════════════════════════════════

    if (!config.isWithinClassPeriod(purchaseDate)) {
        return makeEvaluation(RuleCode::OutsidePeriod, 0.0, {});
    }

    Details details;

    // ════════════════════════════════════════════════════════════════════════
    // D: бумаги не проданы
    // ════════════════════════════════════════════════════════════════════════

    if (!sale) {
        double cap = heldCap(purchaseDate, details);
        double heldLoss = std::max(0.0, purchasePrice - config.averagePrice());

        details["held_loss"] = heldLoss;
        details["average_price"] = config.averagePrice();

        return makeEvaluation(RuleCode::D, std::min(cap, heldLoss), std::move(details));
    }

    const auto saleDay = normalizeDate(sale->date);

    // ════════════════════════════════════════════════════════════════════════
    // A: продажа до первого корректирующего раскрытия
    // ════════════════════════════════════════════════════════════════════════

    if (saleDay < config.firstCorrectiveDate()) {
        details["first_corrective_date"] = formatDate(config.firstCorrectiveDate());
        return makeEvaluation(RuleCode::A, 0.0, std::move(details));
    }

    double cap = saleCap(purchaseDate, *sale, details);
    double actualLoss = std::max(0.0, purchasePrice - sale->price);
    details["actual_loss"] = actualLoss;

    // ════════════════════════════════════════════════════════════════════════
    // B: продажа до начала lookback-периода
    // ════════════════════════════════════════════════════════════════════════

    if (saleDay < config.lookbackStart()) {
        return makeEvaluation(RuleCode::B, std::min(cap, actualLoss), std::move(details));
    }

    // ════════════════════════════════════════════════════════════════════════
    // C: продажа внутри lookback-периода - третье ограничение
    // ════════════════════════════════════════════════════════════════════════

    if (config.isWithinLookbackPeriod(saleDay)) {
        double averageClosing = config.averageClosingPrice(saleDay);
        double lookbackLoss = std::max(0.0, purchasePrice - averageClosing);

        details["lookback_loss"] = lookbackLoss;
        details["avg_closing_price"] = averageClosing;

        return makeEvaluation(RuleCode::C,
                              std::min({cap, actualLoss, lookbackLoss}),
                              std::move(details));
    }

    // ════════════════════════════════════════════════════════════════════════
    // Продажа после lookback-периода
    // ════════════════════════════════════════════════════════════════════════

    return makeEvaluation(RuleCode::PostLookback, std::min(cap, actualLoss), std::move(details));
}

}  // namespace settlement
