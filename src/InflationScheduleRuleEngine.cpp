#include "InflationScheduleRuleEngine.hpp"
#include <algorithm>

namespace settlement {

InflationScheduleRuleEngine::InflationScheduleRuleEngine(ConfigurationPtr configuration)
    : LossRuleEngineBase(std::move(configuration))
{
}

double InflationScheduleRuleEngine::heldCap(
    const TimePoint& purchaseDate,
    Details& details) const
{
    double purchaseInflation = configuration_->inflation(purchaseDate, false);
    details["purchase_inflation"] = purchaseInflation;
    return purchaseInflation;
}

double InflationScheduleRuleEngine::saleCap(
    const TimePoint& purchaseDate,
    const SaleEvent& sale,
    Details& details) const
{
    double purchaseInflation = configuration_->inflation(purchaseDate, false);
    double saleInflation = configuration_->inflation(sale.date, true);
    double inflationDecline = std::max(0.0, purchaseInflation - saleInflation);

    details["purchase_inflation"] = purchaseInflation;
    details["sale_inflation"] = saleInflation;
    details["inflation_decline"] = inflationDecline;

    return inflationDecline;
}

std::string InflationScheduleRuleEngine::ruleLabel(RuleCode code) const
{
    switch (code) {
        case RuleCode::OutsidePeriod:
            return "Purchase outside class period";
        case RuleCode::A:
            return "Rule A: Sold before first corrective disclosure";
        case RuleCode::B:
            return "Rule B: Sold during class period after corrective disclosure";
        case RuleCode::C:
            return "Rule C: Sold during lookback period";
        case RuleCode::D:
            return "Rule D: Held shares";
        case RuleCode::PostLookback:
            return "Sold after lookback period";
    }
    return "Unknown rule";
}

}  // namespace settlement
