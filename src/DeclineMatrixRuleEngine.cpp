#include "DeclineMatrixRuleEngine.hpp"

namespace settlement {

DeclineMatrixRuleEngine::DeclineMatrixRuleEngine(ConfigurationPtr configuration)
    : LossRuleEngineBase(std::move(configuration))
{
}

void DeclineMatrixRuleEngine::addGroupDetails(
    const TimePoint& purchaseDate,
    std::optional<std::size_t> saleGroup,
    Details& details) const
{
    const auto* matrix = configuration_->declineMatrix();
    if (!matrix) {
        return;
    }

    if (auto purchaseGroup = matrix->groupIndex(purchaseDate)) {
        details["purchase_group"] = matrix->groups()[*purchaseGroup].name;
    }

    if (saleGroup) {
        details["sale_group"] = matrix->groups()[*saleGroup].name;
    }
}

double DeclineMatrixRuleEngine::heldCap(
    const TimePoint& purchaseDate,
    Details& details) const
{
    const auto lookbackStart = configuration_->lookbackStart();
    double decline = configuration_->decline(purchaseDate, lookbackStart);

    std::optional<std::size_t> saleGroup;
    if (const auto* matrix = configuration_->declineMatrix()) {
        saleGroup = matrix->groupIndex(lookbackStart);
    }
    addGroupDetails(purchaseDate, saleGroup, details);

    details["decline_amount"] = decline;
    return decline;
}

double DeclineMatrixRuleEngine::saleCap(
    const TimePoint& purchaseDate,
    const SaleEvent& sale,
    Details& details) const
{
    double decline = configuration_->decline(purchaseDate, sale.date, sale.price);

    std::optional<std::size_t> saleGroup;
    if (const auto* matrix = configuration_->declineMatrix()) {
        saleGroup = matrix->saleGroupIndex(sale.date, sale.price);
    }
    addGroupDetails(purchaseDate, saleGroup, details);

    details["decline_amount"] = decline;
    return decline;
}

std::string DeclineMatrixRuleEngine::ruleLabel(RuleCode code) const
{
    switch (code) {
        case RuleCode::OutsidePeriod:
            return "Purchase outside class period";
        case RuleCode::A:
            return "Rule (a): Sold before first corrective disclosure";
        case RuleCode::B:
            return "Rule (b): Sold during class period after corrective disclosure";
        case RuleCode::C:
            return "Rule (c): Sold during lookback period";
        case RuleCode::D:
            return "Rule (d): Held shares";
        case RuleCode::PostLookback:
            return "Sold after lookback period";
    }
    return "Unknown rule";
}

}  // namespace settlement
