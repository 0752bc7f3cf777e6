#include "SettlementTypes.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace settlement {

std::string_view toString(TransactionType type) noexcept
{
    switch (type) {
        case TransactionType::Purchase:
            return "PURCHASE";
        case TransactionType::Sale:
            return "SALE";
        case TransactionType::BeginningHoldings:
            return "BEGINNING_HOLDINGS";
    }
    return "UNKNOWN";
}

std::string_view toString(RuleCode code) noexcept
{
    switch (code) {
        case RuleCode::OutsidePeriod:
            return "OUTSIDE_PERIOD";
        case RuleCode::A:
            return "A";
        case RuleCode::B:
            return "B";
        case RuleCode::C:
            return "C";
        case RuleCode::D:
            return "D";
        case RuleCode::PostLookback:
            return "POST_LOOKBACK";
    }
    return "UNKNOWN";
}

double roundTo(double value, int decimals) noexcept
{
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string formatQuantity(double quantity)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << quantity;
    std::string text = oss.str();

    auto dot = text.find('.');
    if (dot != std::string::npos) {
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
    }

    // -0.0000 после округления
    if (text == "-0") {
        text = "0";
    }
    return text;
}

}  // namespace settlement
