#include "RuleEngineFactory.hpp"
#include "DeclineMatrixRuleEngine.hpp"
#include "InflationScheduleRuleEngine.hpp"

namespace settlement {

std::expected<std::unique_ptr<ILossRuleEngine>, std::string> createRuleEngine(
    ConfigurationPtr configuration)
{
    if (!configuration) {
        return std::unexpected("Settlement configuration is null");
    }

    switch (configuration->method()) {
        case LossMethod::DeclineMatrix:
            if (!configuration->declineMatrix()) {
                return std::unexpected("Decline matrix is not configured");
            }
            return std::make_unique<DeclineMatrixRuleEngine>(std::move(configuration));

        case LossMethod::InflationSchedule:
            if (!configuration->inflationSchedule()) {
                return std::unexpected("Inflation schedule is not configured");
            }
            return std::make_unique<InflationScheduleRuleEngine>(std::move(configuration));
    }

    return std::unexpected("Unsupported loss method");
}

}  // namespace settlement
