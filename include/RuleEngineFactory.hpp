#pragma once

#include "ILossRuleEngine.hpp"
#include <memory>
#include <expected>
#include <string>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Rule Engine Factory
// ═══════════════════════════════════════════════════════════════════════════════

// Стратегия выбирается один раз по методу конфигурации
std::expected<std::unique_ptr<ILossRuleEngine>, std::string> createRuleEngine(
    ConfigurationPtr configuration);

}  // namespace settlement
