#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <chrono>
#include <expected>
#include <cstdint>

namespace settlement {

using TimePoint = std::chrono::system_clock::time_point;
using DetailValue = std::variant<double, std::string>;
using Details = std::map<std::string, DetailValue>;
using Result = std::expected<void, std::string>;

// Допуск при сравнении количеств (дробные акции)
inline constexpr double kQuantityTolerance = 1e-9;

// ═══════════════════════════════════════════════════════════════════════════════
// Тип операции
// ═══════════════════════════════════════════════════════════════════════════════

enum class TransactionType {
    Purchase,
    Sale,
    BeginningHoldings   // Остаток на начало классового периода
};

std::string_view toString(TransactionType type) noexcept;

// ═══════════════════════════════════════════════════════════════════════════════
// Сделка (неизменяемая запись)
// ═══════════════════════════════════════════════════════════════════════════════

// Остаток по лоту хранится отдельно, в InventoryLedger
struct Transaction {
    std::string id;
    TimePoint date;
    double quantity = 0.0;
    double price = 0.0;
    TransactionType type = TransactionType::Purchase;
    std::string entity;
    std::string fundName;
    std::string securityId;
    std::string comment;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Коды правил
// ═══════════════════════════════════════════════════════════════════════════════

enum class RuleCode {
    OutsidePeriod,   // Покупка вне классового периода
    A,               // Продажа до первого корректирующего раскрытия
    B,               // Продажа до начала lookback-периода
    C,               // Продажа внутри lookback-периода
    D,               // Бумаги удерживаются
    PostLookback     // Продажа после lookback-периода
};

std::string_view toString(RuleCode code) noexcept;

// ═══════════════════════════════════════════════════════════════════════════════
// Продажа, передаваемая в движок правил
// ═══════════════════════════════════════════════════════════════════════════════

struct SaleEvent {
    TimePoint date;
    double price = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результат оценки правила (на одну акцию)
// ═══════════════════════════════════════════════════════════════════════════════

struct RuleEvaluation {
    double recognizedLossPerShare = 0.0;
    RuleCode ruleCode = RuleCode::OutsidePeriod;
    std::string ruleLabel;
    Details details;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результат сопоставления (или удерживаемая позиция)
// ═══════════════════════════════════════════════════════════════════════════════

struct MatchResult {
    std::string matchId;
    std::string purchaseId;
    std::optional<std::string> saleId;   // Пусто для удерживаемых позиций
    double quantity = 0.0;
    double recognizedLoss = 0.0;
    RuleCode ruleCode = RuleCode::OutsidePeriod;
    std::string ruleApplied;

    // Дата и цена оценки (для остатков на начало - начало периода и 0)
    TimePoint purchaseDate;
    double purchasePrice = 0.0;
    std::optional<TimePoint> saleDate;
    std::optional<double> salePrice;

    std::string entity;
    std::string fundName;
    Details details;

    bool isHeld() const noexcept { return !saleId.has_value(); }

    double lossPerShare() const noexcept {
        return quantity > 0.0 ? recognizedLoss / quantity : 0.0;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Аудит: каждое списание количества с лота, включая нулевой убыток
// ═══════════════════════════════════════════════════════════════════════════════

struct LotAllocation {
    std::string purchaseId;
    std::string saleId;
    double quantity = 0.0;
    double recognizedLoss = 0.0;
    RuleCode ruleCode = RuleCode::OutsidePeriod;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Нарушение целостности данных (лот датирован позже продажи)
// ═══════════════════════════════════════════════════════════════════════════════

struct MatchAnomaly {
    std::string purchaseId;
    std::string saleId;
    TimePoint purchaseDate;
    TimePoint saleDate;
    std::string reason;
};

// Округление денежных величин
double roundTo(double value, int decimals) noexcept;

// Количество бумаг без экспоненты: до 4 знаков, без хвостовых нулей
std::string formatQuantity(double quantity);

}  // namespace settlement
