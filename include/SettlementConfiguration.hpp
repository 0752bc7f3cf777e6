#pragma once

#include "SettlementTypes.hpp"
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Тип соглашения и метод расчёта
// ═══════════════════════════════════════════════════════════════════════════════

enum class SettlementType {
    Twitter,      // Матрица снижения цены (метод A)
    KraftHeinz    // График искусственной инфляции (метод B)
};

enum class LossMethod {
    DeclineMatrix,
    InflationSchedule
};

std::string_view toString(SettlementType type) noexcept;
std::string_view toString(LossMethod method) noexcept;

// Селектор без учёта регистра: "TWITTER", "KRAFT_HEINZ"
std::expected<SettlementType, std::string> parseSettlementType(std::string_view selector);

// ═══════════════════════════════════════════════════════════════════════════════
// Метод A: временные группы и матрица снижения
// ═══════════════════════════════════════════════════════════════════════════════

// Границы группы включительные, с точностью до секунды
struct TimeGroup {
    std::string name;
    TimePoint start;
    TimePoint end;
    std::size_t index = 0;

    bool contains(const TimePoint& date) const noexcept {
        return start <= date && date <= end;
    }
};

class DeclineMatrix {
public:
    static constexpr std::size_t kGroupCount = 6;
    using Table = std::array<std::array<double, kGroupCount>, kGroupCount>;

    // Проверяет покрытие таблицей всех групп и непрерывность групп
    static std::expected<DeclineMatrix, std::string> create(
        std::vector<TimeGroup> groups,
        const Table& table,
        const TimePoint& disclosureTime,
        double priceThreshold);

    // Группа по дате (без особых правил дня раскрытия)
    std::optional<std::size_t> groupIndex(const TimePoint& date) const noexcept;

    // Группа для даты продажи.
    // В день раскрытия: время сделки сравнивается со временем раскрытия;
    // без времени - цена >= порога означает продажу до раскрытия;
    // без времени и цены - продажа считается после раскрытия.
    std::optional<std::size_t> saleGroupIndex(
        const TimePoint& saleDate,
        std::optional<double> salePriceHint) const noexcept;

    // Снижение на акцию для пары (группа покупки, группа продажи); 0 вне таблицы
    double decline(
        const TimePoint& purchaseDate,
        const TimePoint& saleDate,
        std::optional<double> salePriceHint = std::nullopt) const noexcept;

    double declineForGroups(std::size_t purchaseGroup, std::size_t saleGroup) const noexcept;

    const std::vector<TimeGroup>& groups() const noexcept { return groups_; }
    const Table& table() const noexcept { return table_; }
    TimePoint disclosureTime() const noexcept { return disclosureTime_; }
    double priceThreshold() const noexcept { return priceThreshold_; }

private:
    DeclineMatrix(std::vector<TimeGroup> groups,
                  const Table& table,
                  TimePoint disclosureTime,
                  double priceThreshold);

    std::vector<TimeGroup> groups_;
    Table table_{};
    TimePoint disclosureTime_;
    double priceThreshold_ = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Метод B: график искусственной инфляции
// ═══════════════════════════════════════════════════════════════════════════════

// Границы периода - календарные дни, включительно
struct InflationPeriod {
    TimePoint start;
    TimePoint end;
    double inflation = 0.0;
    std::string label;
    bool saleOnly = false;   // Применяется только к дате продажи

    bool contains(const TimePoint& date) const noexcept;
};

class InflationSchedule {
public:
    static std::expected<InflationSchedule, std::string> create(
        std::vector<InflationPeriod> periods);

    // Инфляция на дату; период "только для продаж" пропускается для покупок.
    // 0, если дата вне графика.
    double inflation(const TimePoint& date, bool isSale) const noexcept;

    const std::vector<InflationPeriod>& periods() const noexcept { return periods_; }

private:
    explicit InflationSchedule(std::vector<InflationPeriod> periods);

    std::vector<InflationPeriod> periods_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Settlement Configuration - неизменяемые параметры соглашения
// ═══════════════════════════════════════════════════════════════════════════════

class SettlementConfiguration {
public:
    // Все даты периодов - календарные дни (полночь UTC), границы включительные
    struct Periods {
        TimePoint classStart;
        TimePoint classEnd;
        TimePoint lookbackStart;
        TimePoint lookbackEnd;
        std::vector<TimePoint> correctiveDates;   // Первая - начало правила A
        double averagePrice = 0.0;                // Средняя цена за lookback
    };

    SettlementConfiguration(SettlementType type,
                            Periods periods,
                            std::map<TimePoint, double> averageClosingPrices,
                            std::optional<DeclineMatrix> declineMatrix,
                            std::optional<InflationSchedule> inflationSchedule);

    static std::expected<std::shared_ptr<const SettlementConfiguration>, std::string>
    create(SettlementType type);

    static std::expected<std::shared_ptr<const SettlementConfiguration>, std::string>
    create(std::string_view selector);

    // Сборка из готовых частей (ровно одна из таблиц должна быть задана)
    static std::expected<std::shared_ptr<const SettlementConfiguration>, std::string>
    assemble(SettlementType type,
             Periods periods,
             std::map<TimePoint, double> averageClosingPrices,
             std::optional<DeclineMatrix> declineMatrix,
             std::optional<InflationSchedule> inflationSchedule);

    SettlementType type() const noexcept { return type_; }
    LossMethod method() const noexcept;

    TimePoint classStart() const noexcept { return periods_.classStart; }
    TimePoint classEnd() const noexcept { return periods_.classEnd; }
    TimePoint lookbackStart() const noexcept { return periods_.lookbackStart; }
    TimePoint lookbackEnd() const noexcept { return periods_.lookbackEnd; }
    TimePoint firstCorrectiveDate() const noexcept { return periods_.correctiveDates.front(); }
    const std::vector<TimePoint>& correctiveDates() const noexcept {
        return periods_.correctiveDates;
    }
    double averagePrice() const noexcept { return periods_.averagePrice; }

    bool isWithinClassPeriod(const TimePoint& date) const noexcept;
    bool isWithinLookbackPeriod(const TimePoint& date) const noexcept;

    // Средняя цена закрытия на дату; при отсутствии - средняя за lookback
    double averageClosingPrice(const TimePoint& date) const noexcept;

    const std::map<TimePoint, double>& averageClosingPrices() const noexcept {
        return averageClosingPrices_;
    }

    // Метод A; 0 для конфигураций метода B
    double decline(const TimePoint& purchaseDate,
                   const TimePoint& saleDate,
                   std::optional<double> salePriceHint = std::nullopt) const noexcept;

    // Метод B; 0 для конфигураций метода A
    double inflation(const TimePoint& date, bool isSale) const noexcept;

    const DeclineMatrix* declineMatrix() const noexcept {
        return declineMatrix_ ? &*declineMatrix_ : nullptr;
    }

    const InflationSchedule* inflationSchedule() const noexcept {
        return inflationSchedule_ ? &*inflationSchedule_ : nullptr;
    }

    SettlementConfiguration(const SettlementConfiguration&) = delete;
    SettlementConfiguration& operator=(const SettlementConfiguration&) = delete;

private:
    SettlementType type_;
    Periods periods_;
    std::map<TimePoint, double> averageClosingPrices_;   // День -> средняя цена
    std::optional<DeclineMatrix> declineMatrix_;
    std::optional<InflationSchedule> inflationSchedule_;
};

using ConfigurationPtr = std::shared_ptr<const SettlementConfiguration>;

}  // namespace settlement
